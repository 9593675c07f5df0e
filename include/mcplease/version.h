//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcplease (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcplease {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"; reported as serverInfo.version.
//==========================================================================================================
std::string getVersionString();

} // namespace mcplease
