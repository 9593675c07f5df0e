//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers for mcplease.
//==========================================================================================================
#include "mcplease/version.h"

#include <format>

namespace mcplease {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcplease
