//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Initial level honours MCPLEASE_LOG_LEVEL so tests and tools can raise verbosity without code changes.
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCPLEASE_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
