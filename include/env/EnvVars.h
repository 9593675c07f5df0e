//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPLEASE_* environment variables with defaults and light type conversion.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return defaultValue;
    }
    return std::string(raw);
}

// True for "1", "true", "yes", "on" (case-sensitive lower/upper forms).
inline bool IsTruthy(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "YES" || v == "on" || v == "ON";
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean environment variable.
// Args:
//   name: Variable name.
//   defaultValue: Returned when the variable is unset or empty.
// Returns:
//   true when the value is truthy (see IsTruthy), false otherwise.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return IsTruthy(v);
}

//==========================================================================================================
// SplitList
// Purpose: Splits a comma separated value into trimmed, non-empty items.
//==========================================================================================================
inline std::vector<std::string> SplitList(const std::string& csv) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= csv.size()) {
        std::size_t comma = csv.find(',', start);
        std::string item = (comma == std::string::npos) ? csv.substr(start) : csv.substr(start, comma - start);
        const auto first = item.find_first_not_of(" \t");
        const auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            out.push_back(item.substr(first, last - first + 1));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}
