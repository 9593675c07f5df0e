//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Wire names for error categories and severities
//==========================================================================================================

#include "mcplease/errors/Errors.h"

namespace mcplease {
namespace errors {

const char* ToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::AIModel: return "ai_model";
        case ErrorCategory::Security: return "security";
        case ErrorCategory::Network: return "network";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::System: return "system";
        case ErrorCategory::UserInput: return "user_input";
        case ErrorCategory::External: return "external";
    }
    return "system";
}

const char* ToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Low: return "low";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::High: return "high";
        case ErrorSeverity::Critical: return "critical";
    }
    return "medium";
}

} // namespace errors
} // namespace mcplease
