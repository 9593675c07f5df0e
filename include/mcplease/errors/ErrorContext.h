//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorContext.h
// Purpose: Structured record of one handled failure, including what recovery did
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {
namespace errors {

//==========================================================================================================
// RecoveryDetails
// Purpose: Flags written by recovery strategies and read by callers deciding how to proceed.
//==========================================================================================================
struct RecoveryDetails {
    bool useFallback{false};
    int retryCount{0};
    bool localOnly{false};
    bool resourcesCleaned{false};
    bool historyTrimmed{false};
    bool reducedLimits{false};
    bool memoryEfficientMode{false};
    std::vector<std::string> degradationApplied;
    bool useDefaults{false};
    bool configReloaded{false};
};

//==========================================================================================================
// ErrorContext
// Purpose: One handled failure.
// Fields:
//   code: Deterministic "{CAT}-{KIND}-{NNNN}" code.
//   attributes: Caller supplied context (tool name, method, ...).
//   recoveryAttempted/recoverySuccessful: Outcome of the category's recovery chain.
//==========================================================================================================
struct ErrorContext {
    std::chrono::system_clock::time_point timestamp;
    ErrorSeverity severity{ErrorSeverity::Medium};
    ErrorCategory category{ErrorCategory::System};
    std::string code;
    std::string kind;
    std::string message;
    RecoveryDetails recovery;
    std::unordered_map<std::string, std::string> attributes;
    std::optional<std::string> trace;
    std::optional<std::string> userId;
    std::optional<std::string> sessionId;
    std::optional<std::string> requestId;
    bool recoveryAttempted{false};
    bool recoverySuccessful{false};

    JSONValue ToJSON() const;
};

} // namespace errors
} // namespace mcplease
