//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorController.h
// Purpose: Failure classification, recovery chains, error statistics and degradation levels
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/errors/ErrorContext.h"
#include "mcplease/errors/Errors.h"
#include "mcplease/errors/RecoveryStrategy.h"

namespace mcplease {
namespace errors {

//==========================================================================================================
// DegradationConfig
// Purpose: Caps and feature switches callers apply at a degradation level.
//==========================================================================================================
struct DegradationConfig {
    int level{0};
    bool enabled{false};
    std::size_t maxContextSize{4000};
    std::size_t maxConcurrentRequests{4};
    bool useFallbackResponses{false};
    bool disableAIFeatures{false};
    bool reduceLogging{false};

    JSONValue ToJSON() const;
};

struct DegradationState {
    int level{0};
    bool highErrorRate{false};
    bool memoryPressure{false};
    bool degradedMode{false};
};

//==========================================================================================================
// ErrorStatistics
// Purpose: Snapshot returned by ErrorController::GetStatistics.
//==========================================================================================================
struct ErrorStatistics {
    struct RecentError {
        std::string code;
        ErrorCategory category{ErrorCategory::System};
        ErrorSeverity severity{ErrorSeverity::Medium};
        std::chrono::system_clock::time_point timestamp;
    };

    std::size_t totalErrors{0};
    std::map<std::string, std::size_t> categoryCounts;
    std::map<std::string, std::size_t> severityCounts;
    std::vector<RecentError> recentErrors;
    std::vector<std::pair<std::string, std::size_t>> mostFrequent;
    std::size_t recoveryAttempted{0};
    std::size_t recoverySuccessful{0};
    double errorRatePerMinute{0.0};
    std::size_t recentResourceErrors{0};
    DegradationState degradation;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// HandleRequest
// Purpose: Correlation data and options for ErrorController::Handle.
// Fields:
//   priorRetries: Seeds RecoveryDetails::retryCount when the caller already retried.
//==========================================================================================================
struct HandleRequest {
    std::unordered_map<std::string, std::string> attributes;
    std::optional<std::string> userId;
    std::optional<std::string> sessionId;
    std::optional<std::string> requestId;
    std::optional<std::string> trace;
    int priorRetries{0};
    bool attemptRecovery{true};
};

//==========================================================================================================
// ErrorController
// Purpose: Single place every pipeline failure goes through.
// Notes:
//   - Handle never throws for the failure it is given; strategy exceptions are logged and count as failure.
//   - The degradation level is derived from the trailing hour of history whenever it is asked for.
//   - No lock is held while recovery strategies run.
//==========================================================================================================
class ErrorController {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::size_t maxHistory{1000};
        std::chrono::milliseconds retryBackoffBase{1000};
        // Upper bound on any single backoff wait; follows the per-call tool timeout
        std::chrono::milliseconds maxRecoveryWait{30000};
        // Caps at level 0
        std::size_t normalContextSize{4000};
        std::size_t normalConcurrency{4};
        std::function<bool()> modelRestartHook;
        std::function<bool()> configReloadHook;
        TimeSource now;
    };

    ErrorController();
    explicit ErrorController(Options opts);
    ~ErrorController();

    ErrorController(const ErrorController&) = delete;
    ErrorController& operator=(const ErrorController&) = delete;

    /////////////////////////////////////////// Classification ///////////////////////////////////////////
    static ErrorCategory Categorize(const std::exception& error);
    static ErrorSeverity DetermineSeverity(const std::exception& error, ErrorCategory category);
    // Short type name ("TimeoutError", "bad_alloc", ...).
    static std::string KindOf(const std::exception& error);
    //==========================================================================================================
    // GenerateCode
    // Purpose: "{CAT}-{KIND}-{NNNN}" where NNNN is derived from SHA-256 of the message.
    // Returns:
    //   The same code for the same category, kind and message in every process.
    //==========================================================================================================
    static std::string GenerateCode(ErrorCategory category, const std::exception& error);

    //==========================================================================================================
    // Handle
    // Purpose: Classify, log, count, optionally recover, and record a failure.
    // Args:
    //   error: The failure.
    //   request: Correlation ids, free-form attributes and the recovery switch.
    // Returns:
    //   The recorded ErrorContext.
    //==========================================================================================================
    ErrorContext Handle(const std::exception& error, const HandleRequest& request = {});

    // Replaces the recovery chain for a category.
    void SetRecoveryChain(ErrorCategory category, std::vector<std::unique_ptr<IRecoveryStrategy>> chain);

    ErrorStatistics GetStatistics() const;
    int DegradationLevel() const;
    DegradationConfig GetDegradationConfig() const;
    DegradationConfig DegradationConfigForLevel(int level) const;
    bool ShouldApplyGracefulDegradation() const;

    void ClearHistory();
    std::vector<ErrorContext> History() const;

    // Interrupts backoff waits; called on shutdown.
    void Shutdown();

private:
    std::chrono::system_clock::time_point now() const;
    void logContext(const ErrorContext& ctx) const;
    bool runRecovery(const std::exception& error, ErrorContext& ctx);
    std::size_t reclaimHistory();
    DegradationState computeDegradationLocked(std::chrono::system_clock::time_point t,
                                              double* ratePerMinute,
                                              std::size_t* resourceErrors) const;

    Options options;
    std::stop_source stopSource;

    mutable std::mutex chainMutex;
    std::unordered_map<ErrorCategory, std::vector<std::shared_ptr<IRecoveryStrategy>>> chains;

    mutable std::mutex historyMutex;
    std::deque<ErrorContext> history;
    std::unordered_map<std::string, std::size_t> codeCounts;
    std::size_t recoveryAttempted{0};
    std::size_t recoverySuccessful{0};
    mutable std::atomic<int> lastLevel{0};
};

} // namespace errors
} // namespace mcplease
