//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RecoveryStrategy.cpp
// Purpose: Built-in recovery strategies
//==========================================================================================================

#include "mcplease/errors/RecoveryStrategy.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "logging/Logger.h"

namespace mcplease {
namespace errors {

bool ModelFallbackStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    ctx.recovery.useFallback = true;
    return true;
}

bool ModelRestartStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    if (!restartHook) {
        return false;
    }
    LOG_INFO("Restarting model adapter after {}", ctx.code);
    return restartHook();
}

bool NetworkRetryStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    if (ctx.recovery.retryCount >= kMaxRetries) {
        return false;
    }
    const auto delay = std::min(backoffBase * (1 << ctx.recovery.retryCount), maxWait);
    ctx.recovery.retryCount += 1;
    if (delay.count() > 0) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, stop, delay, [] { return false; });
    }
    return !stop.stop_requested();
}

bool LocalOnlyFallbackStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    ctx.recovery.localOnly = true;
    return true;
}

bool ResourceCleanupStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    std::size_t dropped = 0;
    if (reclaim) {
        dropped = reclaim();
    }
    ctx.recovery.resourcesCleaned = true;
    ctx.recovery.historyTrimmed = dropped > 0;
    if (dropped > 0) {
        LOG_INFO("Resource cleanup dropped {} error history entries", dropped);
    }
    return true;
}

bool ResourceLimitStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    ctx.recovery.reducedLimits = true;
    ctx.recovery.memoryEfficientMode = true;
    ctx.recovery.degradationApplied = {"context_size", "concurrency", "precision"};
    return true;
}

bool ConfigDefaultsStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    ctx.recovery.useDefaults = true;
    return true;
}

bool ConfigReloadStrategy::Attempt(const std::exception&, ErrorContext& ctx) {
    if (!reloadHook || !reloadHook()) {
        return false;
    }
    ctx.recovery.configReloaded = true;
    return true;
}

} // namespace errors
} // namespace mcplease
