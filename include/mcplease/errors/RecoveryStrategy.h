//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RecoveryStrategy.h
// Purpose: Per-category recovery steps run by the ErrorController
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <stop_token>
#include <string>

#include "mcplease/errors/ErrorContext.h"

namespace mcplease {
namespace errors {

//==========================================================================================================
// IRecoveryStrategy
// Purpose: One step in a category's recovery chain.
// Notes:
//   - Attempt returns true when the failure is considered recovered; the chain stops there.
//   - Strategies communicate with callers only through ctx.recovery.
//==========================================================================================================
class IRecoveryStrategy {
public:
    virtual ~IRecoveryStrategy() = default;
    virtual std::string Name() const = 0;
    virtual bool Attempt(const std::exception& error, ErrorContext& ctx) = 0;
};

/////////////////////////////////////////// ai_model ///////////////////////////////////////////
// Switches the caller to canned responses.
class ModelFallbackStrategy : public IRecoveryStrategy {
public:
    std::string Name() const override { return "model_fallback"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;
};

// Asks the model adapter to restart; fails when no hook is wired.
class ModelRestartStrategy : public IRecoveryStrategy {
public:
    explicit ModelRestartStrategy(std::function<bool()> restartHook = {}) : restartHook(std::move(restartHook)) {}
    std::string Name() const override { return "model_restart"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;

private:
    std::function<bool()> restartHook;
};

/////////////////////////////////////////// network ///////////////////////////////////////////
//==========================================================================================================
// NetworkRetryStrategy
// Purpose: Allows up to kMaxRetries retries with exponential backoff (base * 2^retryCount), each wait
//          capped at `maxWait`.
// Notes:
//   The backoff wait returns early (and the attempt fails) once `stop` is requested.
//==========================================================================================================
class NetworkRetryStrategy : public IRecoveryStrategy {
public:
    static constexpr int kMaxRetries = 3;

    NetworkRetryStrategy(std::chrono::milliseconds backoffBase, std::chrono::milliseconds maxWait,
                         std::stop_token stop)
        : backoffBase(backoffBase), maxWait(maxWait), stop(std::move(stop)) {}
    std::string Name() const override { return "network_retry"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;

private:
    std::chrono::milliseconds backoffBase;
    std::chrono::milliseconds maxWait;
    std::stop_token stop;
};

class LocalOnlyFallbackStrategy : public IRecoveryStrategy {
public:
    std::string Name() const override { return "local_only_fallback"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;
};

/////////////////////////////////////////// resource ///////////////////////////////////////////
//==========================================================================================================
// ResourceCleanupStrategy
// Purpose: Runs a reclamation pass. `reclaim` returns how many history entries it dropped.
//==========================================================================================================
class ResourceCleanupStrategy : public IRecoveryStrategy {
public:
    explicit ResourceCleanupStrategy(std::function<std::size_t()> reclaim = {}) : reclaim(std::move(reclaim)) {}
    std::string Name() const override { return "resource_cleanup"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;

private:
    std::function<std::size_t()> reclaim;
};

class ResourceLimitStrategy : public IRecoveryStrategy {
public:
    std::string Name() const override { return "resource_limit"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;
};

/////////////////////////////////////////// configuration ///////////////////////////////////////////
class ConfigDefaultsStrategy : public IRecoveryStrategy {
public:
    std::string Name() const override { return "config_defaults"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;
};

class ConfigReloadStrategy : public IRecoveryStrategy {
public:
    explicit ConfigReloadStrategy(std::function<bool()> reloadHook = {}) : reloadHook(std::move(reloadHook)) {}
    std::string Name() const override { return "config_reload"; }
    bool Attempt(const std::exception& error, ErrorContext& ctx) override;

private:
    std::function<bool()> reloadHook;
};

} // namespace errors
} // namespace mcplease
