//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorController.cpp
// Purpose: ErrorController implementation
//==========================================================================================================

#include "mcplease/errors/ErrorController.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <new>
#include <system_error>

#include "logging/Logger.h"
#include "mcplease/util/Crypto.h"

namespace mcplease {
namespace errors {

namespace {

constexpr auto kRecentWindow = std::chrono::hours(1);
constexpr std::size_t kCleanupThreshold = 500;
constexpr std::size_t kCleanupKeep = 100;
constexpr double kHighErrorRate = 5.0;
constexpr double kElevatedErrorRate = 2.0;
constexpr std::size_t kMemoryPressureErrors = 3;

std::string upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

JSONValue count(std::size_t n) { return JSONValue(static_cast<int64_t>(n)); }

int64_t epochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

/////////////////////////////////////////// JSON views ///////////////////////////////////////////

JSONValue DegradationConfig::ToJSON() const {
    JSONValue out{JSONValue::Object{}};
    SetMember(out, "level", JSONValue(static_cast<int64_t>(level)));
    SetMember(out, "enabled", JSONValue(enabled));
    SetMember(out, "max_context_size", count(maxContextSize));
    SetMember(out, "max_concurrent_requests", count(maxConcurrentRequests));
    SetMember(out, "use_fallback_responses", JSONValue(useFallbackResponses));
    SetMember(out, "disable_ai_features", JSONValue(disableAIFeatures));
    SetMember(out, "reduce_logging", JSONValue(reduceLogging));
    return out;
}

JSONValue ErrorStatistics::ToJSON() const {
    JSONValue out{JSONValue::Object{}};
    SetMember(out, "total_errors", count(totalErrors));

    JSONValue cats{JSONValue::Object{}};
    for (const auto& [k, v] : categoryCounts) SetMember(cats, k, count(v));
    SetMember(out, "category_counts", std::move(cats));

    JSONValue sevs{JSONValue::Object{}};
    for (const auto& [k, v] : severityCounts) SetMember(sevs, k, count(v));
    SetMember(out, "severity_counts", std::move(sevs));

    JSONValue::Array recent;
    for (const auto& e : recentErrors) {
        JSONValue item{JSONValue::Object{}};
        SetMember(item, "error_code", JSONValue(e.code));
        SetMember(item, "category", JSONValue(ToString(e.category)));
        SetMember(item, "severity", JSONValue(ToString(e.severity)));
        SetMember(item, "timestamp", JSONValue(epochMillis(e.timestamp)));
        recent.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    SetMember(out, "recent_errors", JSONValue(std::move(recent)));

    JSONValue frequent{JSONValue::Object{}};
    for (const auto& [code, n] : mostFrequent) SetMember(frequent, code, count(n));
    SetMember(out, "most_frequent", std::move(frequent));

    JSONValue recovery{JSONValue::Object{}};
    SetMember(recovery, "attempted", count(recoveryAttempted));
    SetMember(recovery, "successful", count(recoverySuccessful));
    SetMember(out, "recovery_stats", std::move(recovery));

    SetMember(out, "error_rate_per_minute", JSONValue(errorRatePerMinute));

    JSONValue constraints{JSONValue::Object{}};
    SetMember(constraints, "high_error_rate", JSONValue(degradation.highErrorRate));
    SetMember(constraints, "memory_pressure", JSONValue(degradation.memoryPressure));
    SetMember(constraints, "degraded_mode", JSONValue(degradation.degradedMode));
    SetMember(out, "resource_constraints", std::move(constraints));
    SetMember(out, "degradation_level", JSONValue(static_cast<int64_t>(degradation.level)));
    return out;
}

/////////////////////////////////////////// ErrorController ///////////////////////////////////////////

ErrorController::ErrorController() : ErrorController(Options{}) {}

ErrorController::ErrorController(Options opts) : options(std::move(opts)) {
    auto& ai = chains[ErrorCategory::AIModel];
    ai.push_back(std::make_shared<ModelFallbackStrategy>());
    ai.push_back(std::make_shared<ModelRestartStrategy>(options.modelRestartHook));

    auto& net = chains[ErrorCategory::Network];
    net.push_back(std::make_shared<NetworkRetryStrategy>(options.retryBackoffBase, options.maxRecoveryWait,
                                                         stopSource.get_token()));
    net.push_back(std::make_shared<LocalOnlyFallbackStrategy>());

    auto& res = chains[ErrorCategory::Resource];
    res.push_back(std::make_shared<ResourceCleanupStrategy>([this] { return reclaimHistory(); }));
    res.push_back(std::make_shared<ResourceLimitStrategy>());

    auto& cfg = chains[ErrorCategory::Configuration];
    cfg.push_back(std::make_shared<ConfigDefaultsStrategy>());
    cfg.push_back(std::make_shared<ConfigReloadStrategy>(options.configReloadHook));
}

ErrorController::~ErrorController() {
    Shutdown();
}

void ErrorController::Shutdown() {
    stopSource.request_stop();
}

std::chrono::system_clock::time_point ErrorController::now() const {
    return options.now ? options.now() : std::chrono::system_clock::now();
}

ErrorCategory ErrorController::Categorize(const std::exception& error) {
    if (dynamic_cast<const ProtocolError*>(&error) || dynamic_cast<const JSONParseError*>(&error)) {
        return ErrorCategory::Protocol;
    }
    if (dynamic_cast<const SecurityError*>(&error)) return ErrorCategory::Security;
    if (dynamic_cast<const ModelError*>(&error)) return ErrorCategory::AIModel;
    if (dynamic_cast<const NetworkError*>(&error)) return ErrorCategory::Network;
    if (dynamic_cast<const ConfigurationError*>(&error)) return ErrorCategory::Configuration;
    if (dynamic_cast<const ResourceError*>(&error)) return ErrorCategory::Resource;
    if (dynamic_cast<const ExternalServiceError*>(&error)) return ErrorCategory::External;

    if (dynamic_cast<const std::bad_alloc*>(&error) || dynamic_cast<const std::system_error*>(&error)) {
        return ErrorCategory::Resource;
    }
    if (dynamic_cast<const std::invalid_argument*>(&error) ||
        dynamic_cast<const std::out_of_range*>(&error) ||
        dynamic_cast<const std::domain_error*>(&error)) {
        return ErrorCategory::UserInput;
    }
    return ErrorCategory::System;
}

ErrorSeverity ErrorController::DetermineSeverity(const std::exception& error, ErrorCategory category) {
    if (dynamic_cast<const std::bad_alloc*>(&error) || dynamic_cast<const TerminationError*>(&error)) {
        return ErrorSeverity::Critical;
    }
    switch (category) {
        case ErrorCategory::Security:
        case ErrorCategory::Protocol:
            return ErrorSeverity::High;
        case ErrorCategory::AIModel:
            if (dynamic_cast<const ModelNotFoundError*>(&error) ||
                lower(error.what()).find("model not found") != std::string::npos) {
                return ErrorSeverity::High;
            }
            return ErrorSeverity::Medium;
        case ErrorCategory::Network:
        case ErrorCategory::Resource:
            return ErrorSeverity::Medium;
        case ErrorCategory::Configuration:
        case ErrorCategory::UserInput:
            return ErrorSeverity::Low;
        default:
            return ErrorSeverity::Medium;
    }
}

std::string ErrorController::KindOf(const std::exception& error) {
    if (auto e = dynamic_cast<const McpleaseError*>(&error)) return e->Kind();
    if (dynamic_cast<const JSONParseError*>(&error)) return "JSONParseError";
    if (dynamic_cast<const std::bad_alloc*>(&error)) return "bad_alloc";
    if (dynamic_cast<const std::system_error*>(&error)) return "system_error";
    if (dynamic_cast<const std::invalid_argument*>(&error)) return "invalid_argument";
    if (dynamic_cast<const std::out_of_range*>(&error)) return "out_of_range";
    if (dynamic_cast<const std::domain_error*>(&error)) return "domain_error";
    if (dynamic_cast<const std::logic_error*>(&error)) return "logic_error";
    if (dynamic_cast<const std::runtime_error*>(&error)) return "runtime_error";
    return "exception";
}

std::string ErrorController::GenerateCode(ErrorCategory category, const std::exception& error) {
    const std::string digest = crypto::Sha256(error.what());
    std::uint64_t h = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        h = (h << 8) | static_cast<unsigned char>(digest[i]);
    }
    const std::string cat = upper(ToString(category)).substr(0, 3);
    const std::string kind = upper(KindOf(error)).substr(0, 10);
    return std::format("{}-{}-{:04d}", cat, kind, h % 10000);
}

void ErrorController::logContext(const ErrorContext& ctx) const {
    const std::string corr = std::format("user={} session={} request={}",
        ctx.userId.value_or("-"), ctx.sessionId.value_or("-"), ctx.requestId.value_or("-"));
    switch (ctx.severity) {
        case ErrorSeverity::Critical:
            LOG_CRITICAL("Critical error {} [{}]: {} ({})", ctx.code, ToString(ctx.category), ctx.message, corr);
            break;
        case ErrorSeverity::High:
            LOG_ERROR("High severity error {} [{}]: {} ({})", ctx.code, ToString(ctx.category), ctx.message, corr);
            break;
        case ErrorSeverity::Medium:
            LOG_WARN("Medium severity error {} [{}]: {} ({})", ctx.code, ToString(ctx.category), ctx.message, corr);
            break;
        case ErrorSeverity::Low:
            if (lastLevel.load() >= 2) {
                LOG_DEBUG("Low severity error {} [{}]: {} ({})", ctx.code, ToString(ctx.category), ctx.message, corr);
            } else {
                LOG_INFO("Low severity error {} [{}]: {} ({})", ctx.code, ToString(ctx.category), ctx.message, corr);
            }
            break;
    }
    if (ctx.trace.has_value() && (ctx.severity == ErrorSeverity::High || ctx.severity == ErrorSeverity::Critical)) {
        LOG_DEBUG("Trace for {}: {}", ctx.code, *ctx.trace);
    }
}

bool ErrorController::runRecovery(const std::exception& error, ErrorContext& ctx) {
    std::vector<std::shared_ptr<IRecoveryStrategy>> chain;
    {
        std::lock_guard<std::mutex> lock(chainMutex);
        auto it = chains.find(ctx.category);
        if (it != chains.end()) chain = it->second;
    }
    for (const auto& strategy : chain) {
        LOG_INFO("Attempting error recovery: strategy={} code={}", strategy->Name(), ctx.code);
        try {
            if (strategy->Attempt(error, ctx)) {
                LOG_INFO("Error recovery successful: strategy={} code={}", strategy->Name(), ctx.code);
                return true;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Recovery strategy {} failed for {}: {}", strategy->Name(), ctx.code, e.what());
        }
    }
    return false;
}

ErrorContext ErrorController::Handle(const std::exception& error, const HandleRequest& request) {
    ErrorContext ctx;
    ctx.timestamp = now();
    ctx.category = Categorize(error);
    ctx.severity = DetermineSeverity(error, ctx.category);
    ctx.kind = KindOf(error);
    ctx.code = GenerateCode(ctx.category, error);
    ctx.message = error.what();
    ctx.attributes = request.attributes;
    ctx.trace = request.trace;
    ctx.userId = request.userId;
    ctx.sessionId = request.sessionId;
    ctx.requestId = request.requestId;
    ctx.recovery.retryCount = request.priorRetries;

    logContext(ctx);
    {
        std::lock_guard<std::mutex> lock(historyMutex);
        ++codeCounts[ctx.code];
    }

    bool hasChain = false;
    {
        std::lock_guard<std::mutex> lock(chainMutex);
        auto it = chains.find(ctx.category);
        hasChain = it != chains.end() && !it->second.empty();
    }
    if (request.attemptRecovery && hasChain) {
        ctx.recoveryAttempted = true;
        ctx.recoverySuccessful = runRecovery(error, ctx);
    }

    {
        std::lock_guard<std::mutex> lock(historyMutex);
        if (ctx.recoveryAttempted) {
            ++recoveryAttempted;
            if (ctx.recoverySuccessful) ++recoverySuccessful;
        }
        history.push_back(ctx);
        while (history.size() > options.maxHistory) {
            history.pop_front();
        }
        lastLevel.store(computeDegradationLocked(ctx.timestamp, nullptr, nullptr).level);
    }
    return ctx;
}

void ErrorController::SetRecoveryChain(ErrorCategory category, std::vector<std::unique_ptr<IRecoveryStrategy>> chain) {
    std::vector<std::shared_ptr<IRecoveryStrategy>> shared;
    shared.reserve(chain.size());
    for (auto& s : chain) shared.emplace_back(std::move(s));
    std::lock_guard<std::mutex> lock(chainMutex);
    chains[category] = std::move(shared);
}

std::size_t ErrorController::reclaimHistory() {
    std::lock_guard<std::mutex> lock(historyMutex);
    if (history.size() <= kCleanupThreshold) {
        return 0;
    }
    const std::size_t dropped = history.size() - kCleanupKeep;
    history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(dropped));
    return dropped;
}

DegradationState ErrorController::computeDegradationLocked(std::chrono::system_clock::time_point t,
                                                           double* ratePerMinute,
                                                           std::size_t* resourceErrors) const {
    const auto cutoff = t - kRecentWindow;
    std::size_t recent = 0;
    std::size_t resource = 0;
    std::optional<std::chrono::system_clock::time_point> oldest;
    std::optional<std::chrono::system_clock::time_point> newest;
    for (const auto& e : history) {
        if (e.timestamp <= cutoff) continue;
        ++recent;
        if (e.category == ErrorCategory::Resource) ++resource;
        if (!oldest || e.timestamp < *oldest) oldest = e.timestamp;
        if (!newest || e.timestamp > *newest) newest = e.timestamp;
    }

    double rate = 0.0;
    if (recent > 0) {
        const double spanMinutes = std::chrono::duration<double, std::ratio<60>>(*newest - *oldest).count();
        rate = static_cast<double>(recent) / std::max(1.0, spanMinutes);
    }

    DegradationState state;
    state.highErrorRate = rate > kHighErrorRate;
    state.memoryPressure = resource > kMemoryPressureErrors;
    if (state.highErrorRate && state.memoryPressure) {
        state.level = 3;
    } else if (state.highErrorRate || state.memoryPressure) {
        state.level = 2;
    } else if (rate > kElevatedErrorRate) {
        state.level = 1;
    }
    state.degradedMode = state.level > 0;
    if (ratePerMinute) *ratePerMinute = rate;
    if (resourceErrors) *resourceErrors = resource;
    return state;
}

ErrorStatistics ErrorController::GetStatistics() const {
    const auto t = now();
    ErrorStatistics stats;
    std::lock_guard<std::mutex> lock(historyMutex);
    stats.totalErrors = history.size();
    const auto cutoff = t - kRecentWindow;
    for (const auto& e : history) {
        ++stats.categoryCounts[ToString(e.category)];
        ++stats.severityCounts[ToString(e.severity)];
        if (e.timestamp > cutoff) {
            stats.recentErrors.push_back({e.code, e.category, e.severity, e.timestamp});
        }
    }
    stats.mostFrequent.assign(codeCounts.begin(), codeCounts.end());
    std::sort(stats.mostFrequent.begin(), stats.mostFrequent.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });
    if (stats.mostFrequent.size() > 10) stats.mostFrequent.resize(10);
    stats.recoveryAttempted = recoveryAttempted;
    stats.recoverySuccessful = recoverySuccessful;
    stats.degradation = computeDegradationLocked(t, &stats.errorRatePerMinute, &stats.recentResourceErrors);
    lastLevel.store(stats.degradation.level);
    return stats;
}

int ErrorController::DegradationLevel() const {
    const auto t = now();
    std::lock_guard<std::mutex> lock(historyMutex);
    const int level = computeDegradationLocked(t, nullptr, nullptr).level;
    lastLevel.store(level);
    return level;
}

DegradationConfig ErrorController::DegradationConfigForLevel(int level) const {
    DegradationConfig cfg;
    cfg.level = std::clamp(level, 0, 3);
    cfg.maxContextSize = options.normalContextSize;
    cfg.maxConcurrentRequests = options.normalConcurrency;
    switch (cfg.level) {
        case 1:
            cfg.enabled = true;
            cfg.maxContextSize = 2000;
            cfg.maxConcurrentRequests = 3;
            break;
        case 2:
            cfg.enabled = true;
            cfg.maxContextSize = 1000;
            cfg.maxConcurrentRequests = 2;
            cfg.useFallbackResponses = true;
            cfg.reduceLogging = true;
            break;
        case 3:
            cfg.enabled = true;
            cfg.maxContextSize = 500;
            cfg.maxConcurrentRequests = 1;
            cfg.useFallbackResponses = true;
            cfg.disableAIFeatures = true;
            cfg.reduceLogging = true;
            break;
        default:
            break;
    }
    return cfg;
}

DegradationConfig ErrorController::GetDegradationConfig() const {
    return DegradationConfigForLevel(DegradationLevel());
}

bool ErrorController::ShouldApplyGracefulDegradation() const {
    return DegradationLevel() > 0;
}

void ErrorController::ClearHistory() {
    std::lock_guard<std::mutex> lock(historyMutex);
    history.clear();
    codeCounts.clear();
    recoveryAttempted = 0;
    recoverySuccessful = 0;
    lastLevel.store(0);
    LOG_INFO("Error history cleared");
}

std::vector<ErrorContext> ErrorController::History() const {
    std::lock_guard<std::mutex> lock(historyMutex);
    return std::vector<ErrorContext>(history.begin(), history.end());
}

} // namespace errors
} // namespace mcplease
