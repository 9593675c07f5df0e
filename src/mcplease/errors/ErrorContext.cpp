//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorContext.cpp
// Purpose: JSON rendering of ErrorContext for logs and health output
//==========================================================================================================

#include "mcplease/errors/ErrorContext.h"

namespace mcplease {
namespace errors {

namespace {

void setOptional(JSONValue& obj, const char* key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        SetMember(obj, key, JSONValue(*v));
    }
}

} // namespace

JSONValue ErrorContext::ToJSON() const {
    JSONValue out{JSONValue::Object{}};
    SetMember(out, "timestamp", JSONValue(static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count())));
    SetMember(out, "error_code", JSONValue(code));
    SetMember(out, "category", JSONValue(ToString(category)));
    SetMember(out, "severity", JSONValue(ToString(severity)));
    SetMember(out, "kind", JSONValue(kind));
    SetMember(out, "message", JSONValue(message));
    setOptional(out, "user_id", userId);
    setOptional(out, "session_id", sessionId);
    setOptional(out, "request_id", requestId);
    SetMember(out, "recovery_attempted", JSONValue(recoveryAttempted));
    SetMember(out, "recovery_successful", JSONValue(recoverySuccessful));

    JSONValue details{JSONValue::Object{}};
    for (const auto& [k, v] : attributes) {
        SetMember(details, k, JSONValue(v));
    }
    // Only flags a strategy actually set are reported
    if (recovery.useFallback) SetMember(details, "use_fallback", JSONValue(true));
    if (recovery.retryCount > 0) SetMember(details, "retry_count", JSONValue(static_cast<int64_t>(recovery.retryCount)));
    if (recovery.localOnly) SetMember(details, "local_only", JSONValue(true));
    if (recovery.resourcesCleaned) SetMember(details, "resources_cleaned", JSONValue(true));
    if (recovery.historyTrimmed) SetMember(details, "error_history_trimmed", JSONValue(true));
    if (recovery.reducedLimits) SetMember(details, "reduced_limits", JSONValue(true));
    if (recovery.memoryEfficientMode) SetMember(details, "memory_efficient_mode", JSONValue(true));
    if (!recovery.degradationApplied.empty()) {
        SetMember(details, "degradation_applied", MakeStringArray(recovery.degradationApplied));
    }
    if (recovery.useDefaults) SetMember(details, "use_defaults", JSONValue(true));
    if (recovery.configReloaded) SetMember(details, "config_reloaded", JSONValue(true));
    SetMember(out, "details", std::move(details));
    return out;
}

} // namespace errors
} // namespace mcplease
