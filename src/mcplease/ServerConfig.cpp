//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment loading and option assembly for ServerConfig
//==========================================================================================================

#include "mcplease/ServerConfig.h"

#include <algorithm>
#include <cctype>
#include <limits>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplease/auth/SignedTokenScheme.h"
#include "mcplease/auth/StoredTokenScheme.h"
#include "mcplease/errors/Errors.h"
#include "mcplease/version.h"

namespace mcplease {

namespace {

// Parses a non-negative integer no larger than `max`; empty input yields nullopt.
std::optional<std::uint64_t> parseUnsigned(const char* name, const std::string& raw, std::uint64_t max) {
    if (raw.empty()) {
        return std::nullopt;
    }
    if (raw.size() > 19 ||
        !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw errors::ConfigurationError(std::string(name) + " must be a non-negative integer, got '" + raw + "'");
    }
    const std::uint64_t value = std::stoull(raw);
    if (value > max) {
        throw errors::ConfigurationError(std::string(name) + " out of range: " + raw);
    }
    return value;
}

std::optional<std::uint64_t> envUnsigned(const char* name,
                                         std::uint64_t max = std::numeric_limits<std::uint32_t>::max()) {
    return parseUnsigned(name, GetEnvOrDefault(name, ""), max);
}

// A duration of zero is never meaningful for timeouts and intervals.
std::uint64_t requirePositive(const char* name, std::uint64_t value) {
    if (value == 0) {
        throw errors::ConfigurationError(std::string(name) + " must be greater than zero");
    }
    return value;
}

} // namespace

security::NetworkPolicy ServerConfig::BuildNetworkPolicy() const {
    security::NetworkPolicy policy;
    if (policyProfile == "development") {
        policy = security::NetworkPolicy::DefaultPolicy();
    } else if (policyProfile == "production") {
        policy = security::NetworkPolicy::ProductionPolicy();
    } else {
        throw errors::ConfigurationError("Unknown policy profile '" + policyProfile + "'");
    }

    for (const auto& a : allowedAddresses) policy.AllowAddress(a);
    for (const auto& a : blockedAddresses) policy.BlockAddress(a);
    for (const auto& n : allowedNetworks) policy.AllowNetwork(n);
    for (const auto& n : blockedNetworks) policy.BlockNetwork(n);
    if (!allowedPorts.empty()) {
        policy.allowedPorts = std::set<std::uint16_t>(allowedPorts.begin(), allowedPorts.end());
    }
    if (rateLimitPerAddress.has_value()) policy.rateLimitPerAddress = *rateLimitPerAddress;
    if (maxConnectionsPerAddress.has_value()) policy.maxConnectionsPerAddress = *maxConnectionsPerAddress;
    if (requireTls.has_value()) policy.requireTls = *requireTls;
    return policy;
}

ServerConfig LoadServerConfigFromEnv() {
    ServerConfig cfg;
    cfg.listenUri = GetEnvOrDefault("MCPLEASE_LISTEN", cfg.listenUri);

    cfg.policyProfile = GetEnvOrDefault("MCPLEASE_POLICY_PROFILE", cfg.policyProfile);
    if (cfg.policyProfile != "development" && cfg.policyProfile != "production") {
        throw errors::ConfigurationError("MCPLEASE_POLICY_PROFILE must be 'development' or 'production', got '" +
                                         cfg.policyProfile + "'");
    }
    cfg.allowedAddresses = SplitList(GetEnvOrDefault("MCPLEASE_ALLOWED_IPS", ""));
    cfg.blockedAddresses = SplitList(GetEnvOrDefault("MCPLEASE_BLOCKED_IPS", ""));
    cfg.allowedNetworks = SplitList(GetEnvOrDefault("MCPLEASE_ALLOWED_NETWORKS", ""));
    cfg.blockedNetworks = SplitList(GetEnvOrDefault("MCPLEASE_BLOCKED_NETWORKS", ""));
    for (const auto& p : SplitList(GetEnvOrDefault("MCPLEASE_ALLOWED_PORTS", ""))) {
        auto port = parseUnsigned("MCPLEASE_ALLOWED_PORTS", p, 65535);
        cfg.allowedPorts.push_back(static_cast<std::uint16_t>(requirePositive("MCPLEASE_ALLOWED_PORTS", *port)));
    }
    if (auto v = envUnsigned("MCPLEASE_RATE_LIMIT")) {
        cfg.rateLimitPerAddress = static_cast<std::size_t>(*v);
    }
    if (auto v = envUnsigned("MCPLEASE_MAX_CONNECTIONS")) {
        cfg.maxConnectionsPerAddress = static_cast<std::size_t>(*v);
    }
    const std::string tls = GetEnvOrDefault("MCPLEASE_REQUIRE_TLS", "");
    if (!tls.empty()) {
        cfg.requireTls = IsTruthy(tls);
    }

    cfg.requireAuth = GetEnvFlag("MCPLEASE_REQUIRE_AUTH", cfg.requireAuth);
    cfg.authScheme = GetEnvOrDefault("MCPLEASE_AUTH_SCHEME", cfg.authScheme);
    if (cfg.authScheme != "signed" && cfg.authScheme != "stored") {
        throw errors::ConfigurationError("MCPLEASE_AUTH_SCHEME must be 'signed' or 'stored', got '" +
                                         cfg.authScheme + "'");
    }
    cfg.signingSecret = GetEnvOrDefault("MCPLEASE_JWT_SECRET", "");
    if (auto v = envUnsigned("MCPLEASE_TOKEN_LIFETIME_HOURS")) {
        cfg.tokenLifetime = std::chrono::hours(requirePositive("MCPLEASE_TOKEN_LIFETIME_HOURS", *v));
    }
    if (auto v = envUnsigned("MCPLEASE_SESSION_TIMEOUT_MINUTES")) {
        cfg.sessionTimeout = std::chrono::minutes(requirePositive("MCPLEASE_SESSION_TIMEOUT_MINUTES", *v));
    }

    if (auto v = envUnsigned("MCPLEASE_TOOL_TIMEOUT_MS")) {
        cfg.toolTimeout = std::chrono::milliseconds(requirePositive("MCPLEASE_TOOL_TIMEOUT_MS", *v));
    }
    if (auto v = envUnsigned("MCPLEASE_MAX_CONCURRENT_TOOLS")) {
        cfg.maxConcurrentTools = static_cast<std::size_t>(requirePositive("MCPLEASE_MAX_CONCURRENT_TOOLS", *v));
    }
    if (auto v = envUnsigned("MCPLEASE_MAX_QUEUE_DEPTH")) {
        cfg.maxQueueDepth = static_cast<std::size_t>(*v);
    }
    if (auto v = envUnsigned("MCPLEASE_ADMISSION_TIMEOUT_MS")) {
        cfg.admissionTimeout = std::chrono::milliseconds(requirePositive("MCPLEASE_ADMISSION_TIMEOUT_MS", *v));
    }

    if (auto v = envUnsigned("MCPLEASE_SWEEP_INTERVAL_SECONDS")) {
        cfg.sweepInterval = std::chrono::seconds(requirePositive("MCPLEASE_SWEEP_INTERVAL_SECONDS", *v));
        cfg.maintenanceInterval = cfg.sweepInterval;
    }
    if (auto v = envUnsigned("MCPLEASE_HEALTH_INTERVAL_SECONDS")) {
        cfg.healthInterval = std::chrono::seconds(requirePositive("MCPLEASE_HEALTH_INTERVAL_SECONDS", *v));
    }
    if (auto v = envUnsigned("MCPLEASE_DRAIN_TIMEOUT_MS")) {
        cfg.drainTimeout = std::chrono::milliseconds(*v);
    }

    cfg.logLevel = GetEnvOrDefault("MCPLEASE_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = GetEnvOrDefault("MCPLEASE_LOG_FILE", "");

    // Surface malformed addresses and ranges now rather than at first request.
    (void)cfg.BuildNetworkPolicy();
    return cfg;
}

ServerOptions MakeServerOptions(const ServerConfig& config) {
    ServerOptions opts;
    opts.policy = config.BuildNetworkPolicy();
    opts.network.sweepInterval = config.sweepInterval;

    opts.session.requireAuth = config.requireAuth;
    opts.session.sessionTimeout = config.sessionTimeout;
    opts.session.sweepInterval = config.sweepInterval;
    if (config.authScheme == "signed") {
        auth::SignedTokenScheme::Options so;
        so.secret = config.signingSecret;
        so.lifetime = config.tokenLifetime;
        if (config.requireAuth && so.secret.empty()) {
            LOG_WARN("MCPLEASE_JWT_SECRET not set; generated a process-local signing key");
        }
        opts.schemes.push_back(std::make_shared<auth::SignedTokenScheme>(std::move(so)));
    } else {
        auth::StoredTokenScheme::Options so;
        so.lifetime = config.tokenLifetime;
        opts.schemes.push_back(std::make_shared<auth::StoredTokenScheme>(std::move(so)));
    }

    opts.dispatcher.serverInfo.version = getVersionString();
    opts.dispatcher.toolTimeout = config.toolTimeout;
    opts.dispatcher.admissionTimeout = config.admissionTimeout;
    opts.dispatcher.admission.capacity = config.maxConcurrentTools;
    opts.dispatcher.admission.maxQueueDepth = config.maxQueueDepth;
    opts.errors.normalConcurrency = config.maxConcurrentTools;
    opts.errors.maxRecoveryWait = config.toolTimeout;

    opts.maintenanceInterval = config.maintenanceInterval;
    opts.healthInterval = config.healthInterval;
    opts.drainTimeout = config.drainTimeout;
    return opts;
}

} // namespace mcplease
