//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Typed server configuration with defaults, loaded from MCPLEASE_* environment variables
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcplease/Server.h"
#include "mcplease/security/NetworkPolicy.h"

namespace mcplease {

//==========================================================================================================
// ServerConfig
// Purpose: Deployment settings. Every field has a default suitable for local development.
// Fields:
//   listenUri: Acceptor URI ("http://127.0.0.1:8000", "https://0.0.0.0:8443?cert=..&key=..").
//   policyProfile: "development" or "production" base network policy.
//   allowed/blocked Addresses/Networks: Added on top of the profile.
//   allowedPorts: Replaces the profile's ports when non-empty.
//   rateLimitPerAddress/maxConnectionsPerAddress/requireTls: Override the profile when set.
//   requireAuth/authScheme/signingSecret/tokenLifetime: Session authentication.
//   toolTimeout/maxConcurrentTools/maxQueueDepth/admissionTimeout: Tool execution limits.
//   sweepInterval/maintenanceInterval/healthInterval/drainTimeout: Background work and shutdown.
//==========================================================================================================
struct ServerConfig {
    std::string listenUri{"http://127.0.0.1:8000"};

    std::string policyProfile{"development"};
    std::vector<std::string> allowedAddresses;
    std::vector<std::string> blockedAddresses;
    std::vector<std::string> allowedNetworks;
    std::vector<std::string> blockedNetworks;
    std::vector<std::uint16_t> allowedPorts;
    std::optional<std::size_t> rateLimitPerAddress;
    std::optional<std::size_t> maxConnectionsPerAddress;
    std::optional<bool> requireTls;

    bool requireAuth{false};
    std::string authScheme{"signed"};  // "signed" or "stored"
    std::string signingSecret;
    std::chrono::hours tokenLifetime{24};
    std::chrono::minutes sessionTimeout{60};

    std::chrono::milliseconds toolTimeout{30000};
    std::size_t maxConcurrentTools{4};
    std::size_t maxQueueDepth{16};
    std::chrono::milliseconds admissionTimeout{30000};

    std::chrono::milliseconds sweepInterval{std::chrono::seconds(300)};
    std::chrono::milliseconds maintenanceInterval{std::chrono::seconds(300)};
    std::chrono::milliseconds healthInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds drainTimeout{std::chrono::seconds(10)};

    std::string logLevel{"INFO"};
    std::string logFile;

    // Profile policy plus the overrides above. Throws errors::ConfigurationError on bad entries.
    security::NetworkPolicy BuildNetworkPolicy() const;
};

//==========================================================================================================
// LoadServerConfigFromEnv
// Purpose: Populate a ServerConfig from MCPLEASE_* variables; unset variables keep their defaults.
// Throws:
//   errors::ConfigurationError when a value is malformed (non-numeric, out of range, unknown profile).
//==========================================================================================================
ServerConfig LoadServerConfigFromEnv();

//==========================================================================================================
// MakeServerOptions
// Purpose: Build orchestrator options (policy, credential schemes, limits) from a config.
//==========================================================================================================
ServerOptions MakeServerOptions(const ServerConfig& config);

} // namespace mcplease
