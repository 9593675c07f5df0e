//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkPolicyEnforcer.cpp
// Purpose: NetworkPolicyEnforcer implementation
//==========================================================================================================

#include "mcplease/security/NetworkPolicyEnforcer.h"

#include <algorithm>
#include <format>

#include "logging/Logger.h"

namespace mcplease {
namespace security {

namespace {
constexpr auto kRateWindow = std::chrono::seconds(60);

JSONValue num(std::size_t v) { return JSONValue(static_cast<int64_t>(v)); }
} // namespace

NetworkPolicyEnforcer::NetworkPolicyEnforcer(NetworkPolicy p)
    : NetworkPolicyEnforcer(std::move(p), Options{}) {}

NetworkPolicyEnforcer::NetworkPolicyEnforcer(NetworkPolicy p, Options opts)
    : options(std::move(opts)), policy(std::make_shared<const NetworkPolicy>(std::move(p))) {}

NetworkPolicyEnforcer::~NetworkPolicyEnforcer() {
    Stop();
}

NetworkPolicyEnforcer::Clock::time_point NetworkPolicyEnforcer::now() const {
    return options.now ? options.now() : Clock::now();
}

std::shared_ptr<const NetworkPolicy> NetworkPolicyEnforcer::Policy() const {
    std::lock_guard<std::mutex> lock(policyMutex);
    return policy;
}

void NetworkPolicyEnforcer::UpdatePolicy(NetworkPolicy p) {
    auto next = std::make_shared<const NetworkPolicy>(std::move(p));
    {
        std::lock_guard<std::mutex> lock(policyMutex);
        policy = std::move(next);
    }
    LOG_INFO("Network policy updated");
}

AccessDecision NetworkPolicyEnforcer::ValidateAccess(const std::string& address,
                                                     std::uint16_t port,
                                                     const std::string& scheme) const {
    const auto p = Policy();

    // Port 0 marks a transport without a listening port (stdio).
    if (port != 0 && !p->allowedPorts.empty() && p->allowedPorts.count(port) == 0) {
        return AccessDecision::Deny(std::format("Port {} not allowed", port));
    }
    if (p->requireTls && (scheme == "http" || scheme == "ws")) {
        return AccessDecision::Deny("TLS required for this connection");
    }

    auto addr = ParseAddress(address);
    if (!addr.has_value()) {
        LOG_WARN("Rejecting unparseable client address '{}'", address);
        return AccessDecision::Deny("Invalid IP address");
    }
    const std::string canonical = addr->to_string();

    if (p->blockedAddresses.count(canonical) != 0) {
        return AccessDecision::Deny(std::format("IP {} is blocked", address));
    }
    for (const auto& net : p->blockedNetworks) {
        if (net.Contains(*addr)) {
            return AccessDecision::Deny(std::format("IP {} is in blocked network {}", address, net.text));
        }
    }

    if (p->HasAllowList()) {
        if (p->allowedAddresses.count(canonical) != 0) {
            return AccessDecision::Allow();
        }
        const bool inRange = std::any_of(p->allowedNetworks.begin(), p->allowedNetworks.end(),
                                         [&](const IpNetwork& net) { return net.Contains(*addr); });
        if (!inRange) {
            return AccessDecision::Deny(std::format("IP {} not in allowed list", address));
        }
    }
    return AccessDecision::Allow();
}

AccessDecision NetworkPolicyEnforcer::CheckRateLimit(const std::string& address) {
    if (!options.enableRateLimiting) {
        return AccessDecision::Allow();
    }
    const std::size_t limit = Policy()->rateLimitPerAddress;
    const auto t = now();
    std::lock_guard<std::mutex> lock(rateMutex);
    auto& window = rateWindows[address];
    while (!window.empty() && t - window.front() >= kRateWindow) {
        window.pop_front();
    }
    if (window.size() >= limit) {
        LOG_WARN("Rate limit hit for {} ({} requests in window)", address, window.size());
        return AccessDecision::Deny(std::format("Rate limit exceeded for IP {}", address));
    }
    window.push_back(t);
    return AccessDecision::Allow();
}

AccessDecision NetworkPolicyEnforcer::CheckConnectionLimit(const std::string& address) const {
    if (!options.enableConnectionLimiting) {
        return AccessDecision::Allow();
    }
    const std::size_t limit = Policy()->maxConnectionsPerAddress;
    std::lock_guard<std::mutex> lock(connectionMutex);
    auto it = activeConnections.find(address);
    if (it != activeConnections.end() && it->second >= limit) {
        return AccessDecision::Deny(std::format("Connection limit exceeded for IP {}", address));
    }
    return AccessDecision::Allow();
}

void NetworkPolicyEnforcer::RegisterConnection(const std::string& address) {
    std::lock_guard<std::mutex> lock(connectionMutex);
    ++activeConnections[address];
    LOG_DEBUG("Registered connection from {}", address);
}

void NetworkPolicyEnforcer::UnregisterConnection(const std::string& address) {
    std::lock_guard<std::mutex> lock(connectionMutex);
    auto it = activeConnections.find(address);
    if (it == activeConnections.end()) {
        return;
    }
    if (--it->second == 0) {
        activeConnections.erase(it);
    }
    LOG_DEBUG("Unregistered connection from {}", address);
}

/////////////////////////////////////////// Client sessions ///////////////////////////////////////////

ClientSession NetworkPolicyEnforcer::CreateClientSession(const std::string& userId,
                                                         const std::string& sessionId,
                                                         const std::string& address,
                                                         const std::string& userAgent,
                                                         std::unordered_set<std::string> permissions) {
    ClientSession s;
    s.userId = userId;
    s.sessionId = sessionId;
    s.address = address;
    s.userAgent = userAgent;
    s.createdAt = now();
    s.lastActivity = s.createdAt;
    s.permissions = std::move(permissions);

    std::lock_guard<std::mutex> lock(sessionMutex);
    removeClientSessionLocked(sessionId);
    clientSessions[sessionId] = s;
    addressSessions[address].push_back(sessionId);
    LOG_INFO("Created client session {} for user {} from {}", sessionId, userId, address);
    return s;
}

std::optional<ClientSession> NetworkPolicyEnforcer::GetClientSession(const std::string& sessionId) {
    const auto t = now();
    std::lock_guard<std::mutex> lock(sessionMutex);
    auto it = clientSessions.find(sessionId);
    if (it == clientSessions.end()) {
        return std::nullopt;
    }
    if (t - it->second.lastActivity > options.clientSessionTimeout) {
        removeClientSessionLocked(sessionId);
        return std::nullopt;
    }
    it->second.lastActivity = t;
    return it->second;
}

bool NetworkPolicyEnforcer::TouchClientSession(const std::string& sessionId) {
    const auto t = now();
    std::lock_guard<std::mutex> lock(sessionMutex);
    auto it = clientSessions.find(sessionId);
    if (it == clientSessions.end()) {
        return false;
    }
    it->second.lastActivity = t;
    ++it->second.requestCount;
    return true;
}

bool NetworkPolicyEnforcer::RevokeClientSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    return removeClientSessionLocked(sessionId);
}

std::size_t NetworkPolicyEnforcer::RevokeUserClientSessions(const std::string& userId) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    std::vector<std::string> victims;
    for (const auto& [id, s] : clientSessions) {
        if (s.userId == userId) victims.push_back(id);
    }
    for (const auto& id : victims) removeClientSessionLocked(id);
    LOG_INFO("Revoked {} client sessions for user {}", victims.size(), userId);
    return victims.size();
}

std::size_t NetworkPolicyEnforcer::RevokeAddressClientSessions(const std::string& address) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    auto it = addressSessions.find(address);
    if (it == addressSessions.end()) {
        return 0;
    }
    const std::vector<std::string> victims = it->second;
    for (const auto& id : victims) removeClientSessionLocked(id);
    LOG_INFO("Revoked {} client sessions from {}", victims.size(), address);
    return victims.size();
}

bool NetworkPolicyEnforcer::removeClientSessionLocked(const std::string& sessionId) {
    auto it = clientSessions.find(sessionId);
    if (it == clientSessions.end()) {
        return false;
    }
    auto byAddr = addressSessions.find(it->second.address);
    if (byAddr != addressSessions.end()) {
        auto& ids = byAddr->second;
        ids.erase(std::remove(ids.begin(), ids.end(), sessionId), ids.end());
        if (ids.empty()) {
            addressSessions.erase(byAddr);
        }
    }
    clientSessions.erase(it);
    return true;
}

/////////////////////////////////////////// Maintenance ///////////////////////////////////////////

void NetworkPolicyEnforcer::Sweep() {
    const auto t = now();
    std::size_t droppedWindows = 0;
    {
        std::lock_guard<std::mutex> lock(rateMutex);
        for (auto it = rateWindows.begin(); it != rateWindows.end();) {
            auto& window = it->second;
            while (!window.empty() && t - window.front() >= kRateWindow) {
                window.pop_front();
            }
            if (window.empty()) {
                it = rateWindows.erase(it);
                ++droppedWindows;
            } else {
                ++it;
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(connectionMutex);
        std::erase_if(activeConnections, [](const auto& kv) { return kv.second == 0; });
    }
    std::size_t expired = 0;
    {
        std::lock_guard<std::mutex> lock(sessionMutex);
        std::vector<std::string> victims;
        for (const auto& [id, s] : clientSessions) {
            if (t - s.lastActivity > options.clientSessionTimeout) victims.push_back(id);
        }
        for (const auto& id : victims) removeClientSessionLocked(id);
        expired = victims.size();
    }
    if (droppedWindows > 0 || expired > 0) {
        LOG_INFO("Network sweep: dropped {} idle rate windows, {} expired client sessions", droppedWindows, expired);
    }
}

void NetworkPolicyEnforcer::Start() {
    if (!sweeper) {
        sweeper = std::make_unique<PeriodicTask>("network-sweep", options.sweepInterval, [this] { Sweep(); });
    }
    sweeper->Start();
}

void NetworkPolicyEnforcer::Stop() {
    if (sweeper) {
        sweeper->Stop();
    }
}

JSONValue NetworkPolicyEnforcer::GetSecurityStats() const {
    JSONValue stats{JSONValue::Object{}};
    {
        std::lock_guard<std::mutex> lock(sessionMutex);
        std::unordered_set<std::string> users;
        for (const auto& [id, s] : clientSessions) users.insert(s.userId);
        SetMember(stats, "total_sessions", num(clientSessions.size()));
        SetMember(stats, "unique_users", num(users.size()));
        SetMember(stats, "unique_session_ips", num(addressSessions.size()));
    }
    {
        std::lock_guard<std::mutex> lock(connectionMutex);
        std::size_t total = 0;
        for (const auto& [addr, n] : activeConnections) total += n;
        SetMember(stats, "total_connections", num(total));
        SetMember(stats, "unique_connection_ips", num(activeConnections.size()));
    }
    {
        std::lock_guard<std::mutex> lock(rateMutex);
        SetMember(stats, "tracked_rate_windows", num(rateWindows.size()));
    }
    SetMember(stats, "rate_limiting_enabled", JSONValue(options.enableRateLimiting));
    SetMember(stats, "connection_limiting_enabled", JSONValue(options.enableConnectionLimiting));
    SetMember(stats, "session_timeout_minutes", JSONValue(static_cast<int64_t>(options.clientSessionTimeout.count())));

    const auto p = Policy();
    JSONValue summary{JSONValue::Object{}};
    SetMember(summary, "allowed_ips", num(p->allowedAddresses.size()));
    SetMember(summary, "blocked_ips", num(p->blockedAddresses.size()));
    SetMember(summary, "allowed_networks", num(p->allowedNetworks.size()));
    SetMember(summary, "blocked_networks", num(p->blockedNetworks.size()));
    SetMember(summary, "rate_limit_per_ip", num(p->rateLimitPerAddress));
    SetMember(summary, "max_connections_per_ip", num(p->maxConnectionsPerAddress));
    SetMember(summary, "require_tls", JSONValue(p->requireTls));
    SetMember(stats, "network_policy", std::move(summary));
    return stats;
}

} // namespace security
} // namespace mcplease
