//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkPolicyEnforcer.h
// Purpose: Address/port/TLS admission, per-address rate and connection limiting, client session tracking
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/async/PeriodicTask.h"
#include "mcplease/security/NetworkPolicy.h"

namespace mcplease {
namespace security {

//==========================================================================================================
// AccessDecision
// Purpose: Outcome of a policy check; `reason` is set when denied.
//==========================================================================================================
struct AccessDecision {
    bool allowed{true};
    std::string reason;

    static AccessDecision Allow() { return AccessDecision{}; }
    static AccessDecision Deny(std::string why) { return AccessDecision{false, std::move(why)}; }
    explicit operator bool() const { return allowed; }
};

//==========================================================================================================
// ClientSession
// Purpose: Network-layer view of a user session, indexed by originating address.
//==========================================================================================================
struct ClientSession {
    std::string userId;
    std::string sessionId;
    std::string address;
    std::string userAgent;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastActivity;
    std::uint64_t requestCount{0};
    std::uint64_t connectionCount{0};
    std::unordered_set<std::string> permissions;
    std::unordered_map<std::string, std::string> metadata;
};

//==========================================================================================================
// NetworkPolicyEnforcer
// Purpose: Applies the current NetworkPolicy to each inbound call.
// Notes:
//   - ValidateAccess checks in a fixed order: port, transport security, block list, allow list.
//   - The policy is replaced as a whole with UpdatePolicy; readers hold a snapshot.
//   - Start() schedules the periodic sweep; Stop() cancels it.
//==========================================================================================================
class NetworkPolicyEnforcer {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    struct Options {
        bool enableRateLimiting{true};
        bool enableConnectionLimiting{true};
        std::chrono::minutes clientSessionTimeout{60};
        std::chrono::milliseconds sweepInterval{std::chrono::seconds(300)};
        TimeSource now;  // defaults to steady_clock::now
    };

    explicit NetworkPolicyEnforcer(NetworkPolicy policy);
    NetworkPolicyEnforcer(NetworkPolicy policy, Options opts);
    ~NetworkPolicyEnforcer();

    NetworkPolicyEnforcer(const NetworkPolicyEnforcer&) = delete;
    NetworkPolicyEnforcer& operator=(const NetworkPolicyEnforcer&) = delete;

    //==========================================================================================================
    // ValidateAccess
    // Purpose: Decide whether a peer may talk to us at all.
    // Args:
    //   address: Peer IP address as text (IPv4 or IPv6).
    //   port: Local port the request arrived on; 0 when the transport has none.
    //   scheme: Transport scheme ("http", "https", "ws", "wss", "stdio", ...).
    // Returns:
    //   AccessDecision with the denial reason when rejected.
    //==========================================================================================================
    AccessDecision ValidateAccess(const std::string& address, std::uint16_t port, const std::string& scheme) const;

    // Sliding 60 s window; records the request when allowed.
    AccessDecision CheckRateLimit(const std::string& address);

    AccessDecision CheckConnectionLimit(const std::string& address) const;
    void RegisterConnection(const std::string& address);
    void UnregisterConnection(const std::string& address);

    void UpdatePolicy(NetworkPolicy policy);
    std::shared_ptr<const NetworkPolicy> Policy() const;

    /////////////////////////////////////////// Client sessions ///////////////////////////////////////////
    ClientSession CreateClientSession(const std::string& userId,
                                      const std::string& sessionId,
                                      const std::string& address,
                                      const std::string& userAgent = {},
                                      std::unordered_set<std::string> permissions = {});
    // Lazily expires; refreshes lastActivity on hit.
    std::optional<ClientSession> GetClientSession(const std::string& sessionId);
    // Refreshes activity and bumps the request counter; false when unknown.
    bool TouchClientSession(const std::string& sessionId);
    bool RevokeClientSession(const std::string& sessionId);
    std::size_t RevokeUserClientSessions(const std::string& userId);
    std::size_t RevokeAddressClientSessions(const std::string& address);

    // Drops idle rate windows, zero connection counters and expired client sessions.
    void Sweep();

    void Start();
    void Stop();

    JSONValue GetSecurityStats() const;

private:
    Clock::time_point now() const;
    bool removeClientSessionLocked(const std::string& sessionId);

    Options options;

    mutable std::mutex policyMutex;
    std::shared_ptr<const NetworkPolicy> policy;

    mutable std::mutex rateMutex;
    std::unordered_map<std::string, std::deque<Clock::time_point>> rateWindows;

    mutable std::mutex connectionMutex;
    std::unordered_map<std::string, std::size_t> activeConnections;

    mutable std::mutex sessionMutex;
    std::unordered_map<std::string, ClientSession> clientSessions;
    std::unordered_map<std::string, std::vector<std::string>> addressSessions;

    std::unique_ptr<PeriodicTask> sweeper;
};

} // namespace security
} // namespace mcplease
