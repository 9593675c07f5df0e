//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkPolicy.h
// Purpose: Network access policy (address/range allow and block lists, ports, rate and connection caps)
//==========================================================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/ip/address.hpp>

namespace mcplease {
namespace security {

//==========================================================================================================
// IpNetwork
// Purpose: Parsed CIDR range (IPv4 or IPv6). A bare address parses as a host range (/32 or /128).
//==========================================================================================================
struct IpNetwork {
    boost::asio::ip::address base;
    unsigned prefixLength{0};
    std::string text;  // canonical "addr/prefix"

    // Returns nullopt when `cidr` is not a valid address or range.
    static std::optional<IpNetwork> Parse(const std::string& cidr);

    bool Contains(const boost::asio::ip::address& addr) const;
};

// Parses an address, unwrapping IPv4-mapped IPv6 (::ffff:a.b.c.d) to IPv4.
std::optional<boost::asio::ip::address> ParseAddress(const std::string& text);

//==========================================================================================================
// NetworkPolicy
// Purpose: Immutable-after-publish rule set consulted by NetworkPolicyEnforcer.
// Fields:
//   allowedAddresses/blockedAddresses: Single addresses in canonical text form.
//   allowedNetworks/blockedNetworks: CIDR ranges.
//   allowedPorts: Accepted local ports; empty means any port.
//   rateLimitPerAddress: Requests per trailing minute per address.
//   maxConnectionsPerAddress: Concurrent connections per address.
//   requireTls: Reject plain-text schemes (http, ws).
//==========================================================================================================
struct NetworkPolicy {
    std::unordered_set<std::string> allowedAddresses;
    std::unordered_set<std::string> blockedAddresses;
    std::vector<IpNetwork> allowedNetworks;
    std::vector<IpNetwork> blockedNetworks;
    std::set<std::uint16_t> allowedPorts{8000, 8001};
    std::size_t rateLimitPerAddress{100};
    std::size_t maxConnectionsPerAddress{10};
    bool requireTls{false};

    // Mutators used while building a policy. Throw errors::ConfigurationError on malformed input.
    void AllowAddress(const std::string& address);
    void BlockAddress(const std::string& address);
    void AllowNetwork(const std::string& cidr);
    void BlockNetwork(const std::string& cidr);

    bool HasAllowList() const { return !allowedAddresses.empty() || !allowedNetworks.empty(); }

    // Local development profile: private ranges and loopback, ports 8000/8001/4040.
    static NetworkPolicy DefaultPolicy();
    // Hardened profile: TLS required, tighter rate and connection caps.
    static NetworkPolicy ProductionPolicy();
};

} // namespace security
} // namespace mcplease
