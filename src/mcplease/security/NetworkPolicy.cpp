//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkPolicy.cpp
// Purpose: CIDR parsing/matching over boost::asio::ip and the built-in policy profiles
//==========================================================================================================

#include "mcplease/security/NetworkPolicy.h"

#include <charconv>
#include <format>

#include "mcplease/errors/Errors.h"

namespace mcplease {
namespace security {

namespace ip = boost::asio::ip;

namespace {

template <typename Bytes>
bool prefixEquals(const Bytes& a, const Bytes& b, unsigned prefixLength) {
    unsigned fullBytes = prefixLength / 8;
    unsigned remBits = prefixLength % 8;
    for (unsigned i = 0; i < fullBytes; ++i) {
        if (a[i] != b[i]) return false;
    }
    if (remBits == 0) return true;
    const unsigned char mask = static_cast<unsigned char>(0xFF << (8 - remBits));
    return (a[fullBytes] & mask) == (b[fullBytes] & mask);
}

template <typename Bytes>
void maskBytes(Bytes& bytes, unsigned prefixLength) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const unsigned bitStart = static_cast<unsigned>(i) * 8;
        if (bitStart >= prefixLength) {
            bytes[i] = 0;
        } else if (prefixLength - bitStart < 8) {
            bytes[i] &= static_cast<unsigned char>(0xFF << (8 - (prefixLength - bitStart)));
        }
    }
}

} // namespace

std::optional<ip::address> ParseAddress(const std::string& text) {
    boost::system::error_code ec;
    ip::address addr = ip::make_address(text, ec);
    if (ec) {
        return std::nullopt;
    }
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return ip::address(ip::make_address_v4(ip::v4_mapped, addr.to_v6()));
    }
    return addr;
}

std::optional<IpNetwork> IpNetwork::Parse(const std::string& cidr) {
    const auto slash = cidr.find('/');
    auto addr = ParseAddress(cidr.substr(0, slash));
    if (!addr.has_value()) {
        return std::nullopt;
    }
    const unsigned maxPrefix = addr->is_v4() ? 32u : 128u;
    unsigned prefix = maxPrefix;
    if (slash != std::string::npos) {
        const std::string p = cidr.substr(slash + 1);
        auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), prefix);
        if (p.empty() || ec != std::errc{} || ptr != p.data() + p.size() || prefix > maxPrefix) {
            return std::nullopt;
        }
    }

    IpNetwork net;
    net.prefixLength = prefix;
    if (addr->is_v4()) {
        auto bytes = addr->to_v4().to_bytes();
        maskBytes(bytes, prefix);
        net.base = ip::address_v4(bytes);
    } else {
        auto bytes = addr->to_v6().to_bytes();
        maskBytes(bytes, prefix);
        net.base = ip::address_v6(bytes);
    }
    net.text = std::format("{}/{}", net.base.to_string(), prefix);
    return net;
}

bool IpNetwork::Contains(const ip::address& addr) const {
    if (addr.is_v4() && base.is_v4()) {
        return prefixEquals(addr.to_v4().to_bytes(), base.to_v4().to_bytes(), prefixLength);
    }
    if (addr.is_v6() && base.is_v6()) {
        return prefixEquals(addr.to_v6().to_bytes(), base.to_v6().to_bytes(), prefixLength);
    }
    return false;
}

/////////////////////////////////////////// NetworkPolicy ///////////////////////////////////////////

void NetworkPolicy::AllowAddress(const std::string& address) {
    auto addr = ParseAddress(address);
    if (!addr.has_value()) {
        throw errors::ConfigurationError(std::format("Invalid allowed address: {}", address));
    }
    allowedAddresses.insert(addr->to_string());
}

void NetworkPolicy::BlockAddress(const std::string& address) {
    auto addr = ParseAddress(address);
    if (!addr.has_value()) {
        throw errors::ConfigurationError(std::format("Invalid blocked address: {}", address));
    }
    blockedAddresses.insert(addr->to_string());
}

void NetworkPolicy::AllowNetwork(const std::string& cidr) {
    auto net = IpNetwork::Parse(cidr);
    if (!net.has_value()) {
        throw errors::ConfigurationError(std::format("Invalid allowed network: {}", cidr));
    }
    allowedNetworks.push_back(std::move(*net));
}

void NetworkPolicy::BlockNetwork(const std::string& cidr) {
    auto net = IpNetwork::Parse(cidr);
    if (!net.has_value()) {
        throw errors::ConfigurationError(std::format("Invalid blocked network: {}", cidr));
    }
    blockedNetworks.push_back(std::move(*net));
}

NetworkPolicy NetworkPolicy::DefaultPolicy() {
    NetworkPolicy p;
    p.AllowNetwork("127.0.0.0/8");
    p.AllowNetwork("10.0.0.0/8");
    p.AllowNetwork("172.16.0.0/12");
    p.AllowNetwork("192.168.0.0/16");
    p.AllowAddress("::1");
    p.allowedPorts = {8000, 8001, 4040};
    p.rateLimitPerAddress = 100;
    p.maxConnectionsPerAddress = 10;
    p.requireTls = false;
    return p;
}

NetworkPolicy NetworkPolicy::ProductionPolicy() {
    NetworkPolicy p;
    p.rateLimitPerAddress = 50;
    p.maxConnectionsPerAddress = 5;
    p.requireTls = true;
    return p;
}

} // namespace security
} // namespace mcplease
