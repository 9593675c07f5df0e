//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StoredTokenScheme.cpp
// Purpose: Server-held opaque token store
//==========================================================================================================

#include "mcplease/auth/StoredTokenScheme.h"

#include "logging/Logger.h"
#include "mcplease/util/Crypto.h"

namespace mcplease::auth {

StoredTokenScheme::StoredTokenScheme() : StoredTokenScheme(Options{}) {}

StoredTokenScheme::StoredTokenScheme(Options opts) : options(std::move(opts)) {}

std::chrono::system_clock::time_point StoredTokenScheme::now() const {
    return options.now ? options.now() : std::chrono::system_clock::now();
}

IssuedCredentials StoredTokenScheme::Issue(const Identity& identity) {
    Record rec;
    rec.identity = identity;
    rec.createdAt = now();
    rec.expiresAt = rec.createdAt + options.lifetime;

    IssuedCredentials out;
    out.token = crypto::RandomUrlSafeToken(32);
    out.tokenType = "simple";
    out.expiresAt = rec.expiresAt;
    out.expiresIn = options.lifetime;

    std::lock_guard<std::mutex> lock(mtx);
    tokens[out.token] = std::move(rec);
    return out;
}

std::optional<Identity> StoredTokenScheme::Authenticate(const Credentials& credentials) {
    if (!credentials.token.has_value() || credentials.token->empty()) {
        return std::nullopt;
    }
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tokens.find(*credentials.token);
    if (it == tokens.end()) {
        return std::nullopt;
    }
    if (it->second.expiresAt < t) {
        tokens.erase(it);
        LOG_DEBUG("Stored token expired");
        return std::nullopt;
    }
    return it->second.identity;
}

bool StoredTokenScheme::Revoke(const std::string& token) {
    std::lock_guard<std::mutex> lock(mtx);
    if (tokens.erase(token) == 0) {
        return false;
    }
    LOG_INFO("Revoked stored token");
    return true;
}

std::size_t StoredTokenScheme::CleanupExpired() {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    const std::size_t removed = std::erase_if(tokens, [&](const auto& kv) { return kv.second.expiresAt < t; });
    if (removed > 0) {
        LOG_INFO("Cleaned up {} expired tokens", removed);
    }
    return removed;
}

std::size_t StoredTokenScheme::Size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tokens.size();
}

} // namespace mcplease::auth
