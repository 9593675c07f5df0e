//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: SessionManager implementation
//==========================================================================================================

#include "mcplease/security/SessionManager.h"

#include <format>

#include "logging/Logger.h"
#include "mcplease/auth/StoredTokenScheme.h"
#include "mcplease/util/Crypto.h"

namespace mcplease {
namespace security {

namespace {

int64_t epochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const std::unordered_set<std::string>& AnonymousPermissions() {
    static const std::unordered_set<std::string> perms{"read", "tools/call", "tools/list"};
    return perms;
}

SessionManager::SessionManager() : SessionManager(Options{}) {}

SessionManager::SessionManager(Options opts, std::vector<std::shared_ptr<auth::ICredentialScheme>> s)
    : options(std::move(opts)), schemes(std::move(s)) {
    if (options.requireAuth && schemes.empty()) {
        LOG_INFO("Authentication required with no scheme configured; using stored tokens");
        schemes.push_back(std::make_shared<auth::StoredTokenScheme>());
    }
}

SessionManager::~SessionManager() {
    Stop();
}

std::chrono::system_clock::time_point SessionManager::now() const {
    return options.now ? options.now() : std::chrono::system_clock::now();
}

bool SessionManager::expired(const SecuritySession& s, std::chrono::system_clock::time_point t) const {
    return t - s.lastActivity > options.sessionTimeout;
}

std::optional<SecuritySession> SessionManager::Authenticate(const std::optional<auth::Credentials>& credentials,
                                                            const ClientInfo& client) {
    const auto t = now();
    SecuritySession session;
    session.authenticatedAt = t;
    session.lastActivity = t;
    session.client = client;

    if (!options.requireAuth) {
        session.sessionId = std::format("anon_{}_{}", crypto::RandomHex(8), epochMillis(t));
        session.userInfo["user_id"] = "anonymous";
        session.userInfo["username"] = "anonymous";
        session.permissions = AnonymousPermissions();
        session.anonymous = true;
        {
            std::lock_guard<std::mutex> lock(mtx);
            sessions[session.sessionId] = session;
        }
        LOG_DEBUG("Created anonymous session: {}", session.sessionId);
        return session;
    }

    if (!credentials.has_value()) {
        LOG_DEBUG("Authentication required but no credentials provided");
        return std::nullopt;
    }

    for (const auto& scheme : schemes) {
        std::optional<auth::Identity> identity;
        try {
            identity = scheme->Authenticate(*credentials);
        } catch (const std::exception& e) {
            LOG_WARN("Authentication error with {}: {}", scheme->Name(), e.what());
            continue;
        }
        if (!identity.has_value()) {
            continue;
        }
        const std::string userId = identity->userId.empty() ? std::string("unknown") : identity->userId;
        session.sessionId = std::format("auth_{}_{}_{}", userId, crypto::RandomHex(8), epochMillis(t));
        session.userInfo = identity->attributes;
        session.userInfo["user_id"] = userId;
        session.userInfo["username"] = identity->username.empty() ? userId : identity->username;
        session.userInfo["scheme"] = scheme->Name();
        session.permissions = identity->permissions;
        {
            std::lock_guard<std::mutex> lock(mtx);
            sessions[session.sessionId] = session;
        }
        LOG_INFO("Authenticated user {} with session {}", userId, session.sessionId);
        return session;
    }

    LOG_DEBUG("Authentication failed with all schemes");
    return std::nullopt;
}

std::optional<SecuritySession> SessionManager::Validate(const std::string& sessionId) {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    if (expired(it->second, t)) {
        sessions.erase(it);
        LOG_DEBUG("Session {} expired and removed", sessionId);
        return std::nullopt;
    }
    it->second.lastActivity = t;
    return it->second;
}

bool SessionManager::Revoke(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mtx);
    if (sessions.erase(sessionId) == 0) {
        return false;
    }
    LOG_INFO("Revoked session: {}", sessionId);
    return true;
}

std::size_t SessionManager::RevokeUserSessions(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mtx);
    const std::size_t n = std::erase_if(sessions, [&](const auto& kv) { return kv.second.UserId() == userId; });
    LOG_INFO("Revoked {} sessions for user {}", n, userId);
    return n;
}

std::size_t SessionManager::RevokeAddressSessions(const std::string& address) {
    std::lock_guard<std::mutex> lock(mtx);
    const std::size_t n = std::erase_if(sessions, [&](const auto& kv) { return kv.second.client.address == address; });
    LOG_INFO("Revoked {} sessions from {}", n, address);
    return n;
}

bool SessionManager::CheckPermission(const std::string& sessionId, const std::string& permission) {
    auto session = Validate(sessionId);
    if (!session.has_value()) {
        return false;
    }
    if (session->anonymous) {
        return AnonymousPermissions().count(permission) != 0;
    }
    return session->permissions.count(permission) != 0;
}

std::size_t SessionManager::SweepExpired() {
    const auto t = now();
    std::size_t n = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        n = std::erase_if(sessions, [&](const auto& kv) { return expired(kv.second, t); });
    }
    for (const auto& scheme : schemes) {
        if (auto stored = std::dynamic_pointer_cast<auth::StoredTokenScheme>(scheme)) {
            stored->CleanupExpired();
        }
    }
    if (n > 0) {
        LOG_INFO("Cleaned up {} expired sessions", n);
    }
    return n;
}

std::vector<SecuritySession> SessionManager::ListSessions() const {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<SecuritySession> out;
    out.reserve(sessions.size());
    for (const auto& [id, s] : sessions) {
        if (!expired(s, t)) out.push_back(s);
    }
    return out;
}

JSONValue SessionManager::GetSessionStats() const {
    std::size_t total = 0;
    std::size_t authenticated = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        total = sessions.size();
        for (const auto& [id, s] : sessions) {
            if (!s.anonymous) ++authenticated;
        }
    }
    JSONValue stats{JSONValue::Object{}};
    SetMember(stats, "total_sessions", JSONValue(static_cast<int64_t>(total)));
    SetMember(stats, "authenticated_sessions", JSONValue(static_cast<int64_t>(authenticated)));
    SetMember(stats, "anonymous_sessions", JSONValue(static_cast<int64_t>(total - authenticated)));
    SetMember(stats, "session_timeout_minutes", JSONValue(static_cast<int64_t>(options.sessionTimeout.count())));
    SetMember(stats, "auth_required", JSONValue(options.requireAuth));
    SetMember(stats, "scheme_count", JSONValue(static_cast<int64_t>(schemes.size())));
    return stats;
}

void SessionManager::Start() {
    if (!sweeper) {
        sweeper = std::make_unique<PeriodicTask>("session-sweep", options.sweepInterval, [this] { SweepExpired(); });
    }
    sweeper->Start();
}

void SessionManager::Stop() {
    if (sweeper) {
        sweeper->Stop();
    }
}

} // namespace security
} // namespace mcplease
