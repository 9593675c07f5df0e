//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Authenticated/anonymous security sessions, permission checks and timeout sweeping
//==========================================================================================================
#pragma once

#include <chrono>
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
#include "mcplease/auth/CredentialScheme.h"

namespace mcplease {
namespace security {

//==========================================================================================================
// ClientInfo
// Purpose: Who is calling, as seen by the transport and the client's own clientInfo params.
//==========================================================================================================
struct ClientInfo {
    std::string address;
    std::string userAgent;
    std::unordered_map<std::string, std::string> attributes;
};

//==========================================================================================================
// SecuritySession
// Purpose: Snapshot of an authenticated (or anonymous) caller.
// Fields:
//   userInfo: At least user_id and username.
//   anonymous: True when created without credentials (auth not required).
//==========================================================================================================
struct SecuritySession {
    std::string sessionId;
    std::unordered_map<std::string, std::string> userInfo;
    std::unordered_set<std::string> permissions;
    std::chrono::system_clock::time_point authenticatedAt;
    std::chrono::system_clock::time_point lastActivity;
    ClientInfo client;
    bool anonymous{false};

    std::string UserId() const {
        auto it = userInfo.find("user_id");
        return it == userInfo.end() ? std::string{} : it->second;
    }
};

// Permissions every anonymous session holds.
const std::unordered_set<std::string>& AnonymousPermissions();

//==========================================================================================================
// SessionManager
// Purpose: Owns the session table and the ordered list of credential schemes.
// Notes:
//   - A session is expired once now - lastActivity exceeds the timeout; expiry is checked on every
//     access and by the periodic sweep.
//   - When auth is required and no scheme is supplied, a StoredTokenScheme is installed.
//==========================================================================================================
class SessionManager {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        bool requireAuth{false};
        std::chrono::minutes sessionTimeout{60};
        std::chrono::milliseconds sweepInterval{std::chrono::seconds(300)};
        TimeSource now;
    };

    SessionManager();
    explicit SessionManager(Options opts,
                            std::vector<std::shared_ptr<auth::ICredentialScheme>> schemes = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //==========================================================================================================
    // Authenticate
    // Purpose: Create a session for a caller.
    // Args:
    //   credentials: Presented credentials (ignored when auth is not required).
    //   client: Transport/client description stored with the session.
    // Returns:
    //   New session; nullopt when auth is required and no scheme accepts the credentials.
    //==========================================================================================================
    std::optional<SecuritySession> Authenticate(const std::optional<auth::Credentials>& credentials,
                                                const ClientInfo& client);

    // Refreshes lastActivity; evicts and returns nullopt when expired.
    std::optional<SecuritySession> Validate(const std::string& sessionId);

    bool Revoke(const std::string& sessionId);
    std::size_t RevokeUserSessions(const std::string& userId);
    std::size_t RevokeAddressSessions(const std::string& address);

    bool CheckPermission(const std::string& sessionId, const std::string& permission);

    std::size_t SweepExpired();
    std::vector<SecuritySession> ListSessions() const;
    JSONValue GetSessionStats() const;

    bool RequiresAuth() const { return options.requireAuth; }
    const std::vector<std::shared_ptr<auth::ICredentialScheme>>& Schemes() const { return schemes; }

    void Start();
    void Stop();

private:
    std::chrono::system_clock::time_point now() const;
    bool expired(const SecuritySession& s, std::chrono::system_clock::time_point t) const;

    Options options;
    std::vector<std::shared_ptr<auth::ICredentialScheme>> schemes;

    mutable std::mutex mtx;
    std::unordered_map<std::string, SecuritySession> sessions;

    std::unique_ptr<PeriodicTask> sweeper;
};

} // namespace security
} // namespace mcplease
