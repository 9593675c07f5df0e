//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialScheme.h
// Purpose: Pluggable credential verification/issuance interface used by the session manager
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mcplease::auth {

//==========================================================================================================
// Identity
// Purpose: Authenticated principal produced by a credential scheme.
// Fields:
//   userId/username: Principal identifiers.
//   permissions: Granted permission names (e.g. "read", "tools/call").
//   attributes: Extra scheme-specific claims.
//==========================================================================================================
struct Identity {
    std::string userId;
    std::string username;
    std::unordered_set<std::string> permissions;
    std::unordered_map<std::string, std::string> attributes;
};

//==========================================================================================================
// Credentials
// Purpose: Material presented by a client. Schemes read `token`; other fields are kept in attributes.
//==========================================================================================================
struct Credentials {
    std::optional<std::string> token;
    std::unordered_map<std::string, std::string> attributes;
};

//==========================================================================================================
// IssuedCredentials
// Purpose: Token handed back to a principal.
// Fields:
//   tokenType: "jwt" for signed tokens, "simple" for server-held tokens.
//   expiresAt: Absolute expiry.
//   expiresIn: Lifetime from issue.
//==========================================================================================================
struct IssuedCredentials {
    std::string token;
    std::string tokenType;
    std::chrono::system_clock::time_point expiresAt;
    std::chrono::seconds expiresIn{0};
};

//==========================================================================================================
// ICredentialScheme
// Purpose: One way of turning credentials into an Identity.
// Notes:
//   - Authenticate returns nullopt on any rejection; it never throws for bad input.
//   - Implementations must be safe to call concurrently.
//==========================================================================================================
class ICredentialScheme {
public:
    virtual ~ICredentialScheme() = default;
    virtual std::string Name() const = 0;
    virtual std::optional<Identity> Authenticate(const Credentials& credentials) = 0;
    virtual IssuedCredentials Issue(const Identity& identity) = 0;
};

} // namespace mcplease::auth
