//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignedTokenScheme.h
// Purpose: Self-describing HS256 JWT credentials (not individually revocable)
//==========================================================================================================

#pragma once

#include <functional>

#include "mcplease/auth/CredentialScheme.h"

namespace mcplease::auth {

class SignedTokenScheme : public ICredentialScheme {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::string secret;  // generated when empty
        std::chrono::seconds lifetime{std::chrono::hours(24)};
        TimeSource now;
    };

    SignedTokenScheme();
    explicit SignedTokenScheme(Options opts);

    std::string Name() const override { return "signed-token"; }

    //==========================================================================================================
    // Authenticate
    // Purpose: Verify header alg, HMAC-SHA256 signature (constant time) and exp claim.
    // Returns:
    //   Identity built from user_id, username and permissions claims; nullopt when invalid or expired.
    //==========================================================================================================
    std::optional<Identity> Authenticate(const Credentials& credentials) override;

    // Encodes {user_id, username, permissions, iat, exp} and signs it.
    IssuedCredentials Issue(const Identity& identity) override;

private:
    std::chrono::system_clock::time_point now() const;

    Options options;
};

} // namespace mcplease::auth
