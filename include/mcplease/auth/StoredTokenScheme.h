//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StoredTokenScheme.h
// Purpose: Opaque random tokens held server-side with their identity and expiry
//==========================================================================================================

#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>

#include "mcplease/auth/CredentialScheme.h"

namespace mcplease::auth {

class StoredTokenScheme : public ICredentialScheme {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::chrono::seconds lifetime{std::chrono::hours(24)};
        TimeSource now;
    };

    StoredTokenScheme();
    explicit StoredTokenScheme(Options opts);

    std::string Name() const override { return "stored-token"; }

    // Expired tokens are removed on lookup.
    std::optional<Identity> Authenticate(const Credentials& credentials) override;
    IssuedCredentials Issue(const Identity& identity) override;

    bool Revoke(const std::string& token);
    std::size_t CleanupExpired();
    std::size_t Size() const;

private:
    struct Record {
        Identity identity;
        std::chrono::system_clock::time_point createdAt;
        std::chrono::system_clock::time_point expiresAt;
    };

    std::chrono::system_clock::time_point now() const;

    Options options;
    mutable std::mutex mtx;
    std::unordered_map<std::string, Record> tokens;
};

} // namespace mcplease::auth
