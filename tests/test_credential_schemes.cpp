//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_credential_schemes.cpp
// Purpose: GoogleTests for the signed (HS256) and stored token credential schemes
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/auth/SignedTokenScheme.h"
#include "mcplease/auth/StoredTokenScheme.h"
#include "mcplease/util/Crypto.h"

using namespace mcplease;
using namespace mcplease::auth;
using namespace std::chrono_literals;

namespace {

struct ManualClock {
    std::shared_ptr<std::chrono::system_clock::time_point> t =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::now());
    std::function<std::chrono::system_clock::time_point()> source() const {
        auto p = t;
        return [p]() { return *p; };
    }
    void advance(std::chrono::seconds s) { *t += s; }
};

Identity alice() {
    Identity id;
    id.userId = "alice";
    id.username = "Alice";
    id.permissions = {"tools/list", "read"};
    return id;
}

Credentials bearer(const std::string& token) {
    Credentials c;
    c.token = token;
    return c;
}

} // namespace

TEST(SignedTokenScheme, IssueThenAuthenticate) {
    SignedTokenScheme::Options o;
    o.secret = "s3cret";
    o.lifetime = 1h;
    SignedTokenScheme scheme(o);

    const IssuedCredentials issued = scheme.Issue(alice());
    EXPECT_EQ(issued.tokenType, "jwt");
    EXPECT_EQ(issued.expiresIn, std::chrono::seconds(3600));

    auto id = scheme.Authenticate(bearer(issued.token));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->userId, "alice");
    EXPECT_EQ(id->username, "Alice");
    EXPECT_EQ(id->permissions.size(), 2u);
    EXPECT_EQ(id->permissions.count("tools/list"), 1u);
    EXPECT_EQ(id->attributes.count("issued_at"), 1u);
    EXPECT_EQ(id->attributes.count("expires_at"), 1u);
}

//==========================================================================================================
// Payload is base64url JSON with sorted permissions; the header names HS256.
//==========================================================================================================
TEST(SignedTokenScheme, TokenLayout) {
    SignedTokenScheme::Options o;
    o.secret = "s3cret";
    SignedTokenScheme scheme(o);
    const std::string token = scheme.Issue(alice()).token;

    const auto dot1 = token.find('.');
    const auto dot2 = token.find('.', dot1 + 1);
    ASSERT_NE(dot2, std::string::npos);
    std::string header;
    std::string payload;
    ASSERT_TRUE(crypto::Base64UrlDecode(token.substr(0, dot1), header));
    ASSERT_TRUE(crypto::Base64UrlDecode(token.substr(dot1 + 1, dot2 - dot1 - 1), payload));
    EXPECT_EQ(GetStringMember(ParseJSON(header), "alg").value_or(""), "HS256");
    const JSONValue claims = ParseJSON(payload);
    EXPECT_EQ(GetStringMember(claims, "user_id").value_or(""), "alice");
    const auto& perms = std::get<JSONValue::Array>(FindMember(claims, "permissions")->value);
    ASSERT_EQ(perms.size(), 2u);
    EXPECT_EQ(std::get<std::string>(perms[0]->value), "read");
    EXPECT_EQ(std::get<std::string>(perms[1]->value), "tools/list");
    EXPECT_GT(GetIntMember(claims, "exp").value_or(0), GetIntMember(claims, "iat").value_or(0));
}

TEST(SignedTokenScheme, RejectsTamperedAndForeignTokens) {
    SignedTokenScheme::Options o;
    o.secret = "s3cret";
    SignedTokenScheme scheme(o);
    std::string token = scheme.Issue(alice()).token;

    std::string tampered = token;
    const auto dot1 = tampered.find('.');
    tampered[dot1 + 2] = tampered[dot1 + 2] == 'A' ? 'B' : 'A';
    EXPECT_FALSE(scheme.Authenticate(bearer(tampered)).has_value());

    SignedTokenScheme::Options other;
    other.secret = "different";
    SignedTokenScheme foreign(other);
    EXPECT_FALSE(scheme.Authenticate(bearer(foreign.Issue(alice()).token)).has_value());

    EXPECT_FALSE(scheme.Authenticate(bearer("not.a.jwt.at.all")).has_value());
    EXPECT_FALSE(scheme.Authenticate(bearer("onlyonepart")).has_value());
    EXPECT_FALSE(scheme.Authenticate(Credentials{}).has_value());
}

TEST(SignedTokenScheme, RejectsExpiredToken) {
    ManualClock clock;
    SignedTokenScheme::Options o;
    o.secret = "s3cret";
    o.lifetime = 1h;
    o.now = clock.source();
    SignedTokenScheme scheme(o);
    const std::string token = scheme.Issue(alice()).token;

    clock.advance(59min);
    EXPECT_TRUE(scheme.Authenticate(bearer(token)).has_value());
    clock.advance(2min);
    EXPECT_FALSE(scheme.Authenticate(bearer(token)).has_value());
}

TEST(SignedTokenScheme, RejectsEmptyUserId) {
    SignedTokenScheme::Options o;
    o.secret = "s3cret";
    SignedTokenScheme scheme(o);
    Identity nobody;
    EXPECT_FALSE(scheme.Authenticate(bearer(scheme.Issue(nobody).token)).has_value());
}

TEST(SignedTokenScheme, GeneratedSecretsDiffer) {
    SignedTokenScheme a;
    SignedTokenScheme b;
    EXPECT_TRUE(a.Authenticate(bearer(a.Issue(alice()).token)).has_value());
    EXPECT_FALSE(b.Authenticate(bearer(a.Issue(alice()).token)).has_value());
}

TEST(StoredTokenScheme, IssueAuthenticateRevoke) {
    StoredTokenScheme scheme;
    const IssuedCredentials issued = scheme.Issue(alice());
    EXPECT_EQ(issued.tokenType, "simple");
    EXPECT_EQ(scheme.Size(), 1u);

    auto id = scheme.Authenticate(bearer(issued.token));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->userId, "alice");
    EXPECT_FALSE(scheme.Authenticate(bearer("unknown")).has_value());

    EXPECT_TRUE(scheme.Revoke(issued.token));
    EXPECT_FALSE(scheme.Revoke(issued.token));
    EXPECT_FALSE(scheme.Authenticate(bearer(issued.token)).has_value());
}

TEST(StoredTokenScheme, ExpiredTokensAreCleanedUp) {
    ManualClock clock;
    StoredTokenScheme::Options o;
    o.lifetime = 1h;
    o.now = clock.source();
    StoredTokenScheme scheme(o);

    const std::string early = scheme.Issue(alice()).token;
    clock.advance(30min);
    const std::string late = scheme.Issue(alice()).token;
    clock.advance(45min);

    EXPECT_EQ(scheme.CleanupExpired(), 1u);
    EXPECT_EQ(scheme.Size(), 1u);
    EXPECT_FALSE(scheme.Authenticate(bearer(early)).has_value());
    EXPECT_TRUE(scheme.Authenticate(bearer(late)).has_value());

    clock.advance(1h);
    EXPECT_FALSE(scheme.Authenticate(bearer(late)).has_value());
    EXPECT_EQ(scheme.Size(), 0u);
}
