//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignedTokenScheme.cpp
// Purpose: HS256 JWT encode/verify over the OpenSSL crypto helpers
//==========================================================================================================

#include "mcplease/auth/SignedTokenScheme.h"

#include <algorithm>
#include <format>

#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/util/Crypto.h"

namespace mcplease::auth {

namespace {

constexpr const char* kHeaderJson = R"({"alg":"HS256","typ":"JWT"})";

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::optional<int64_t> numericClaim(const JSONValue& payload, const std::string& key) {
    const JSONValue* v = FindMember(payload, key);
    if (v == nullptr) return std::nullopt;
    if (auto i = std::get_if<int64_t>(&v->value)) return *i;
    if (auto d = std::get_if<double>(&v->value)) return static_cast<int64_t>(*d);
    return std::nullopt;
}

} // namespace

SignedTokenScheme::SignedTokenScheme() : SignedTokenScheme(Options{}) {}

SignedTokenScheme::SignedTokenScheme(Options opts) : options(std::move(opts)) {
    if (options.secret.empty()) {
        options.secret = crypto::RandomUrlSafeToken(32);
        LOG_WARN("No signing secret configured; generated an ephemeral one (tokens will not survive restart)");
    }
}

std::chrono::system_clock::time_point SignedTokenScheme::now() const {
    return options.now ? options.now() : std::chrono::system_clock::now();
}

IssuedCredentials SignedTokenScheme::Issue(const Identity& identity) {
    const auto issuedAt = now();
    const auto expiresAt = issuedAt + options.lifetime;

    std::vector<std::string> perms(identity.permissions.begin(), identity.permissions.end());
    std::sort(perms.begin(), perms.end());

    JSONValue payload{JSONValue::Object{}};
    SetMember(payload, "user_id", JSONValue(identity.userId));
    SetMember(payload, "username", JSONValue(identity.username));
    SetMember(payload, "permissions", MakeStringArray(perms));
    SetMember(payload, "iat", JSONValue(toEpochSeconds(issuedAt)));
    SetMember(payload, "exp", JSONValue(toEpochSeconds(expiresAt)));

    const std::string signingInput = std::format("{}.{}",
        crypto::Base64UrlEncode(kHeaderJson), crypto::Base64UrlEncode(SerializeJSON(payload)));
    const std::string signature = crypto::Base64UrlEncode(crypto::HmacSha256(options.secret, signingInput));

    IssuedCredentials out;
    out.token = std::format("{}.{}", signingInput, signature);
    out.tokenType = "jwt";
    out.expiresAt = expiresAt;
    out.expiresIn = options.lifetime;
    LOG_DEBUG("Issued signed token for user {}", identity.userId);
    return out;
}

std::optional<Identity> SignedTokenScheme::Authenticate(const Credentials& credentials) {
    if (!credentials.token.has_value() || credentials.token->empty()) {
        return std::nullopt;
    }
    const std::string& token = *credentials.token;

    const auto dot1 = token.find('.');
    const auto dot2 = dot1 == std::string::npos ? std::string::npos : token.find('.', dot1 + 1);
    if (dot2 == std::string::npos || token.find('.', dot2 + 1) != std::string::npos) {
        LOG_DEBUG("Signed token rejected: malformed");
        return std::nullopt;
    }
    const std::string signingInput = token.substr(0, dot2);

    std::string signature;
    if (!crypto::Base64UrlDecode(token.substr(dot2 + 1), signature) ||
        !crypto::ConstantTimeEquals(signature, crypto::HmacSha256(options.secret, signingInput))) {
        LOG_DEBUG("Signed token rejected: bad signature");
        return std::nullopt;
    }

    std::string headerJson;
    std::string payloadJson;
    if (!crypto::Base64UrlDecode(token.substr(0, dot1), headerJson) ||
        !crypto::Base64UrlDecode(token.substr(dot1 + 1, dot2 - dot1 - 1), payloadJson)) {
        return std::nullopt;
    }

    JSONValue header;
    JSONValue payload;
    try {
        header = ParseJSON(headerJson);
        payload = ParseJSON(payloadJson);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Signed token rejected: {}", e.what());
        return std::nullopt;
    }
    if (GetStringMember(header, "alg").value_or("") != "HS256" || !payload.IsObject()) {
        return std::nullopt;
    }

    const auto exp = numericClaim(payload, "exp");
    if (!exp.has_value() || *exp < toEpochSeconds(now())) {
        LOG_DEBUG("Signed token rejected: expired");
        return std::nullopt;
    }

    Identity id;
    id.userId = GetStringMember(payload, "user_id").value_or("");
    if (id.userId.empty()) {
        return std::nullopt;
    }
    id.username = GetStringMember(payload, "username").value_or(id.userId);
    if (const JSONValue* perms = FindMember(payload, "permissions")) {
        if (auto arr = std::get_if<JSONValue::Array>(&perms->value)) {
            for (const auto& p : *arr) {
                if (p && p->IsString()) id.permissions.insert(std::get<std::string>(p->value));
            }
        }
    }
    if (auto iat = numericClaim(payload, "iat")) {
        id.attributes["issued_at"] = std::to_string(*iat);
    }
    id.attributes["expires_at"] = std::to_string(*exp);
    return id;
}

} // namespace mcplease::auth
