//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Crypto.h
// Purpose: Thin OpenSSL wrappers: secure random ids, SHA-256, HMAC-SHA256 and base64url
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mcplease {
namespace crypto {

//==========================================================================================================
// RandomBytes
// Purpose: Cryptographically secure random bytes from RAND_bytes.
// Throws:
//   errors::ResourceError when the OpenSSL generator cannot be seeded.
//==========================================================================================================
std::string RandomBytes(std::size_t count);

// Lowercase hex string of `hexChars` characters (rounded up to an even count of random bytes).
std::string RandomHex(std::size_t hexChars);

// URL-safe random token, base64url of `byteCount` random bytes without padding.
std::string RandomUrlSafeToken(std::size_t byteCount);

// Raw 32 byte SHA-256 digest.
std::string Sha256(const std::string& data);

// Raw 32 byte HMAC-SHA256.
std::string HmacSha256(const std::string& key, const std::string& data);

// Constant-time comparison (CRYPTO_memcmp); false when sizes differ.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

// Base64url (RFC 4648 §5) without padding.
std::string Base64UrlEncode(const std::string& data);

// Returns false for malformed input.
bool Base64UrlDecode(const std::string& text, std::string& out);

std::string ToHex(const std::string& bytes);

} // namespace crypto
} // namespace mcplease
