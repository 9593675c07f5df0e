//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Crypto.cpp
// Purpose: OpenSSL-backed implementations of the crypto helpers
//==========================================================================================================

#include "mcplease/util/Crypto.h"

#include <algorithm>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "mcplease/errors/Errors.h"

namespace mcplease {
namespace crypto {

std::string RandomBytes(std::size_t count) {
    std::string out(count, '\0');
    if (count == 0) {
        return out;
    }
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        throw errors::ResourceError("RAND_bytes failed: secure random generator unavailable");
    }
    return out;
}

std::string ToHex(const std::string& bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0F]);
    }
    return out;
}

std::string RandomHex(std::size_t hexChars) {
    std::string hex = ToHex(RandomBytes((hexChars + 1) / 2));
    hex.resize(hexChars);
    return hex;
}

std::string RandomUrlSafeToken(std::size_t byteCount) {
    return Base64UrlEncode(RandomBytes(byteCount));
}

std::string Sha256(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (::EVP_Digest(data.data(), data.size(), digest, &len, ::EVP_sha256(), nullptr) != 1) {
        throw errors::ResourceError("EVP_Digest(sha256) failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string HmacSha256(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    const unsigned char* res = ::HMAC(::EVP_sha256(),
                                      key.data(), static_cast<int>(key.size()),
                                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                      mac, &len);
    if (res == nullptr) {
        throw errors::ResourceError("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(mac), len);
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Base64UrlEncode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    std::string out(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

bool Base64UrlDecode(const std::string& text, std::string& out) {
    out.clear();
    if (text.empty()) {
        return true;
    }
    if (text.size() % 4 == 1) {
        return false;
    }
    std::string b64 = text;
    for (char& c : b64) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return false;
    }
    std::size_t padding = 0;
    while (b64.size() % 4 != 0) {
        b64.push_back('=');
        ++padding;
    }
    std::vector<unsigned char> buf(3 * (b64.size() / 4) + 1);
    int n = ::EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(b64.data()),
                              static_cast<int>(b64.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return false;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.assign(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n) - padding);
    return true;
}

} // namespace crypto
} // namespace mcplease
