/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file keyed_hash.hpp
 * @brief AnonBench Library - KeyedHash and key sequence implementations
 */

#include "keyed_hash.h"
#include "errors.h"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <utility>

namespace anonbench {

    inline std::string opensslErrorString(const char* fallback) {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return fallback;
        }
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        return std::string(fallback) + ": " + buf;
    }

    // ========================================================================
    // KeyedHash Implementation
    // ========================================================================

    inline KeyedHash::KeyedHash(std::string_view key) {
        mac_ = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
        if (!mac_) {
            throw CryptoError(opensslErrorString("Failed to fetch HMAC"));
        }
        ctx_ = EVP_MAC_CTX_new(mac_);
        if (!ctx_) {
            release();
            throw CryptoError(opensslErrorString("Failed to create HMAC context"));
        }

        char digestName[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName, 0),
            OSSL_PARAM_construct_end()
        };
        // HMAC accepts an empty key, but OpenSSL wants a non-null pointer for it
        static const unsigned char empty = 0;
        const unsigned char* keyData = key.empty() ? &empty : reinterpret_cast<const unsigned char*>(key.data());
        if (!EVP_MAC_init(ctx_, keyData, key.size(), params)) {
            release();
            throw CryptoError(opensslErrorString("Failed to initialize HMAC-SHA256"));
        }
    }

    inline KeyedHash::~KeyedHash() {
        release();
    }

    inline KeyedHash::KeyedHash(KeyedHash&& other) noexcept
        : mac_(other.mac_), ctx_(other.ctx_)
    {
        other.mac_ = nullptr;
        other.ctx_ = nullptr;
    }

    inline KeyedHash& KeyedHash::operator=(KeyedHash&& other) noexcept {
        if (this != &other) {
            release();
            mac_ = std::exchange(other.mac_, nullptr);
            ctx_ = std::exchange(other.ctx_, nullptr);
        }
        return *this;
    }

    inline void KeyedHash::release() noexcept {
        if (ctx_) {
            EVP_MAC_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        if (mac_) {
            EVP_MAC_free(mac_);
            mac_ = nullptr;
        }
    }

    inline KeyedHash::Digest KeyedHash::digest(std::string_view message) {
        return digest(std::string_view{}, message);
    }

    inline KeyedHash::Digest KeyedHash::digest(std::string_view prefix, std::string_view message) {
        // Re-initializing with a null key resets the context and keeps the key
        if (!EVP_MAC_init(ctx_, nullptr, 0, nullptr)) {
            throw CryptoError(opensslErrorString("Failed to reset HMAC context"));
        }
        if (!prefix.empty() &&
            !EVP_MAC_update(ctx_, reinterpret_cast<const unsigned char*>(prefix.data()), prefix.size())) {
            throw CryptoError(opensslErrorString("HMAC update failed"));
        }
        if (!message.empty() &&
            !EVP_MAC_update(ctx_, reinterpret_cast<const unsigned char*>(message.data()), message.size())) {
            throw CryptoError(opensslErrorString("HMAC update failed"));
        }

        Digest out{};
        size_t outLen = 0;
        if (!EVP_MAC_final(ctx_, out.data(), &outLen, out.size()) || outLen != DIGEST_SIZE) {
            throw CryptoError(opensslErrorString("HMAC finalization failed"));
        }
        return out;
    }

    // ========================================================================
    // Key sequences
    // ========================================================================

    inline std::vector<uint8_t> keySequence(std::string_view key, HashAlgorithm algorithm, size_t length) {
        const EVP_MD* md = (algorithm == HashAlgorithm::SHA256) ? EVP_sha256() : EVP_sha512();
        if (!md) {
            throw CryptoError(opensslErrorString("Digest algorithm unavailable"));
        }

        std::vector<uint8_t> result;
        result.reserve(length + EVP_MAX_MD_SIZE);

        std::vector<uint8_t> current(key.begin(), key.end());
        std::vector<uint8_t> input;
        unsigned char hash[EVP_MAX_MD_SIZE];

        while (result.size() < length) {
            input = current;
            input.insert(input.end(), key.begin(), key.end());

            unsigned int hashLen = 0;
            if (!EVP_Digest(input.data(), input.size(), hash, &hashLen, md, nullptr)) {
                throw CryptoError(opensslErrorString("Failed to hash key sequence"));
            }
            current.assign(hash, hash + hashLen);
            result.insert(result.end(), hash, hash + hashLen);
        }

        result.resize(length);
        return result;
    }

    inline std::string toHex(const uint8_t* data, size_t length) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(length * 2);
        for (size_t i = 0; i < length; ++i) {
            hex.push_back(digits[data[i] >> 4]);
            hex.push_back(digits[data[i] & 0x0F]);
        }
        return hex;
    }

} // namespace anonbench
