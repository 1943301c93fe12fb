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
 * @file keyed_hash.h
 * @brief OpenSSL-backed hashing primitives for the anonymization strategies.
 *
 * - KeyedHash:   HMAC-SHA256 with a fixed secret key (Deterministic method)
 * - keySequence: hash-chain byte sequences derived from a key (Bitwise method)
 *
 * A KeyedHash owns mutable OpenSSL state; strategies create one per anonymize() call.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_mac_st EVP_MAC;
typedef struct evp_mac_ctx_st EVP_MAC_CTX;

namespace anonbench {

    enum class HashAlgorithm {
        SHA256,
        SHA512
    };

    class KeyedHash {
    public:
        static constexpr size_t DIGEST_SIZE = 32;
        using Digest = std::array<uint8_t, DIGEST_SIZE>;

        explicit KeyedHash(std::string_view key);
        ~KeyedHash();

        KeyedHash(const KeyedHash&) = delete;
        KeyedHash& operator=(const KeyedHash&) = delete;
        KeyedHash(KeyedHash&& other) noexcept;
        KeyedHash& operator=(KeyedHash&& other) noexcept;

        /** HMAC-SHA256(key, message) */
        Digest digest(std::string_view message);

        /** HMAC-SHA256(key, prefix || message) without concatenating the inputs */
        Digest digest(std::string_view prefix, std::string_view message);

    private:
        void release() noexcept;

        EVP_MAC*        mac_ = nullptr;
        EVP_MAC_CTX*    ctx_ = nullptr;
    };

    /**
     * @brief Derive a pseudorandom byte sequence from a key by hash chaining:
     * h_0 = key, h_{k+1} = H(h_k || key), output = h_1 || h_2 || ... truncated to length.
     */
    std::vector<uint8_t> keySequence(std::string_view key, HashAlgorithm algorithm, size_t length);

    /** Lowercase hex encoding of a byte range */
    std::string toHex(const uint8_t* data, size_t length);

    /** Text of the most recent OpenSSL error, or fallback when the queue is empty */
    std::string opensslErrorString(const char* fallback);

} // namespace anonbench
