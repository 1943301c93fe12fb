/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include <xxhash.h>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "dataset.h"
#include "definitions.h"

namespace anonbench {

/**
 * @brief xxHash64 over raw bytes, used for value hashes and dataset digests.
 */
class Checksum {
public:
    using hash_t = uint64_t;
    static constexpr hash_t DEFAULT_SEED = 0;

    static hash_t compute(const void* data, size_t length, hash_t seed = DEFAULT_SEED) {
        return XXH64(data, length, seed);
    }

    /// Incremental xxHash64; owns the XXH64 state.
    class Streaming {
        XXH64_state_t* state_ = nullptr;

    public:
        explicit Streaming(hash_t seed = DEFAULT_SEED) : state_(XXH64_createState()) {
            if (state_ == nullptr) {
                throw std::runtime_error("XXH64_createState failed");
            }
            reset(seed);
        }
        ~Streaming()                                { XXH64_freeState(state_); }

        Streaming(const Streaming&) = delete;
        Streaming& operator=(const Streaming&) = delete;
        Streaming(Streaming&& other) noexcept       : state_(std::exchange(other.state_, nullptr)) {}
        Streaming& operator=(Streaming&& other) noexcept {
            std::swap(state_, other.state_);
            return *this;
        }

        void    reset(hash_t seed = DEFAULT_SEED)           { XXH64_reset(state_, seed); }
        void    update(const void* data, size_t length)     { XXH64_update(state_, data, length); }
        hash_t  finalize() const                            { return XXH64_digest(state_); }
    };
};

// ============================================================================
// Canonical value bytes
// ============================================================================

/// Append little-endian bytes of an unsigned integer
template<typename U>
inline void appendLittleEndian(std::string& out, U value) {
    static_assert(std::is_unsigned_v<U>);
    for (size_t i = 0; i < sizeof(U); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(value >> (8 * i))));
    }
}

/**
 * @brief Append the canonical byte form of a value: one type tag byte followed by
 * the little-endian value bytes (raw IEEE-754 bits for floating types, raw bytes for strings).
 *
 * Two values produce the same bytes iff they have the same type and bit pattern.
 */
inline void appendValueKey(std::string& out, const ValueType& value) {
    out.push_back(static_cast<char>(static_cast<uint8_t>(toColumnType(value))));
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out.append(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            out.push_back(v ? '\x01' : '\x00');
        } else if constexpr (std::is_same_v<T, float>) {
            appendLittleEndian(out, std::bit_cast<uint32_t>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            appendLittleEndian(out, std::bit_cast<uint64_t>(v));
        } else {
            appendLittleEndian(out, static_cast<std::make_unsigned_t<T>>(v));
        }
    }, value);
}

inline std::string valueKey(const ValueType& value) {
    std::string key;
    appendValueKey(key, value);
    return key;
}

inline Checksum::hash_t hashValue(const ValueType& value, Checksum::hash_t seed = Checksum::DEFAULT_SEED) {
    std::string key = valueKey(value);
    return Checksum::compute(key.data(), key.size(), seed);
}

// ============================================================================
// Dataset digests
// ============================================================================

/**
 * @brief Order-independent digest of one column: wrapping sum of per-value hashes.
 * Equal for any two columns holding the same multiset of values.
 */
inline Checksum::hash_t columnDigest(const Dataset& data, size_t column) {
    Checksum::hash_t sum = 0;
    std::string key;
    for (const auto& row : data.rows()) {
        key.clear();
        appendValueKey(key, row[column]);
        sum += Checksum::compute(key.data(), key.size(), column);
    }
    return sum;
}

/**
 * @brief Order-independent digest of a dataset: row count, layout types and the
 * multiset of every column. Permuting values within columns leaves it unchanged.
 */
inline Checksum::hash_t datasetDigest(const Dataset& data) {
    Checksum::Streaming hasher;
    const uint64_t rows = data.size();
    hasher.update(&rows, sizeof(rows));
    for (size_t c = 0; c < data.columnCount(); ++c) {
        const uint16_t type = static_cast<uint16_t>(data.layout().columnType(c));
        const Checksum::hash_t digest = columnDigest(data, c);
        hasher.update(&type, sizeof(type));
        hasher.update(&digest, sizeof(digest));
    }
    return hasher.finalize();
}

} // namespace anonbench
