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
 * @file bitwise.h
 * @brief Reversible dual-key byte scrambling of each value's binary representation.
 *
 * Two keystreams of KEY_SEQUENCE_LENGTH bytes are derived once at construction:
 * primary from a SHA-256 hash chain over primary_key, secondary from a SHA-512
 * hash chain over secondary_key. Byte b at position p (q = p mod KEY_SEQUENCE_LENGTH):
 *
 *     b ^= primary[q]
 *     b  = rotr(b, p mod 8)
 *     b ^= (secondary[q] + p) mod 256
 *     b ^= (13 * p + 41) mod 256
 *     if p is odd: swap nibbles
 *
 * Integer and floating values are processed as their sizeof(T) little-endian
 * bytes, strings byte by byte with their length unchanged. A BOOL is flipped
 * when bit 0 of primary[0] ^ secondary[0] is set, otherwise left as is. That
 * bit is clear for DEFAULT_PRIMARY_KEY / DEFAULT_SECONDARY_KEY, so BOOL columns
 * pass through unchanged under the default keys.
 * Every step is a bijection on one byte, so restore() is exact.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "dataset.h"
#include "strategy.h"

namespace anonbench {

    class BitwiseStrategy {
        BitwiseOptions          options_;
        std::vector<uint8_t>    primary_;
        std::vector<uint8_t>    secondary_;

    public:
        static constexpr Method METHOD = Method::BITWISE;

        /** @throws std::invalid_argument for an empty key, CryptoError if hashing fails */
        explicit BitwiseStrategy(BitwiseOptions options = {});

        const BitwiseOptions&       options() const             { return options_; }
        bool                        reversible() const          { return true; }

        const std::vector<uint8_t>& primarySequence() const     { return primary_; }
        const std::vector<uint8_t>& secondarySequence() const   { return secondary_; }

        Dataset                     anonymize(const Dataset& data) const;
        Dataset                     restore(const Dataset& data) const;

        ValueType                   encodeValue(const ValueType& value) const;
        ValueType                   decodeValue(const ValueType& value) const;

        uint8_t                     encodeByte(uint8_t b, size_t position) const;
        uint8_t                     decodeByte(uint8_t b, size_t position) const;

    private:
        template<bool Encode>
        ValueType                   transformValue(const ValueType& value) const;
        template<bool Encode>
        Dataset                     transform(const Dataset& data) const;
    };

} // namespace anonbench
