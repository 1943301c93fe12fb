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
 * @file bitwise.hpp
 * @brief AnonBench Library - BitwiseStrategy implementation
 */

#include "bitwise.h"
#include "dataset.hpp"
#include "keyed_hash.hpp"

#include <bit>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace anonbench {

    inline BitwiseStrategy::BitwiseStrategy(BitwiseOptions options)
        : options_(std::move(options))
    {
        if (options_.primary_key.empty() || options_.secondary_key.empty()) {
            throw std::invalid_argument("bitwise keys must not be empty");
        }
        primary_   = keySequence(options_.primary_key,   HashAlgorithm::SHA256, KEY_SEQUENCE_LENGTH);
        secondary_ = keySequence(options_.secondary_key, HashAlgorithm::SHA512, KEY_SEQUENCE_LENGTH);
    }

    inline uint8_t BitwiseStrategy::encodeByte(uint8_t b, size_t position) const {
        const size_t q = position % KEY_SEQUENCE_LENGTH;
        b ^= primary_[q];
        b = std::rotr(b, static_cast<int>(position % 8));
        b ^= static_cast<uint8_t>((secondary_[q] + position) & 0xFF);
        b ^= static_cast<uint8_t>((13 * position + 41) & 0xFF);
        if (position & 1) {
            b = static_cast<uint8_t>((b << 4) | (b >> 4));
        }
        return b;
    }

    inline uint8_t BitwiseStrategy::decodeByte(uint8_t b, size_t position) const {
        const size_t q = position % KEY_SEQUENCE_LENGTH;
        if (position & 1) {
            b = static_cast<uint8_t>((b << 4) | (b >> 4));
        }
        b ^= static_cast<uint8_t>((13 * position + 41) & 0xFF);
        b ^= static_cast<uint8_t>((secondary_[q] + position) & 0xFF);
        b = std::rotl(b, static_cast<int>(position % 8));
        b ^= primary_[q];
        return b;
    }

    template<bool Encode>
    ValueType BitwiseStrategy::transformValue(const ValueType& value) const {
        auto op = [this](uint8_t b, size_t p) {
            if constexpr (Encode) {
                return encodeByte(b, p);
            } else {
                return decodeByte(b, p);
            }
        };

        return std::visit([&](const auto& v) -> ValueType {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::string>) {
                std::string out = v;
                for (size_t p = 0; p < out.size(); ++p) {
                    out[p] = static_cast<char>(op(static_cast<uint8_t>(out[p]), p));
                }
                return out;
            } else if constexpr (std::is_same_v<T, bool>) {
                // Self-inverse
                return ((primary_[0] ^ secondary_[0]) & 1) ? !v : v;
            } else {
                // make_unsigned is ill-formed for floating types; only the selected branch is instantiated
                using U = typename std::conditional_t<std::is_floating_point_v<T>,
                                                      std::conditional<sizeof(T) == 4, uint32_t, uint64_t>,
                                                      std::make_unsigned<T>>::type;
                const U in = std::bit_cast<U>(v);
                U out = 0;
                for (size_t p = 0; p < sizeof(U); ++p) {
                    const uint8_t b = static_cast<uint8_t>(in >> (8 * p));
                    out |= static_cast<U>(static_cast<U>(op(b, p)) << (8 * p));
                }
                return std::bit_cast<T>(out);
            }
        }, value);
    }

    template<bool Encode>
    Dataset BitwiseStrategy::transform(const Dataset& data) const {
        Dataset result = data;
        const std::vector<bool> selected = selectColumns(data.layout(), options_.columns);
        for (size_t r = 0; r < result.size(); ++r) {
            Row& row = result.row(r);
            for (size_t c = 0; c < row.size(); ++c) {
                if (selected[c]) {
                    row[c] = transformValue<Encode>(row[c]);
                }
            }
        }
        return result;
    }

    inline ValueType BitwiseStrategy::encodeValue(const ValueType& value) const {
        return transformValue<true>(value);
    }

    inline ValueType BitwiseStrategy::decodeValue(const ValueType& value) const {
        return transformValue<false>(value);
    }

    inline Dataset BitwiseStrategy::anonymize(const Dataset& data) const {
        return transform<true>(data);
    }

    inline Dataset BitwiseStrategy::restore(const Dataset& data) const {
        return transform<false>(data);
    }

} // namespace anonbench
