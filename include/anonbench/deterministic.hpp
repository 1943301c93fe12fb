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
 * @file deterministic.hpp
 * @brief AnonBench Library - DeterministicStrategy implementation
 */

#include "deterministic.h"
#include "checksum.hpp"
#include "dataset.hpp"
#include "keyed_hash.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace anonbench {

    inline DeterministicStrategy::DeterministicStrategy(DeterministicOptions options)
        : options_(std::move(options))
    {
        if (options_.token_bytes == 0 || options_.token_bytes > MAX_TOKEN_BYTES) {
            throw std::invalid_argument("token_bytes must be in [1, " + std::to_string(MAX_TOKEN_BYTES)
                                        + "], got " + std::to_string(options_.token_bytes));
        }
        if (!(options_.amplitude >= 0.0)) {
            throw std::invalid_argument("noise amplitude must be >= 0");
        }
        for (const auto& [column, amplitude] : options_.amplitudes) {
            if (!(amplitude >= 0.0)) {
                throw std::invalid_argument("noise amplitude for column '" + column + "' must be >= 0");
            }
        }
    }

    inline double DeterministicStrategy::amplitudeFor(const std::string& column) const {
        auto it = options_.amplitudes.find(column);
        return it != options_.amplitudes.end() ? it->second : options_.amplitude;
    }

    inline Dataset DeterministicStrategy::anonymize(const Dataset& data) const {
        Dataset result = data;
        if (data.empty()) {
            return result;
        }

        const Layout& layout = data.layout();
        const std::vector<bool> selected = selectColumns(layout, options_.columns);
        KeyedHash mac(options_.key);

        // Per-column memo of value key -> output
        std::unordered_map<std::string, ValueType> memo;
        std::string key;
        for (size_t c = 0; c < layout.columnCount(); ++c) {
            if (!selected[c]) {
                continue;
            }
            memo.clear();
            const std::string prefix = layout.columnName(c) + '\0';
            const double amplitude = amplitudeFor(layout.columnName(c));

            for (size_t r = 0; r < result.size(); ++r) {
                ValueType& cell = result.row(r)[c];
                key.clear();
                appendValueKey(key, cell);
                auto it = memo.find(key);
                if (it == memo.end()) {
                    it = memo.emplace(key, transform(mac, prefix, cell, amplitude)).first;
                }
                cell = it->second;
            }
        }
        return result;
    }

    inline Dataset DeterministicStrategy::restore(const Dataset&) const {
        throw IrreversibleMethodError(methodName(METHOD));
    }

    inline ValueType DeterministicStrategy::anonymizeValue(const std::string& column, const ValueType& value) const {
        KeyedHash mac(options_.key);
        return transform(mac, column + '\0', value, amplitudeFor(column));
    }

    inline ValueType DeterministicStrategy::transform(KeyedHash& mac, const std::string& prefix,
                                                      const ValueType& value, double amplitude) const {
        return std::visit([&](const auto& v) -> ValueType {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_floating_point_v<T>) {
                if (!std::isfinite(v)) {
                    return v;
                }
                // -0.0 and +0.0 are the same value
                const T canonical = (v == T(0)) ? T(0) : v;
                const auto digest = mac.digest(prefix, valueKey(ValueType{canonical}));
                uint64_t bits = 0;
                for (size_t i = 0; i < sizeof(uint64_t); ++i) {
                    bits |= static_cast<uint64_t>(digest[i]) << (8 * i);
                }
                const double u = static_cast<double>(bits >> 11) / static_cast<double>(1ULL << 53);
                return static_cast<T>(static_cast<double>(canonical) + amplitude * std::sin(2.0 * std::numbers::pi * u));
            } else {
                const auto digest = mac.digest(prefix, valueKey(value));
                if constexpr (std::is_same_v<T, std::string>) {
                    return toHex(digest.data(), options_.token_bytes);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return static_cast<bool>(digest[0] & 1);
                } else {
                    using U = std::make_unsigned_t<T>;
                    U bits = 0;
                    for (size_t i = 0; i < sizeof(T); ++i) {
                        bits |= static_cast<U>(static_cast<U>(digest[i]) << (8 * i));
                    }
                    return static_cast<T>(bits);
                }
            }
        }, value);
    }

} // namespace anonbench
