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
 * @file strategy.h
 * @brief Method identifiers, strategy options and StrategyConcept.
 *
 * A strategy is a const, stateless-after-construction transform over a Dataset:
 *
 *     template<anonbench::StrategyConcept S>
 *     Dataset twice(const S& strategy, const Dataset& data) {
 *         return strategy.anonymize(strategy.anonymize(data));
 *     }
 *
 * anonymize() never mutates its input; it returns a new Dataset with the same
 * layout and row count. restore() inverts anonymize() where the strategy is
 * reversible and throws IrreversibleMethodError otherwise.
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dataset.h"
#include "definitions.h"
#include "errors.h"

namespace anonbench {

    enum class Method : uint8_t {
        DETERMINISTIC = 0,
        SHUFFLE       = 1,
        BITWISE       = 2
    };

    /// All methods in registry order
    constexpr std::array<Method, 3> ALL_METHODS = {Method::DETERMINISTIC, Method::SHUFFLE, Method::BITWISE};

    inline std::string methodName(Method method) {
        switch (method) {
            case Method::DETERMINISTIC: return "deterministic";
            case Method::SHUFFLE:       return "shuffle";
            case Method::BITWISE:       return "bitwise";
            default:                    return "undefined";
        }
    }

    /** Parse a method name (exact, lowercase). Throws UnknownMethodError. */
    inline Method parseMethod(std::string_view name) {
        if (name == "deterministic") return Method::DETERMINISTIC;
        if (name == "shuffle")       return Method::SHUFFLE;
        if (name == "bitwise")       return Method::BITWISE;
        throw UnknownMethodError(std::string(name));
    }

    // ========================================================================
    // Options
    // ========================================================================

    struct DeterministicOptions {
        std::string                             key             = DEFAULT_DETERMINISTIC_KEY;
        size_t                                  token_bytes     = DEFAULT_TOKEN_BYTES;      // STRING output, 1..MAX_TOKEN_BYTES
        double                                  amplitude       = DEFAULT_NOISE_AMPLITUDE;  // FLOAT/DOUBLE noise, all columns
        std::unordered_map<std::string, double> amplitudes;                                 // per-column override
        std::vector<std::string>                columns;                                    // empty = all columns
    };

    enum class ShuffleMode : uint8_t {
        PERMUTE,    // independent random permutation per column
        ROTATE      // cyclic shift: even columns left by rotation[0], odd columns right by rotation[1]
    };

    struct ShuffleOptions {
        ShuffleMode                 mode        = ShuffleMode::PERMUTE;
        std::optional<uint64_t>     seed        = DEFAULT_SHUFFLE_SEED;  // nullopt = fresh seed per call
        std::array<uint64_t, 2>     rotation    = {DEFAULT_ROTATION_EVEN, DEFAULT_ROTATION_ODD};
        std::vector<std::string>    columns;
    };

    struct BitwiseOptions {
        std::string                 primary_key     = DEFAULT_PRIMARY_KEY;
        std::string                 secondary_key   = DEFAULT_SECONDARY_KEY;
        std::vector<std::string>    columns;
    };

    struct StrategyOptions {
        DeterministicOptions    deterministic;
        ShuffleOptions          shuffle;
        BitwiseOptions          bitwise;
    };

    /**
     * @brief Column selection mask: true for every column to transform.
     * An empty selection means all columns; names not present in the layout are ignored.
     */
    inline std::vector<bool> selectColumns(const Layout& layout, const std::vector<std::string>& columns) {
        if (columns.empty()) {
            return std::vector<bool>(layout.columnCount(), true);
        }
        std::vector<bool> mask(layout.columnCount(), false);
        for (const auto& name : columns) {
            if (layout.hasColumn(name)) {
                mask[layout.columnIndex(name)] = true;
            }
        }
        return mask;
    }

    // ========================================================================
    // StrategyConcept
    // ========================================================================

    template<typename S>
    concept StrategyConcept = requires(const S& const_strategy, const Dataset& data) {
        { S::METHOD                         }   -> std::convertible_to<Method>;
        { const_strategy.anonymize(data)    }   -> std::same_as<Dataset>;
        { const_strategy.restore(data)      }   -> std::same_as<Dataset>;
        { const_strategy.reversible()       }   -> std::convertible_to<bool>;
    };

} // namespace anonbench
