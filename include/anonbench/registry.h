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
 * @file registry.h
 * @brief Name -> strategy resolution.
 *
 * Strategy is a value handle over the closed set of strategy implementations.
 * StrategyRegistry builds one Strategy per Method from StrategyOptions in its
 * constructor and never changes afterwards; pass it by const reference.
 */

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "bitwise.h"
#include "dataset.h"
#include "deterministic.h"
#include "shuffle.h"
#include "strategy.h"

namespace anonbench {

    class Strategy {
    public:
        using Variant = std::variant<DeterministicStrategy, ShuffleStrategy, BitwiseStrategy>;

        template<StrategyConcept S>
        explicit Strategy(S strategy) : impl_(std::move(strategy)) {}

        Method          method() const;
        std::string     name() const                                { return methodName(method()); }
        bool            reversible() const;

        Dataset         anonymize(const Dataset& data) const;
        Dataset         restore(const Dataset& data) const;

        /// Typed access to the implementation; throws std::bad_variant_access on mismatch
        template<StrategyConcept S>
        const S&        as() const                                  { return std::get<S>(impl_); }

    private:
        Variant         impl_;
    };

    class StrategyRegistry {
        StrategyOptions         options_;
        std::vector<Strategy>   strategies_;    // indexed by Method

    public:
        explicit StrategyRegistry(StrategyOptions options = {});

        const StrategyOptions&  options() const                     { return options_; }

        /** @throws UnknownMethodError for names other than deterministic, shuffle, bitwise */
        const Strategy&         resolve(std::string_view name) const;
        const Strategy&         resolve(Method method) const;

        /// Registered methods in registry order
        std::vector<Method>     methods() const;
        std::vector<std::string> names() const;
    };

} // namespace anonbench
