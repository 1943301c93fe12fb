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
 * @file registry.hpp
 * @brief AnonBench Library - Strategy and StrategyRegistry implementations
 */

#include "registry.h"
#include "bitwise.hpp"
#include "deterministic.hpp"
#include "shuffle.hpp"

#include <type_traits>
#include <utility>

static_assert(anonbench::StrategyConcept<anonbench::DeterministicStrategy>);
static_assert(anonbench::StrategyConcept<anonbench::ShuffleStrategy>);
static_assert(anonbench::StrategyConcept<anonbench::BitwiseStrategy>);

namespace anonbench {

    // ========================================================================
    // Strategy Implementation
    // ========================================================================

    inline Method Strategy::method() const {
        return std::visit([](const auto& s) { return std::decay_t<decltype(s)>::METHOD; }, impl_);
    }

    inline bool Strategy::reversible() const {
        return std::visit([](const auto& s) { return s.reversible(); }, impl_);
    }

    inline Dataset Strategy::anonymize(const Dataset& data) const {
        return std::visit([&data](const auto& s) { return s.anonymize(data); }, impl_);
    }

    inline Dataset Strategy::restore(const Dataset& data) const {
        return std::visit([&data](const auto& s) { return s.restore(data); }, impl_);
    }

    // ========================================================================
    // StrategyRegistry Implementation
    // ========================================================================

    inline StrategyRegistry::StrategyRegistry(StrategyOptions options)
        : options_(std::move(options))
    {
        strategies_.reserve(ALL_METHODS.size());
        strategies_.emplace_back(DeterministicStrategy(options_.deterministic));
        strategies_.emplace_back(ShuffleStrategy(options_.shuffle));
        strategies_.emplace_back(BitwiseStrategy(options_.bitwise));
    }

    inline const Strategy& StrategyRegistry::resolve(std::string_view name) const {
        return resolve(parseMethod(name));
    }

    inline const Strategy& StrategyRegistry::resolve(Method method) const {
        const size_t index = static_cast<size_t>(method);
        if (index >= strategies_.size()) {
            throw UnknownMethodError(methodName(method));
        }
        return strategies_[index];
    }

    inline std::vector<Method> StrategyRegistry::methods() const {
        std::vector<Method> result;
        result.reserve(strategies_.size());
        for (const auto& s : strategies_) {
            result.push_back(s.method());
        }
        return result;
    }

    inline std::vector<std::string> StrategyRegistry::names() const {
        std::vector<std::string> result;
        result.reserve(strategies_.size());
        for (const auto& s : strategies_) {
            result.push_back(s.name());
        }
        return result;
    }

} // namespace anonbench
