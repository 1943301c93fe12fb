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
 * @file shuffle.h
 * @brief Permutation-based anonymization: values move between rows, never change.
 *
 * Each selected column gets its own bijection perm over [0, n) and the output
 * is out[i] = in[perm[i]]. The multiset of every column is preserved exactly.
 *
 * PERMUTE: uniform Fisher-Yates permutation from std::mt19937_64 seeded with
 *          (seed, column index). Without a seed each call draws one from
 *          std::random_device and the result cannot be restored.
 * ROTATE:  cyclic shift; even columns left by rotation[0], odd columns right
 *          by rotation[1] (mod n). Always restorable.
 */

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "dataset.h"
#include "strategy.h"

namespace anonbench {

    /// Uniform integer in [0, bound) without modulo bias; identical on every standard library
    uint64_t uniformBelow(std::mt19937_64& rng, uint64_t bound);

    class ShuffleStrategy {
        ShuffleOptions      options_;

    public:
        static constexpr Method METHOD = Method::SHUFFLE;

        explicit ShuffleStrategy(ShuffleOptions options = {}) : options_(std::move(options)) {}

        const ShuffleOptions&   options() const             { return options_; }

        /// ROTATE is always invertible; PERMUTE only with a fixed seed
        bool                    reversible() const          { return options_.mode == ShuffleMode::ROTATE || options_.seed.has_value(); }

        Dataset                 anonymize(const Dataset& data) const;
        Dataset                 restore(const Dataset& data) const;

        /**
         * @brief The permutation applied to one column: out[i] = in[perm[i]].
         * @param seed ignored in ROTATE mode
         */
        std::vector<size_t>     permutation(size_t column, size_t size, uint64_t seed) const;

    private:
        uint64_t                effectiveSeed() const;
        Dataset                 apply(const Dataset& data, bool inverse) const;
    };

} // namespace anonbench
