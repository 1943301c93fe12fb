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
 * @file shuffle.hpp
 * @brief AnonBench Library - ShuffleStrategy implementation
 */

#include "shuffle.h"
#include "dataset.hpp"

#include <numeric>

namespace anonbench {

    inline uint64_t uniformBelow(std::mt19937_64& rng, uint64_t bound) {
        // Reject the lowest (2^64 mod bound) outputs so every residue is equally likely
        const uint64_t threshold = (0 - bound) % bound;
        uint64_t r;
        do { r = rng(); } while (r < threshold);
        return r % bound;
    }

    inline uint64_t ShuffleStrategy::effectiveSeed() const {
        if (options_.seed) {
            return *options_.seed;
        }
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }

    inline std::vector<size_t> ShuffleStrategy::permutation(size_t column, size_t size, uint64_t seed) const {
        std::vector<size_t> perm(size);
        if (size == 0) {
            return perm;
        }

        if (options_.mode == ShuffleMode::ROTATE) {
            // even: left by k0 (out[i] = in[i + k0]); odd: right by k1 (out[i] = in[i - k1])
            const size_t shift = (column % 2 == 0)
                ? static_cast<size_t>(options_.rotation[0] % size)
                : (size - static_cast<size_t>(options_.rotation[1] % size)) % size;
            for (size_t i = 0; i < size; ++i) {
                perm[i] = (i + shift) % size;
            }
            return perm;
        }

        std::iota(perm.begin(), perm.end(), size_t{0});
        std::mt19937_64 rng(seed ^ (0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(column) + 1)));
        // Fisher-Yates
        for (size_t i = size - 1; i > 0; --i) {
            std::swap(perm[i], perm[uniformBelow(rng, i + 1)]);
        }
        return perm;
    }

    inline Dataset ShuffleStrategy::apply(const Dataset& data, bool inverse) const {
        Dataset result = data;
        const size_t n = data.size();
        if (n <= 1) {
            return result;
        }

        const std::vector<bool> selected = selectColumns(data.layout(), options_.columns);
        const uint64_t seed = effectiveSeed();
        for (size_t c = 0; c < data.columnCount(); ++c) {
            if (!selected[c]) {
                continue;
            }
            const std::vector<size_t> perm = permutation(c, n, seed);
            for (size_t i = 0; i < n; ++i) {
                if (inverse) {
                    result.row(perm[i])[c] = data.row(i)[c];
                } else {
                    result.row(i)[c] = data.row(perm[i])[c];
                }
            }
        }
        return result;
    }

    inline Dataset ShuffleStrategy::anonymize(const Dataset& data) const {
        return apply(data, false);
    }

    inline Dataset ShuffleStrategy::restore(const Dataset& data) const {
        if (!reversible()) {
            throw IrreversibleMethodError(methodName(METHOD));
        }
        return apply(data, true);
    }

} // namespace anonbench
