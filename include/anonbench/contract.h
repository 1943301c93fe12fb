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
 * @file contract.h
 * @brief Verifiers for the guarantees each anonymization method makes.
 *
 * Values are compared by their canonical bytes (type tag + bit pattern), so a
 * NaN equals itself and -0.0 differs from +0.0.
 */

#include <cstddef>

#include "dataset.h"
#include "registry.h"
#include "strategy.h"

namespace anonbench {

    /// Same layout, same row count, every output row conforms to the layout
    bool sameShape(const Dataset& input, const Dataset& output);

    /// Column holds the same multiset of values in both datasets
    bool sameColumnMultiset(const Dataset& input, const Dataset& output, size_t column);

    /// Every column holds the same multiset of values in both datasets
    bool sameColumnMultiset(const Dataset& input, const Dataset& output);

    /// Equal input values in the column map to equal output values
    bool consistentMapping(const Dataset& input, const Dataset& output, size_t column);

    /// Same layout and bit-identical values in every cell
    bool identical(const Dataset& a, const Dataset& b);

    /**
     * @brief Check output against the guarantees of the method that produced it.
     *
     * - all methods:    sameShape
     * - deterministic:  consistentMapping on every column
     * - shuffle:        sameColumnMultiset; exact restore when reversible
     * - bitwise:        exact restore
     *
     * @throws ContractViolationError naming the method and the failed check
     */
    void verifyContract(const Strategy& strategy, const Dataset& input, const Dataset& output);

} // namespace anonbench
