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
 * @file generator.h
 * @brief Synthetic dataset generation for the anonymization benchmarks
 *
 * Each DatasetProfile defines:
 * - A Layout (column names, types)
 * - A row generator: every cell is a pure function of (seed, row index, column),
 *   so the same size and seed always yield the same dataset, and a smaller
 *   dataset is a prefix of a larger one.
 *
 * Profiles:
 * 1. test_data: id, name, age, credit card number, zip code, blood sugar
 * 2. people   : country, name, age, ssn, height, gender, company
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "dataset.h"
#include "definitions.h"
#include "layout.h"
#include "row.h"

namespace anonbench {

    /// Callback type: populate one row given the generator seed and its index
    using RowGenerator = std::function<void(Row& row, uint64_t seed, size_t rowIndex)>;

    struct DatasetProfile {
        std::string  name;
        std::string  description;
        Layout       layout;
        RowGenerator generate;
    };

    /// All built-in profiles, constructed once
    const std::vector<DatasetProfile>& listProfiles();

    /// Look up a profile by name. Throws UnknownProfileError.
    const DatasetProfile& getProfile(const std::string& name);

    /**
     * @brief Produces datasets of a requested size for one profile and seed.
     */
    class ValueGenerator {
        const DatasetProfile*   profile_;
        uint64_t                seed_;

    public:
        explicit ValueGenerator(const std::string& profile = DEFAULT_PROFILE, uint64_t seed = DEFAULT_SEED);

        const DatasetProfile&   profile() const                 { return *profile_; }
        uint64_t                seed() const                    { return seed_; }

        /**
         * @brief Generate exactly size records.
         * @throws InvalidSizeError if size is negative
         */
        Dataset                 generate(int64_t size) const;
    };

    /** Generate a dataset of the default profile. Throws InvalidSizeError if size is negative. */
    Dataset generate(int64_t size, uint64_t seed = DEFAULT_SEED);

} // namespace anonbench
