/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file shuffle_test.cpp
 * @brief Tests for ShuffleStrategy (permute and rotate modes)
 */

#include <gtest/gtest.h>
#include <anonbench/anonbench.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

#include "test_datasets.h"

using namespace anonbench;

namespace {

/// Three INT32 columns, every cell holds its row index
Dataset indexDataset(size_t rows) {
    Dataset data(Layout({{"a", ColumnType::INT32}, {"b", ColumnType::INT32}, {"c", ColumnType::INT32}}));
    Row row(data.layout());
    for (size_t i = 0; i < rows; ++i) {
        for (size_t c = 0; c < 3; ++c) {
            row.set(c, static_cast<int32_t>(i));
        }
        data.addRow(row);
    }
    return data;
}

bool isBijection(std::vector<size_t> perm) {
    std::sort(perm.begin(), perm.end());
    for (size_t i = 0; i < perm.size(); ++i) {
        if (perm[i] != i) return false;
    }
    return true;
}

} // namespace

// =============================================================================
// Permute mode
// =============================================================================

TEST(ShuffleTest, PreservesEveryColumnMultiset) {
    Dataset input = anonbench_test::allTypesDataset(200, 13);
    Dataset output = ShuffleStrategy().anonymize(input);
    ASSERT_TRUE(sameShape(input, output));
    EXPECT_TRUE(sameColumnMultiset(input, output));
    EXPECT_EQ(datasetDigest(input), datasetDigest(output));
    EXPECT_FALSE(input == output);
}

TEST(ShuffleTest, SmallDatasetsAreReturnedUnchanged) {
    for (size_t n : {0, 1}) {
        Dataset input = generate(static_cast<int64_t>(n));
        EXPECT_EQ(ShuffleStrategy().anonymize(input), input);

        ShuffleOptions options;
        options.seed.reset();
        EXPECT_EQ(ShuffleStrategy(options).anonymize(input), input);
    }
}

TEST(ShuffleTest, FixedSeedIsReproducible) {
    Dataset input = generate(500);
    ShuffleOptions options;
    options.seed = 12345;
    EXPECT_EQ(ShuffleStrategy(options).anonymize(input), ShuffleStrategy(options).anonymize(input));

    ShuffleOptions other;
    other.seed = 54321;
    EXPECT_FALSE(ShuffleStrategy(options).anonymize(input) == ShuffleStrategy(other).anonymize(input));
}

TEST(ShuffleTest, ColumnsUseIndependentPermutations) {
    ShuffleStrategy strategy;
    auto p0 = strategy.permutation(0, 1000, 99);
    auto p1 = strategy.permutation(1, 1000, 99);
    EXPECT_TRUE(isBijection(p0));
    EXPECT_TRUE(isBijection(p1));
    EXPECT_NE(p0, p1);
    EXPECT_EQ(p0, strategy.permutation(0, 1000, 99));
}

TEST(ShuffleTest, BreaksRowLinkage) {
    Dataset input = indexDataset(1000);
    Dataset output = ShuffleStrategy().anonymize(input);
    size_t aligned = 0;
    for (size_t r = 0; r < output.size(); ++r) {
        if (output.row(r).get<int32_t>(0) == output.row(r).get<int32_t>(1)) ++aligned;
    }
    // Two independent uniform permutations agree on ~1 position on average
    EXPECT_LT(aligned, 20u);
}

TEST(ShuffleTest, UnseededShufflePreservesMultisetButCannotRestore) {
    ShuffleOptions options;
    options.seed = std::nullopt;
    ShuffleStrategy strategy(options);
    EXPECT_FALSE(strategy.reversible());

    Dataset input = generate(300);
    Dataset output = strategy.anonymize(input);
    EXPECT_TRUE(sameColumnMultiset(input, output));
    EXPECT_THROW(strategy.restore(output), IrreversibleMethodError);
}

TEST(ShuffleTest, SeededRestoreInvertsAnonymize) {
    ShuffleStrategy strategy;
    ASSERT_TRUE(strategy.reversible());
    Dataset input = anonbench_test::allTypesDataset(257, 31);
    EXPECT_TRUE(identical(strategy.restore(strategy.anonymize(input)), input));
}

TEST(ShuffleTest, ColumnSelection) {
    Dataset input = indexDataset(100);
    ShuffleOptions options;
    options.columns = {"b"};
    Dataset output = ShuffleStrategy(options).anonymize(input);
    for (size_t r = 0; r < output.size(); ++r) {
        EXPECT_EQ(output.row(r).get<int32_t>(0), static_cast<int32_t>(r));
        EXPECT_EQ(output.row(r).get<int32_t>(2), static_cast<int32_t>(r));
    }
    EXPECT_FALSE(output == input);
    EXPECT_TRUE(sameColumnMultiset(input, output, 1));
}

// =============================================================================
// Rotate mode
// =============================================================================

TEST(ShuffleTest, RotateShiftsEvenLeftAndOddRight) {
    ShuffleOptions options;
    options.mode = ShuffleMode::ROTATE;
    ShuffleStrategy strategy(options);

    const size_t n = 11;
    Dataset output = strategy.anonymize(indexDataset(n));
    for (size_t i = 0; i < n; ++i) {
        EXPECT_EQ(output.row(i).get<int32_t>(0), static_cast<int32_t>((i + 7) % n));        // left by 7
        EXPECT_EQ(output.row(i).get<int32_t>(1), static_cast<int32_t>((i + n - 13 % n) % n)); // right by 13
        EXPECT_EQ(output.row(i).get<int32_t>(2), static_cast<int32_t>((i + 7) % n));
    }
}

TEST(ShuffleTest, RotateWithCustomKeyAndRestore) {
    ShuffleOptions options;
    options.mode = ShuffleMode::ROTATE;
    options.rotation = {1, 2};
    options.seed = std::nullopt;    // not used by rotation
    ShuffleStrategy strategy(options);
    EXPECT_TRUE(strategy.reversible());

    Dataset input = indexDataset(5);
    Dataset output = strategy.anonymize(input);
    EXPECT_EQ(output.row(0).get<int32_t>(0), 1);
    EXPECT_EQ(output.row(0).get<int32_t>(1), 3);
    EXPECT_EQ(strategy.restore(output), input);
}

TEST(ShuffleTest, RotateByMultipleOfSizeIsIdentity) {
    ShuffleOptions options;
    options.mode = ShuffleMode::ROTATE;
    options.rotation = {10, 20};
    Dataset input = indexDataset(10);
    EXPECT_EQ(ShuffleStrategy(options).anonymize(input), input);
}

// =============================================================================
// Bounded draws
// =============================================================================

TEST(UniformBelowTest, StaysInRangeAndCoversIt) {
    std::mt19937_64 rng(7);
    std::vector<int> hits(6, 0);
    for (int i = 0; i < 6000; ++i) {
        const uint64_t v = uniformBelow(rng, 6);
        ASSERT_LT(v, 6u);
        ++hits[v];
    }
    for (int h : hits) {
        EXPECT_GT(h, 800);
        EXPECT_LT(h, 1200);
    }
    EXPECT_EQ(uniformBelow(rng, 1), 0u);
}
