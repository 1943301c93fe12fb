/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file contract_test.cpp
 * @brief Tests for the contract checks and verifyContract
 */

#include <gtest/gtest.h>
#include <anonbench/anonbench.h>

#include <limits>
#include <string>

#include "test_datasets.h"

using namespace anonbench;

class ContractTest : public ::testing::Test {
protected:
    StrategyRegistry registry_;
    Dataset          input_ = anonbench_test::allTypesDataset(60, 9);
};

// =============================================================================
// Individual checks
// =============================================================================

TEST_F(ContractTest, SameShapeRequiresLayoutAndRowCount) {
    EXPECT_TRUE(sameShape(input_, input_));
    EXPECT_FALSE(sameShape(input_, anonbench_test::allTypesDataset(59, 9)));
    EXPECT_FALSE(sameShape(input_, generate(60)));
}

TEST_F(ContractTest, SameShapeRejectsRetypedCells) {
    Dataset output = input_;
    output.row(5)[7] = std::string("not an int32");
    EXPECT_FALSE(sameShape(input_, output));
}

TEST_F(ContractTest, MultisetDetectsReplacedValue) {
    Dataset output = input_;
    EXPECT_TRUE(sameColumnMultiset(input_, output));
    output.row(0)[11] = std::string("intruder");
    EXPECT_FALSE(sameColumnMultiset(input_, output, 11));
    EXPECT_TRUE(sameColumnMultiset(input_, output, 10));
    EXPECT_FALSE(sameColumnMultiset(input_, output));
}

TEST_F(ContractTest, MultisetDetectsChangedMultiplicity) {
    Dataset output = input_;
    // Duplicate row 1's value over row 2 (different k): same set, different counts
    output.row(2)[7] = output.row(1)[7];
    EXPECT_FALSE(sameColumnMultiset(input_, output, 7));
}

TEST_F(ContractTest, ConsistentMappingDetectsSplitValues) {
    Dataset output = input_;
    EXPECT_TRUE(consistentMapping(input_, output, 7));
    // rows 0 and 9 hold the same input value
    output.row(9)[7] = int32_t{-1};
    EXPECT_FALSE(consistentMapping(input_, output, 7));
}

TEST_F(ContractTest, ConsistentMappingAllowsCollisions) {
    Dataset output = input_;
    for (size_t r = 0; r < output.size(); ++r) {
        output.row(r)[7] = int32_t{0};
    }
    EXPECT_TRUE(consistentMapping(input_, output, 7));
}

TEST_F(ContractTest, IdenticalComparesBitPatterns) {
    Layout layout({{"x", ColumnType::DOUBLE}});
    Dataset a(layout);
    Row row(layout);
    row.set(0, std::numeric_limits<double>::quiet_NaN());
    a.addRow(row);
    Dataset b = a;

    EXPECT_FALSE(a == b);       // NaN != NaN
    EXPECT_TRUE(identical(a, b));

    Dataset c(layout);
    row.set(0, -0.0);
    c.addRow(row);
    Dataset d(layout);
    row.set(0, 0.0);
    d.addRow(row);
    EXPECT_TRUE(c == d);
    EXPECT_FALSE(identical(c, d));
}

// =============================================================================
// verifyContract
// =============================================================================

TEST_F(ContractTest, RealOutputsSatisfyTheirContracts) {
    for (Method m : ALL_METHODS) {
        const Strategy& strategy = registry_.resolve(m);
        EXPECT_NO_THROW(verifyContract(strategy, input_, strategy.anonymize(input_))) << methodName(m);
    }
}

TEST_F(ContractTest, UnseededShuffleIsVerifiedWithoutRestore) {
    StrategyOptions options;
    options.shuffle.seed.reset();
    const StrategyRegistry registry(options);
    const Strategy& shuffle = registry.resolve(Method::SHUFFLE);
    EXPECT_NO_THROW(verifyContract(shuffle, input_, shuffle.anonymize(input_)));
}

TEST_F(ContractTest, TamperedOutputsAreRejected) {
    const Strategy& deterministic = registry_.resolve(Method::DETERMINISTIC);
    Dataset detOut = deterministic.anonymize(input_);
    detOut.row(9)[11] = std::string("tampered");
    EXPECT_THROW(verifyContract(deterministic, input_, detOut), ContractViolationError);

    const Strategy& shuffle = registry_.resolve(Method::SHUFFLE);
    Dataset shufOut = shuffle.anonymize(input_);
    shufOut.row(0)[7] = int32_t{999};
    EXPECT_THROW(verifyContract(shuffle, input_, shufOut), ContractViolationError);

    const Strategy& bitwise = registry_.resolve(Method::BITWISE);
    Dataset bitOut = bitwise.anonymize(input_);
    bitOut.row(3)[4] = uint64_t{0};
    EXPECT_THROW(verifyContract(bitwise, input_, bitOut), ContractViolationError);
}

TEST_F(ContractTest, ShapeViolationMessageNamesMethod) {
    const Strategy& bitwise = registry_.resolve(Method::BITWISE);
    try {
        verifyContract(bitwise, input_, anonbench_test::allTypesDataset(10, 9));
        FAIL() << "expected ContractViolationError";
    } catch (const ContractViolationError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("bitwise"), std::string::npos) << msg;
        EXPECT_NE(msg.find("60 rows in"), std::string::npos) << msg;
    }
}
