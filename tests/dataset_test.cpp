/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file dataset_test.cpp
 * @brief Tests for Layout, Row and Dataset
 *
 * Tests cover:
 * - Column naming rules and lookup
 * - Typed cell access and type enforcement
 * - Dataset layout invariant on addRow
 */

#include <gtest/gtest.h>
#include <anonbench/anonbench.h>

#include <stdexcept>
#include <string>

using namespace anonbench;

// =============================================================================
// Layout
// =============================================================================

TEST(LayoutTest, AddColumnAppendsInOrder) {
    Layout layout;
    EXPECT_TRUE(layout.addColumn({"id", ColumnType::UINT64}));
    EXPECT_TRUE(layout.addColumn({"name", ColumnType::STRING}));
    EXPECT_TRUE(layout.addColumn({"age", ColumnType::INT32}));

    ASSERT_EQ(layout.columnCount(), 3u);
    EXPECT_EQ(layout.columnName(0), "id");
    EXPECT_EQ(layout.columnName(1), "name");
    EXPECT_EQ(layout.columnName(2), "age");
    EXPECT_EQ(layout.columnIndex("name"), 1u);
    EXPECT_EQ(layout.columnType(2), ColumnType::INT32);
}

TEST(LayoutTest, RejectsEmptyAndDuplicateNames) {
    Layout layout;
    EXPECT_FALSE(layout.addColumn({"", ColumnType::INT32}));
    EXPECT_TRUE(layout.addColumn({"a", ColumnType::INT32}));
    EXPECT_FALSE(layout.addColumn({"a", ColumnType::DOUBLE}));
    EXPECT_EQ(layout.columnCount(), 1u);

    EXPECT_THROW(Layout({{"x", ColumnType::BOOL}, {"x", ColumnType::BOOL}}), std::invalid_argument);
}

TEST(LayoutTest, ColumnIndexUnknownNameThrows) {
    Layout layout({{"a", ColumnType::INT8}});
    EXPECT_FALSE(layout.hasColumn("b"));
    EXPECT_THROW(layout.columnIndex("b"), std::out_of_range);
}

TEST(LayoutTest, EqualityComparesNamesAndTypes) {
    Layout a({{"x", ColumnType::INT32}, {"y", ColumnType::STRING}});
    Layout b({{"p", ColumnType::INT32}, {"q", ColumnType::STRING}});
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a == Layout({{"x", ColumnType::INT32}, {"y", ColumnType::STRING}}));
}

TEST(ColumnTypeTest, NamesRoundTrip) {
    for (auto type : {ColumnType::BOOL, ColumnType::UINT8, ColumnType::UINT16, ColumnType::UINT32,
                      ColumnType::UINT64, ColumnType::INT8, ColumnType::INT16, ColumnType::INT32,
                      ColumnType::INT64, ColumnType::FLOAT, ColumnType::DOUBLE, ColumnType::STRING}) {
        EXPECT_EQ(columnTypeFromString(toString(type)), type);
        EXPECT_TRUE(isType(defaultValue(type), type));
    }
    EXPECT_THROW(columnTypeFromString("int128"), std::invalid_argument);
}

// =============================================================================
// Row
// =============================================================================

TEST(RowTest, ConstructFromLayoutUsesDefaults) {
    Layout layout({{"flag", ColumnType::BOOL}, {"n", ColumnType::INT32}, {"s", ColumnType::STRING}});
    Row row(layout);
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row.get<bool>(0), false);
    EXPECT_EQ(row.get<int32_t>(1), 0);
    EXPECT_EQ(row.get<std::string>(2), "");
    EXPECT_TRUE(row.conformsTo(layout));
}

TEST(RowTest, SetEnforcesColumnType) {
    Layout layout({{"n", ColumnType::INT32}, {"s", ColumnType::STRING}});
    Row row(layout);
    row.set(0, int32_t{42});
    row.set(1, "hello");
    EXPECT_EQ(row.get<int32_t>(0), 42);
    EXPECT_EQ(row.get<std::string>(1), "hello");

    EXPECT_THROW(row.set(0, int64_t{1}), std::runtime_error);
    EXPECT_THROW(row.set(1, 3.5), std::runtime_error);
    EXPECT_THROW(row.set(0, ValueType{std::string("x")}), std::runtime_error);
    EXPECT_EQ(row.get<int32_t>(0), 42);
}

// =============================================================================
// Dataset
// =============================================================================

TEST(DatasetTest, AddRowRejectsNonConformingRows) {
    Layout layout({{"n", ColumnType::INT32}, {"s", ColumnType::STRING}});
    Dataset data(layout);

    data.addRow(Row(layout));
    EXPECT_EQ(data.size(), 1u);

    EXPECT_THROW(data.addRow(Row(std::vector<ValueType>{int32_t{1}})), LayoutError);
    EXPECT_THROW(data.addRow(Row(std::vector<ValueType>{int64_t{1}, std::string("x")})), LayoutError);
    EXPECT_EQ(data.size(), 1u);
}

TEST(DatasetTest, LayoutErrorIsAnonbenchError) {
    Layout layout({{"n", ColumnType::INT32}});
    Dataset data(layout);
    try {
        data.addRow(Row());
        FAIL() << "expected LayoutError";
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("Layout error"), std::string::npos);
    }
}

TEST(DatasetTest, ColumnExtractsValuesInRowOrder) {
    Layout layout({{"n", ColumnType::INT32}});
    Dataset data(layout);
    Row row(layout);
    for (int32_t i = 0; i < 5; ++i) {
        row.set(0, i * 10);
        data.addRow(row);
    }
    auto column = data.column(0);
    ASSERT_EQ(column.size(), 5u);
    EXPECT_EQ(std::get<int32_t>(column[3]), 30);
    EXPECT_EQ(std::get<int32_t>(data.at(4, 0)), 40);
    EXPECT_THROW(data.column(1), std::out_of_range);
}

TEST(DatasetTest, SameShapeIgnoresValues) {
    Layout layout({{"n", ColumnType::INT32}});
    Dataset a(layout);
    Dataset b(layout);
    Row row(layout);
    a.addRow(row);
    row.set(0, int32_t{9});
    b.addRow(row);

    EXPECT_TRUE(a.sameShape(b));
    EXPECT_FALSE(a == b);
    b.addRow(row);
    EXPECT_FALSE(a.sameShape(b));
}
