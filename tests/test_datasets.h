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
 * @file test_datasets.h
 * @brief Small hand-built datasets shared by the strategy and contract tests.
 */

#include <anonbench/anonbench.h>

#include <cstdint>
#include <string>

namespace anonbench_test {

/// One column of every ColumnType, named after the type
inline anonbench::Layout allTypesLayout() {
    using anonbench::ColumnType;
    anonbench::Layout layout;
    layout.addColumn({"bool",   ColumnType::BOOL});
    layout.addColumn({"uint8",  ColumnType::UINT8});
    layout.addColumn({"uint16", ColumnType::UINT16});
    layout.addColumn({"uint32", ColumnType::UINT32});
    layout.addColumn({"uint64", ColumnType::UINT64});
    layout.addColumn({"int8",   ColumnType::INT8});
    layout.addColumn({"int16",  ColumnType::INT16});
    layout.addColumn({"int32",  ColumnType::INT32});
    layout.addColumn({"int64",  ColumnType::INT64});
    layout.addColumn({"float",  ColumnType::FLOAT});
    layout.addColumn({"double", ColumnType::DOUBLE});
    layout.addColumn({"string", ColumnType::STRING});
    return layout;
}

/**
 * Rows cycle through `distinct` values per column (row % distinct), so every
 * column contains repeated values when rows > distinct. Includes negative
 * numbers and the empty string.
 */
inline anonbench::Dataset allTypesDataset(size_t rows, size_t distinct = 7) {
    anonbench::Dataset data(allTypesLayout());
    anonbench::Row row(data.layout());
    for (size_t i = 0; i < rows; ++i) {
        const size_t k = i % distinct;
        const auto s = static_cast<int64_t>(k) - 3;
        row.set(0,  (k % 2) == 1);
        row.set(1,  static_cast<uint8_t>(200 + k));
        row.set(2,  static_cast<uint16_t>(60000 + k));
        row.set(3,  static_cast<uint32_t>(4000000000U + k));
        row.set(4,  static_cast<uint64_t>(0xFFFFFFFF00000000ULL + k));
        row.set(5,  static_cast<int8_t>(s * 40));
        row.set(6,  static_cast<int16_t>(s * 10000));
        row.set(7,  static_cast<int32_t>(s * 700000000));
        row.set(8,  static_cast<int64_t>(s * 3000000000000LL));
        row.set(9,  static_cast<float>(s) * 1.25f);
        row.set(10, static_cast<double>(s) * 1e6 + 0.5);
        row.set(11, k == 0 ? std::string() : "value_" + std::to_string(k));
        data.addRow(row);
    }
    return data;
}

} // namespace anonbench_test
