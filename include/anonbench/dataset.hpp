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
 * @file dataset.hpp
 * @brief AnonBench Library - Dataset implementations
 */

#include "dataset.h"
#include "errors.h"
#include "row.hpp"
#include "layout.hpp"

#include <string>
#include <utility>

namespace anonbench {

    inline void Dataset::addRow(const Row& row) {
        if (!row.conformsTo(layout_)) {
            throw LayoutError("row " + std::to_string(rows_.size()) + " does not match the dataset layout ("
                              + std::to_string(row.size()) + " values for "
                              + std::to_string(layout_.columnCount()) + " columns)");
        }
        rows_.push_back(row);
    }

    inline void Dataset::addRow(Row&& row) {
        if (!row.conformsTo(layout_)) {
            throw LayoutError("row " + std::to_string(rows_.size()) + " does not match the dataset layout ("
                              + std::to_string(row.size()) + " values for "
                              + std::to_string(layout_.columnCount()) + " columns)");
        }
        rows_.push_back(std::move(row));
    }

    inline std::vector<ValueType> Dataset::column(size_t index) const {
        if (index >= layout_.columnCount()) {
            throw std::out_of_range("Column index out of range: " + std::to_string(index));
        }
        std::vector<ValueType> values;
        values.reserve(rows_.size());
        for (const auto& r : rows_) {
            values.push_back(r[index]);
        }
        return values;
    }

} // namespace anonbench
