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
 * @file layout.hpp
 * @brief AnonBench Library - Layout implementations
 */

#include "layout.h"
#include <iostream>
#include <stdexcept>

namespace anonbench {

    // ========================================================================
    // Layout Implementation
    // ========================================================================

    inline Layout::Layout(const std::vector<ColumnDefinition>& columns) {
        setColumns(columns);
    }

    inline size_t Layout::columnIndex(const std::string& columnName) const {
        auto it = column_index_.find(columnName);
        if (it == column_index_.end()) {
            throw std::out_of_range("Unknown column: " + columnName);
        }
        return it->second;
    }

    inline bool Layout::addColumn(const ColumnDefinition& column) {
        if (column_names_.size() >= MAX_COLUMN_COUNT) {
            std::cerr << "Cannot exceed maximum column count" << std::endl;
            return false;
        }
        if (column.name.empty()) {
            std::cerr << "Column name cannot be empty" << std::endl;
            return false;
        }
        if (column_index_.find(column.name) != column_index_.end()) {
            std::cerr << "Duplicate column name: " + column.name << std::endl;
            return false;
        }

        column_names_.push_back(column.name);
        column_types_.push_back(column.type);
        column_index_[column.name] = column_names_.size() - 1;
        return true;
    }

    inline void Layout::clear() {
        column_names_.clear();
        column_types_.clear();
        column_index_.clear();
    }

    inline void Layout::setColumns(const std::vector<ColumnDefinition>& columns) {
        clear();
        for (const auto& column : columns) {
            if (!addColumn(column)) {
                throw std::invalid_argument("Invalid column definition: '" + column.name + "'");
            }
        }
    }

} // namespace anonbench
