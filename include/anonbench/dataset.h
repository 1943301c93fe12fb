/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "definitions.h"
#include "layout.h"
#include "row.h"

namespace anonbench {

    /**
     * @brief Ordered sequence of records sharing one layout.
     *
     * Invariant: every row conforms to layout() (same column count, same types).
     * addRow() enforces it; strategies that write cells through row(i) keep each
     * cell's type.
     */
    class Dataset {
        Layout              layout_;
        std::vector<Row>    rows_;

    public:
        Dataset() = default;
        explicit Dataset(const Layout& layout) : layout_(layout) {}

        const Layout&           layout() const                              { return layout_; }
        size_t                  size() const                                { return rows_.size(); }
        bool                    empty() const                               { return rows_.empty(); }
        size_t                  columnCount() const                         { return layout_.columnCount(); }
        void                    reserve(size_t rows)                        { rows_.reserve(rows); }

        void                    addRow(const Row& row);
        void                    addRow(Row&& row);
        const Row&              row(size_t index) const                     { if constexpr (RANGE_CHECKING) { return rows_.at(index); } else { return rows_[index]; } }
        Row&                    row(size_t index)                           { if constexpr (RANGE_CHECKING) { return rows_.at(index); } else { return rows_[index]; } }
        const std::vector<Row>& rows() const                                { return rows_; }

        const ValueType&        at(size_t row, size_t column) const         { return this->row(row)[column]; }
        std::vector<ValueType>  column(size_t index) const;

        /** True when both datasets have the same layout and row count (values may differ). */
        bool                    sameShape(const Dataset& other) const       { return layout_ == other.layout_ && rows_.size() == other.rows_.size(); }
        bool                    operator==(const Dataset& other) const      { return layout_ == other.layout_ && rows_ == other.rows_; }
    };

} // namespace anonbench
