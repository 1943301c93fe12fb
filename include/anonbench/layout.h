/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "definitions.h"

namespace anonbench {

    struct ColumnDefinition {
        ColumnDefinition() : name(""), type(ColumnType::STRING) {}
        ColumnDefinition(const std::string& n, ColumnType t)
            : name(n), type(t) {}
        std::string name;
        ColumnType type;
    };

    /**
     * @brief Represents the column layout of a dataset: ordered, uniquely named, typed columns.
     * Every row of a dataset conforms to its layout.
     */
    class Layout {
        std::vector<std::string>                column_names_;
        std::unordered_map<std::string, size_t> column_index_;
        std::vector<ColumnType>                 column_types_;

    public:
        Layout() = default;
        explicit Layout(const std::vector<ColumnDefinition>& columns);

        // Basic Layout information
        bool hasColumn(const std::string& name) const               { return column_index_.find(name) != column_index_.end(); }
        size_t columnCount() const                                  { return column_names_.size(); }
        size_t columnIndex(const std::string& name) const;
        const std::string& columnName(size_t index) const           { if constexpr (RANGE_CHECKING) {return column_names_.at(index);} else { return column_names_[index]; } }
        ColumnType columnType(size_t index) const                   { if constexpr (RANGE_CHECKING) {return column_types_.at(index);} else { return column_types_[index]; } }
        const std::vector<ColumnType>& columnTypes() const          { return column_types_; }
        void setColumns(const std::vector<ColumnDefinition>& columns);

        bool operator==(const Layout& other) const                  { return column_names_ == other.column_names_ && column_types_ == other.column_types_; }

        void clear();
        bool addColumn(const ColumnDefinition& column);
    };

} // namespace anonbench
