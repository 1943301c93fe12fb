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
 * @file row.hpp
 * @brief AnonBench Library - Row implementations
 */

#include "row.h"
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace anonbench {

    // ========================================================================
    // Row Implementation
    // ========================================================================

    inline Row::Row(const Layout& layout)
        : data_(layout.columnCount())
    {
        for (size_t i = 0; i < layout.columnCount(); ++i) {
            data_[i] = defaultValue(layout.columnType(i));
        }
    }

    /** Reset the row to the default values of the given layout */
    inline void Row::clear(const Layout& layout)
    {
        data_.resize(layout.columnCount());
        for (size_t i = 0; i < layout.columnCount(); ++i) {
            data_[i] = defaultValue(layout.columnType(i));
        }
    }

    /** Get the value at the specified column index */
    template<typename T>
    const T& Row::get(size_t index) const {
        if constexpr (std::is_same_v<T, ValueType>) {
            if constexpr (RANGE_CHECKING) {
                return data_.at(index);
            }
            return data_[index];
        } else {
            if constexpr (RANGE_CHECKING) {
                return std::get<T>(data_.at(index)); // Will throw on type mismatch
            }
            return std::get<T>(data_[index]);
        }
    }

    /** Set the value at the specified column index. The value type must match the column type. */
    inline void Row::set(size_t index, const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if (RANGE_CHECKING && index >= data_.size()) {
            throw std::out_of_range("Row::set: column index " + std::to_string(index) + " out of range");
        }
        if constexpr (std::is_same_v<T, ValueType>) {
            if (value.index() != data_[index].index()) {
                throw std::runtime_error("Row::set: type mismatch at column " + std::to_string(index));
            }
            data_[index] = value;
        } else if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>) {
            set(index, std::string(value));
        } else {
            if (!std::holds_alternative<T>(data_[index])) {
                throw std::runtime_error("Row::set: type mismatch at column " + std::to_string(index)
                                         + " (expected " + toString(toColumnType(data_[index])) + ")");
            }
            data_[index] = value;
        }
    }

    inline bool Row::conformsTo(const Layout& layout) const {
        if (data_.size() != layout.columnCount()) {
            return false;
        }
        for (size_t i = 0; i < data_.size(); ++i) {
            if (!isType(data_[i], layout.columnType(i))) {
                return false;
            }
        }
        return true;
    }

} // namespace anonbench
