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

namespace anonbench {

    /**
     * @brief One record of a dataset: one value per layout column, in layout order.
     *
     * A row does not keep a reference to its layout; the owning Dataset does.
     * Constructing from a layout fills every column with the default value of its type,
     * which fixes the type of each cell: set() only accepts values of that type.
     */
    class Row {
        std::vector<ValueType>    data_;    // values for each column

    public:
        Row() = default;
        explicit Row(const Layout& layout);
        explicit Row(std::vector<ValueType> values) : data_(std::move(values)) {}

        void                            clear(const Layout& layout);
        size_t                          size() const                    { return data_.size(); }
        const std::vector<ValueType>&   values() const                  { return data_; }

                                        template<typename T = ValueType>
        const T&                        get(size_t index) const;
        void                            set(size_t index, const auto& value);

        /** Raw access used by strategies that assign whole cells. */
        ValueType&                      operator[](size_t index)        { return data_[index]; }
        const ValueType&                operator[](size_t index) const  { return data_[index]; }

        bool                            conformsTo(const Layout& layout) const;
        bool                            operator==(const Row& other) const = default;
    };

} // namespace anonbench
