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
 * @file contract.hpp
 * @brief AnonBench Library - contract check implementations
 */

#include "contract.h"
#include "checksum.hpp"
#include "errors.h"
#include "registry.hpp"

#include <string>
#include <unordered_map>

namespace anonbench {

    inline bool sameShape(const Dataset& input, const Dataset& output) {
        if (!input.sameShape(output)) {
            return false;
        }
        for (const auto& row : output.rows()) {
            if (!row.conformsTo(output.layout())) {
                return false;
            }
        }
        return true;
    }

    inline bool sameColumnMultiset(const Dataset& input, const Dataset& output, size_t column) {
        if (input.size() != output.size()) {
            return false;
        }
        std::unordered_map<std::string, int64_t> counts;
        for (size_t r = 0; r < input.size(); ++r) {
            ++counts[valueKey(input.at(r, column))];
        }
        for (size_t r = 0; r < output.size(); ++r) {
            auto it = counts.find(valueKey(output.at(r, column)));
            if (it == counts.end() || it->second == 0) {
                return false;
            }
            --it->second;
        }
        return true;
    }

    inline bool sameColumnMultiset(const Dataset& input, const Dataset& output) {
        if (!input.sameShape(output)) {
            return false;
        }
        for (size_t c = 0; c < input.columnCount(); ++c) {
            if (!sameColumnMultiset(input, output, c)) {
                return false;
            }
        }
        return true;
    }

    inline bool consistentMapping(const Dataset& input, const Dataset& output, size_t column) {
        if (input.size() != output.size()) {
            return false;
        }
        std::unordered_map<std::string, std::string> mapping;
        for (size_t r = 0; r < input.size(); ++r) {
            std::string out = valueKey(output.at(r, column));
            auto [it, inserted] = mapping.emplace(valueKey(input.at(r, column)), out);
            if (!inserted && it->second != out) {
                return false;
            }
        }
        return true;
    }

    inline bool identical(const Dataset& a, const Dataset& b) {
        if (!a.sameShape(b)) {
            return false;
        }
        for (size_t r = 0; r < a.size(); ++r) {
            for (size_t c = 0; c < a.columnCount(); ++c) {
                if (valueKey(a.at(r, c)) != valueKey(b.at(r, c))) {
                    return false;
                }
            }
        }
        return true;
    }

    inline void verifyContract(const Strategy& strategy, const Dataset& input, const Dataset& output) {
        const std::string method = strategy.name();
        if (!sameShape(input, output)) {
            throw ContractViolationError(method + ": output shape differs from input ("
                                         + std::to_string(input.size()) + " rows in, "
                                         + std::to_string(output.size()) + " rows out)");
        }

        switch (strategy.method()) {
            case Method::DETERMINISTIC:
                for (size_t c = 0; c < input.columnCount(); ++c) {
                    if (!consistentMapping(input, output, c)) {
                        throw ContractViolationError(method + ": inconsistent mapping in column '"
                                                     + input.layout().columnName(c) + "'");
                    }
                }
                break;
            case Method::SHUFFLE:
                for (size_t c = 0; c < input.columnCount(); ++c) {
                    if (!sameColumnMultiset(input, output, c)) {
                        throw ContractViolationError(method + ": value multiset changed in column '"
                                                     + input.layout().columnName(c) + "'");
                    }
                }
                if (strategy.reversible() && !identical(strategy.restore(output), input)) {
                    throw ContractViolationError(method + ": restore does not reproduce the input");
                }
                break;
            case Method::BITWISE:
                if (!identical(strategy.restore(output), input)) {
                    throw ContractViolationError(method + ": restore does not reproduce the input");
                }
                break;
        }
    }

} // namespace anonbench
