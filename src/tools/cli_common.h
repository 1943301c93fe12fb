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
 * @file cli_common.h
 * @brief Shared utilities for AnonBench CLI tools
 *
 * Provides:
 *   - splitList():            "a,b,,c" → {"a", "b", "c"}
 *   - parsePositiveSize():    dataset size argument → int64_t (> 0)
 *   - parseCount():           unsigned count argument (> 0)
 *   - parseSeed():            "N" | "0x.." | "random" → optional seed
 *   - parseShuffleMode():     "permute" | "rotate" → ShuffleMode
 *   - formatMs():             nanoseconds → "12.345 ms"
 *   - printLayoutSummary():   tabular layout dump to any ostream
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <anonbench/anonbench.h>

namespace anonbench_cli {

// ── List / number parsing ──────────────────────────────────────────

/// Split a comma-separated list, dropping empty entries.
inline std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream in(text);
    while (std::getline(in, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

/// Parse a dataset size. Throws std::runtime_error unless the whole string is an integer > 0.
inline int64_t parsePositiveSize(const std::string& text) {
    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid size '" + text + "': expected a positive integer.");
    }
    if (pos != text.size() || value <= 0) {
        throw std::runtime_error("Invalid size '" + text + "': expected a positive integer.");
    }
    return static_cast<int64_t>(value);
}

/// Parse a count option such as --trials. Throws std::runtime_error unless > 0.
inline size_t parseCount(const std::string& option, const std::string& text) {
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    if (pos != text.size() || value == 0 || text.front() == '-') {
        throw std::runtime_error(option + " must be a positive integer, got " + text);
    }
    return static_cast<size_t>(value);
}

/// Parse --seed: decimal or 0x-prefixed hex; "random" yields nullopt.
inline std::optional<uint64_t> parseSeed(const std::string& text) {
    if (text == "random") {
        return std::nullopt;
    }
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos, 0);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid seed '" + text + "'. Expected an unsigned integer or 'random'.");
    }
    if (pos != text.size() || text.front() == '-') {
        throw std::runtime_error("Invalid seed '" + text + "'. Expected an unsigned integer or 'random'.");
    }
    return static_cast<uint64_t>(value);
}

/// Parse --shuffle-mode. Throws std::runtime_error on invalid value.
inline anonbench::ShuffleMode parseShuffleMode(const std::string& mode) {
    if (mode == "permute") return anonbench::ShuffleMode::PERMUTE;
    if (mode == "rotate")  return anonbench::ShuffleMode::ROTATE;
    throw std::runtime_error("Unknown shuffle mode '" + mode + "'. Expected: permute, rotate.");
}

// ── Formatting ─────────────────────────────────────────────────────

inline std::string formatMs(std::chrono::nanoseconds ns) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << std::chrono::duration<double, std::milli>(ns).count() << " ms";
    return oss.str();
}

// ── printLayoutSummary ─────────────────────────────────────────────

/// Print vertical layout table: type histogram + full column listing.
inline void printLayoutSummary(const std::string& label,
                               const anonbench::Layout& layout,
                               std::ostream& os = std::cerr) {
    const size_t n = layout.columnCount();
    if (n == 0) {
        os << label << ": (empty)\n";
        return;
    }

    std::map<std::string, size_t> type_counts;
    size_t max_name_len = 4;   // minimum width for "Name" header
    for (size_t i = 0; i < n; ++i) {
        type_counts[anonbench::toString(layout.columnType(i))]++;
        if (layout.columnName(i).size() > max_name_len) max_name_len = layout.columnName(i).size();
    }

    os << label << " (" << n << " columns)  [ ";
    bool first = true;
    for (const auto& [tname, cnt] : type_counts) {
        if (!first) os << ", ";
        os << cnt << "x" << tname;
        first = false;
    }
    os << " ]\n";

    os << "  " << std::right << std::setw(3) << "Idx"
       << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << "Name"
       << "  Type\n";
    os << "  " << std::string(3, '-')
       << "  " << std::string(max_name_len, '-')
       << "  " << std::string(6, '-') << "\n";
    for (size_t i = 0; i < n; ++i) {
        os << "  " << std::right << std::setw(3) << i
           << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << layout.columnName(i)
           << "  " << anonbench::toString(layout.columnType(i)) << "\n";
    }
    os << std::right;
}

} // namespace anonbench_cli
