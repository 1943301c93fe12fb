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
 * @file generator.hpp
 * @brief AnonBench Library - dataset profiles and ValueGenerator implementation
 */

#include "generator.h"
#include "dataset.hpp"
#include "errors.h"

#include <array>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <string>
#include <unordered_map>

namespace anonbench {

    // ========================================================================
    // Deterministic hash helpers
    // ========================================================================

    namespace datagen {

        // Splitmix-style finalizer for better distribution
        constexpr uint64_t mix(uint64_t h) {
            h ^= h >> 33;
            h *= 0xff51afd7ed558ccdULL;
            h ^= h >> 33;
            h *= 0xc4ceb9fe1a85ec53ULL;
            h ^= h >> 33;
            return h;
        }

        /// Pure function of (seed, row, col); no state
        constexpr uint64_t hash64(uint64_t seed, size_t row, size_t col) {
            return mix(seed ^ (row * 6364136223846793005ULL) ^ (col * 1442695040888963407ULL));
        }

        /// Uniform integer in [lo, hi]
        constexpr int64_t uniformInt(uint64_t seed, size_t row, size_t col, int64_t lo, int64_t hi) {
            const uint64_t span = static_cast<uint64_t>(hi - lo) + 1;
            return lo + static_cast<int64_t>(hash64(seed, row, col) % span);
        }

        /// Uniform double in (0, 1)
        inline double unitInterval(uint64_t h) {
            return (static_cast<double>(h >> 11) + 0.5) / static_cast<double>(1ULL << 53);
        }

        // Box-Muller transform over two hash draws
        inline double gaussianNoise(uint64_t seed, size_t row, size_t col, double mean, double stddev) {
            double u1 = unitInterval(hash64(seed, row, col * 2));
            double u2 = unitInterval(hash64(seed, row, col * 2 + 1));
            double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
            return mean + z0 * stddev;
        }

        template<size_t N>
        const std::string& pick(const std::array<std::string, N>& vocab, uint64_t seed, size_t row, size_t col) {
            return vocab[hash64(seed, row, col) % N];
        }

    } // namespace datagen

    // ========================================================================
    // Profile: test_data (default benchmark dataset)
    // ========================================================================

    inline DatasetProfile createTestDataProfile() {
        DatasetProfile p;
        p.name = "test_data";
        p.description = "id, name, age, credit card number, zip code, blood sugar";

        p.layout.addColumn({"id",                 ColumnType::UINT64});
        p.layout.addColumn({"name",               ColumnType::STRING});
        p.layout.addColumn({"age",                ColumnType::INT32});
        p.layout.addColumn({"credit_card_number", ColumnType::STRING});
        p.layout.addColumn({"zip_code",           ColumnType::STRING});
        p.layout.addColumn({"blood_sugar",        ColumnType::DOUBLE});

        p.generate = [](Row& row, uint64_t seed, size_t rowIndex) {
            char card[17];
            std::snprintf(card, sizeof(card), "4532%012llu",
                          static_cast<unsigned long long>(rowIndex % 1000000000000ULL));

            row.set(0, static_cast<uint64_t>(rowIndex));
            row.set(1, "Test" + std::to_string(rowIndex));
            row.set(2, static_cast<int32_t>(datagen::uniformInt(seed, rowIndex, 2, 18, 79)));
            row.set(3, std::string(card));
            row.set(4, "1234" + std::to_string(rowIndex % 10));
            row.set(5, datagen::gaussianNoise(seed, rowIndex, 5, 100.0, 10.0));
        };
        return p;
    }

    // ========================================================================
    // Profile: people (personal records over fixed vocabularies)
    // ========================================================================

    inline DatasetProfile createPeopleProfile() {
        DatasetProfile p;
        p.name = "people";
        p.description = "country, name, age, ssn, height, gender, company";

        p.layout.addColumn({"country", ColumnType::STRING});
        p.layout.addColumn({"name",    ColumnType::STRING});
        p.layout.addColumn({"age",     ColumnType::INT32});
        p.layout.addColumn({"ssn",     ColumnType::STRING});
        p.layout.addColumn({"height",  ColumnType::UINT16});
        p.layout.addColumn({"gender",  ColumnType::STRING});
        p.layout.addColumn({"company", ColumnType::STRING});

        p.generate = [](Row& row, uint64_t seed, size_t rowIndex) {
            static const std::array<std::string, 12> countries = {
                "Germany", "France", "Spain", "Italy", "Netherlands", "Poland",
                "Sweden", "Norway", "Canada", "Brazil", "Japan", "India"
            };
            static const std::array<std::string, 16> firstNames = {
                "Anna", "Ben", "Clara", "David", "Emma", "Felix", "Greta", "Hugo",
                "Ida", "Jonas", "Klara", "Lukas", "Mia", "Noah", "Olivia", "Paul"
            };
            static const std::array<std::string, 16> lastNames = {
                "Schmidt", "Martin", "Garcia", "Rossi", "de Vries", "Nowak", "Larsson", "Hansen",
                "Tremblay", "Silva", "Sato", "Patel", "Weber", "Meyer", "Fischer", "Wagner"
            };
            static const std::array<std::string, 10> companies = {
                "Acme Corp", "Globex", "Initech", "Umbrella", "Stark Industries",
                "Wayne Enterprises", "Hooli", "Vandelay Industries", "Soylent", "Tyrell"
            };

            char ssn[12];
            std::snprintf(ssn, sizeof(ssn), "%03d-%02d-%04d",
                          static_cast<int>(datagen::uniformInt(seed, rowIndex, 30, 1, 899)),
                          static_cast<int>(datagen::uniformInt(seed, rowIndex, 31, 1, 99)),
                          static_cast<int>(datagen::uniformInt(seed, rowIndex, 32, 1, 9999)));

            row.set(0, datagen::pick(countries, seed, rowIndex, 0));
            row.set(1, datagen::pick(firstNames, seed, rowIndex, 10) + " " + datagen::pick(lastNames, seed, rowIndex, 11));
            row.set(2, static_cast<int32_t>(datagen::uniformInt(seed, rowIndex, 2, 1, 100)));
            row.set(3, std::string(ssn));
            row.set(4, static_cast<uint16_t>(datagen::uniformInt(seed, rowIndex, 4, 140, 210)));
            row.set(5, std::string((datagen::hash64(seed, rowIndex, 5) & 1) ? "M" : "F"));
            row.set(6, datagen::pick(companies, seed, rowIndex, 6));
        };
        return p;
    }

    // ========================================================================
    // Profile registry
    // ========================================================================

    inline const std::vector<DatasetProfile>& listProfiles() {
        static const std::vector<DatasetProfile> profiles = {
            createTestDataProfile(),
            createPeopleProfile()
        };
        return profiles;
    }

    inline const DatasetProfile& getProfile(const std::string& name) {
        const auto& profiles = listProfiles();
        static const std::unordered_map<std::string, size_t> profile_index = [] {
            std::unordered_map<std::string, size_t> index;
            const auto& all = listProfiles();
            for (size_t i = 0; i < all.size(); ++i) {
                index.emplace(all[i].name, i);
            }
            return index;
        }();

        auto it = profile_index.find(name);
        if (it != profile_index.end()) {
            return profiles[it->second];
        }
        throw UnknownProfileError(name);
    }

    // ========================================================================
    // ValueGenerator Implementation
    // ========================================================================

    inline ValueGenerator::ValueGenerator(const std::string& profile, uint64_t seed)
        : profile_(&getProfile(profile)), seed_(seed)
    {
    }

    inline Dataset ValueGenerator::generate(int64_t size) const {
        if (size < 0) {
            throw InvalidSizeError(size);
        }

        Dataset data(profile_->layout);
        data.reserve(static_cast<size_t>(size));
        Row row(profile_->layout);
        for (size_t i = 0; i < static_cast<size_t>(size); ++i) {
            profile_->generate(row, seed_, i);
            data.addRow(row);
        }
        return data;
    }

    inline Dataset generate(int64_t size, uint64_t seed) {
        return ValueGenerator(DEFAULT_PROFILE, seed).generate(size);
    }

} // namespace anonbench
