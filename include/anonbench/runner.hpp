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
 * @file runner.hpp
 * @brief AnonBench Library - MeasurementRecord and BenchmarkRunner implementations
 */

#include "runner.h"
#include "contract.hpp"
#include "generator.hpp"
#include "registry.hpp"
#include "timer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace anonbench {

    // ========================================================================
    // MeasurementRecord Implementation
    // ========================================================================

    inline double MeasurementRecord::rowsPerSecond() const {
        const double seconds = std::chrono::duration<double>(elapsed_).count();
        return seconds > 0.0 ? static_cast<double>(size_) / seconds : 0.0;
    }

    inline std::string MeasurementRecord::toJson() const {
        std::ostringstream js;
        js << "{"
           << "\"method\":\"" << methodName() << "\""
           << ",\"size\":" << size_
           << ",\"trials\":" << trials_
           << ",\"elapsed_ns\":" << elapsed_.count()
           << ",\"min_elapsed_ns\":" << min_elapsed_.count();
        if (restore_elapsed_) {
            js << ",\"restore_elapsed_ns\":" << restore_elapsed_->count();
        } else {
            js << ",\"restore_elapsed_ns\":null";
        }
        js << ",\"rows_per_sec\":" << std::fixed << std::setprecision(1) << rowsPerSecond()
           << ",\"input_digest\":\"" << std::hex << std::setw(16) << std::setfill('0') << input_digest_ << "\""
           << ",\"output_digest\":\"" << std::setw(16) << output_digest_ << "\"" << std::dec
           << ",\"verified\":" << (verified_ ? "true" : "false")
           << "}";
        return js.str();
    }

    // ========================================================================
    // BenchmarkRunner Implementation
    // ========================================================================

    inline BenchmarkRunner::BenchmarkRunner(const StrategyRegistry& registry, RunnerOptions options)
        : registry_(registry), options_(std::move(options)), generator_(options_.profile, options_.seed)
    {
        if (options_.trials == 0) {
            throw std::invalid_argument("trials must be >= 1");
        }
    }

    inline std::vector<MeasurementRecord> BenchmarkRunner::run(const std::vector<std::string>& methods,
                                                               const std::vector<int64_t>& sizes,
                                                               const RecordCallback& onRecord) const {
        std::vector<Method> resolved;
        resolved.reserve(methods.size());
        for (const auto& name : methods) {
            resolved.push_back(registry_.resolve(name).method());
        }
        return run(resolved, sizes, onRecord);
    }

    inline std::vector<MeasurementRecord> BenchmarkRunner::run(const std::vector<Method>& methods,
                                                               const std::vector<int64_t>& sizes,
                                                               const RecordCallback& onRecord) const {
        // First occurrence wins
        std::vector<Method> unique;
        for (Method m : methods) {
            registry_.resolve(m);
            if (std::find(unique.begin(), unique.end(), m) == unique.end()) {
                unique.push_back(m);
            }
        }

        std::vector<MeasurementRecord> records;
        records.reserve(unique.size() * sizes.size());
        for (Method m : unique) {
            for (int64_t size : sizes) {
                records.push_back(measure(m, size));
                if (onRecord) {
                    onRecord(records.back());
                }
            }
        }
        return records;
    }

    inline MeasurementRecord BenchmarkRunner::measure(Method method, int64_t size) const {
        const Dataset input = generator_.generate(size);
        const Strategy& strategy = registry_.resolve(method);

        Timer timer;
        std::chrono::nanoseconds total{0};
        std::chrono::nanoseconds fastest = std::chrono::nanoseconds::max();
        Dataset output;
        for (size_t t = 0; t < options_.trials; ++t) {
            timer.start();
            output = strategy.anonymize(input);
            timer.stop();
            total += timer.elapsed();
            fastest = std::min(fastest, timer.elapsed());
        }
        const auto trials = static_cast<std::chrono::nanoseconds::rep>(options_.trials);

        std::optional<std::chrono::nanoseconds> restoreElapsed;
        if (options_.measure_restore && strategy.reversible()) {
            std::chrono::nanoseconds restoreTotal{0};
            for (size_t t = 0; t < options_.trials; ++t) {
                timer.start();
                Dataset restored = strategy.restore(output);
                timer.stop();
                restoreTotal += timer.elapsed();
            }
            restoreElapsed = restoreTotal / trials;
        }

        if (options_.verify) {
            verifyContract(strategy, input, output);
        }

        MeasurementRecord record(method, size, total / trials, fastest, options_.trials, restoreElapsed,
                                 datasetDigest(input), datasetDigest(output), options_.verify);

        if (options_.log) {
            *options_.log << "  " << std::left << std::setw(14) << record.methodName()
                          << std::right << std::setw(8) << size << " rows  "
                          << std::fixed << std::setprecision(3) << record.elapsedMs() << " ms";
            if (restoreElapsed) {
                *options_.log << "  restore "
                              << std::chrono::duration<double, std::milli>(*restoreElapsed).count() << " ms";
            }
            *options_.log << "\n";
        }
        return record;
    }

} // namespace anonbench
