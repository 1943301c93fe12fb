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
 * @file runner.h
 * @brief Benchmark loop: (method, size) pairs -> MeasurementRecords.
 *
 * For every pair, method-major in the order given:
 *   1. generate the dataset (ValueGenerator, fixed seed)
 *   2. resolve the strategy (StrategyRegistry)
 *   3. time exactly the anonymize() call, trials times
 *   4. optionally time restore() and verify the method's contract
 *   5. emit the record
 *
 * Generation, resolution and verification are outside the timed region.
 * All method names are resolved before the first dataset is generated, so an
 * unknown name aborts the run with no work done. An InvalidSizeError from the
 * generator aborts the remaining pairs; records already produced have been
 * passed to the callback.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "checksum.hpp"
#include "definitions.h"
#include "generator.h"
#include "registry.h"
#include "strategy.h"

namespace anonbench {

    /**
     * @brief Result of one benchmark iteration. Immutable once created.
     */
    class MeasurementRecord {
        Method                                  method_;
        int64_t                                 size_;
        std::chrono::nanoseconds                elapsed_;           // mean over trials
        std::chrono::nanoseconds                min_elapsed_;       // fastest trial
        size_t                                  trials_;
        std::optional<std::chrono::nanoseconds> restore_elapsed_;   // mean over trials
        Checksum::hash_t                        input_digest_;
        Checksum::hash_t                        output_digest_;
        bool                                    verified_;

    public:
        MeasurementRecord(Method method, int64_t size,
                          std::chrono::nanoseconds elapsed, std::chrono::nanoseconds minElapsed, size_t trials,
                          std::optional<std::chrono::nanoseconds> restoreElapsed,
                          Checksum::hash_t inputDigest, Checksum::hash_t outputDigest, bool verified)
            : method_(method), size_(size), elapsed_(elapsed), min_elapsed_(minElapsed), trials_(trials),
              restore_elapsed_(restoreElapsed), input_digest_(inputDigest), output_digest_(outputDigest),
              verified_(verified) {}

        Method                                          method() const          { return method_; }
        std::string                                     methodName() const      { return anonbench::methodName(method_); }
        int64_t                                         size() const            { return size_; }
        std::chrono::nanoseconds                        elapsed() const         { return elapsed_; }
        std::chrono::nanoseconds                        minElapsed() const      { return min_elapsed_; }
        size_t                                          trials() const          { return trials_; }
        const std::optional<std::chrono::nanoseconds>&  restoreElapsed() const  { return restore_elapsed_; }
        Checksum::hash_t                                inputDigest() const     { return input_digest_; }
        Checksum::hash_t                                outputDigest() const    { return output_digest_; }
        bool                                            verified() const        { return verified_; }

        double                                          elapsedMs() const       { return std::chrono::duration<double, std::milli>(elapsed_).count(); }
        double                                          rowsPerSecond() const;

        /// Single-line JSON object
        std::string                                     toJson() const;
    };

    using RecordCallback = std::function<void(const MeasurementRecord&)>;

    struct RunnerOptions {
        std::string     profile         = DEFAULT_PROFILE;
        uint64_t        seed            = DEFAULT_SEED;
        size_t          trials          = 1;        // >= 1; record holds mean and fastest
        bool            measure_restore = false;    // time restore() of reversible methods
        bool            verify          = false;    // throw ContractViolationError on a broken guarantee
        std::ostream*   log             = nullptr;  // progress lines, not owned
    };

    class BenchmarkRunner {
        const StrategyRegistry& registry_;
        RunnerOptions           options_;
        ValueGenerator          generator_;

    public:
        /** @throws UnknownProfileError, std::invalid_argument if trials is 0 */
        explicit BenchmarkRunner(const StrategyRegistry& registry, RunnerOptions options = {});

        const RunnerOptions&            options() const     { return options_; }

        std::vector<MeasurementRecord>  run(const std::vector<std::string>& methods,
                                            const std::vector<int64_t>& sizes,
                                            const RecordCallback& onRecord = {}) const;

        std::vector<MeasurementRecord>  run(const std::vector<Method>& methods,
                                            const std::vector<int64_t>& sizes,
                                            const RecordCallback& onRecord = {}) const;

        /// One (method, size) pair
        MeasurementRecord               measure(Method method, int64_t size) const;
    };

} // namespace anonbench
