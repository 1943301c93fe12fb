/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include <chrono>

namespace anonbench {

    /// Wall-clock stopwatch over std::chrono::steady_clock
    class Timer {
    public:
        using clock = std::chrono::steady_clock;

        void                        start()             { start_ = clock::now(); stop_ = start_; }
        void                        stop()              { stop_ = clock::now(); }

        std::chrono::nanoseconds    elapsed() const     { return std::chrono::duration_cast<std::chrono::nanoseconds>(stop_ - start_); }
        double                      elapsedMs() const   { return std::chrono::duration<double, std::milli>(stop_ - start_).count(); }

    private:
        clock::time_point start_ = clock::now();
        clock::time_point stop_  = start_;
    };

} // namespace anonbench
