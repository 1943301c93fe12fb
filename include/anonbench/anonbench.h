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
 * @file anonbench.h
 * @brief AnonBench Library - Main Header with Declarations
 *
 * A C++20 header-only library for anonymizing tabular data with
 * interchangeable strategies and benchmarking their throughput.
 *
 * This header includes all AnonBench components:
 * - Layout, Row, Dataset: typed tabular data
 * - ValueGenerator: reproducible synthetic datasets
 * - DeterministicStrategy, ShuffleStrategy, BitwiseStrategy
 * - StrategyRegistry: method name -> strategy
 * - Contract checks: verification of each method's guarantees
 * - BenchmarkRunner: timed (method, size) measurements
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Core component declarations
#include "layout.h"
#include "row.h"
#include "dataset.h"
#include "generator.h"
#include "keyed_hash.h"
#include "strategy.h"
#include "deterministic.h"
#include "shuffle.h"
#include "bitwise.h"
#include "registry.h"
#include "contract.h"
#include "runner.h"

// Include implementations
#include "layout.hpp"
#include "row.hpp"
#include "dataset.hpp"
#include "checksum.hpp"
#include "generator.hpp"
#include "keyed_hash.hpp"
#include "deterministic.hpp"
#include "shuffle.hpp"
#include "bitwise.hpp"
#include "registry.hpp"
#include "contract.hpp"
#include "runner.hpp"
