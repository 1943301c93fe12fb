/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_micro_strategies.cpp
 * @brief Micro-benchmarks for the anonymization strategies and their primitives.
 *
 * Dataset generation happens outside the timed loop; each iteration runs one
 * anonymize() (or restore()) over the whole dataset.
 */

#include <benchmark/benchmark.h>
#include <anonbench/anonbench.h>
#include <cstdint>

using namespace anonbench;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

const StrategyRegistry& registry() {
    static const StrategyRegistry r;
    return r;
}

void runAnonymize(benchmark::State& state, Method method) {
    const int64_t size = state.range(0);
    const Dataset input = generate(size);
    const Strategy& strategy = registry().resolve(method);

    for (auto _ : state) {
        Dataset output = strategy.anonymize(input);
        benchmark::DoNotOptimize(output);
    }
    state.SetItemsProcessed(state.iterations() * size);
}

} // namespace

// ============================================================================
// Dataset-level benchmarks
// ============================================================================

static void BM_Deterministic_Anonymize(benchmark::State& state) {
    runAnonymize(state, Method::DETERMINISTIC);
}
BENCHMARK(BM_Deterministic_Anonymize)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Shuffle_Anonymize(benchmark::State& state) {
    runAnonymize(state, Method::SHUFFLE);
}
BENCHMARK(BM_Shuffle_Anonymize)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Bitwise_Anonymize(benchmark::State& state) {
    runAnonymize(state, Method::BITWISE);
}
BENCHMARK(BM_Bitwise_Anonymize)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Bitwise_Restore(benchmark::State& state) {
    const int64_t size = state.range(0);
    const Strategy& strategy = registry().resolve(Method::BITWISE);
    const Dataset encoded = strategy.anonymize(generate(size));

    for (auto _ : state) {
        Dataset restored = strategy.restore(encoded);
        benchmark::DoNotOptimize(restored);
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Bitwise_Restore)->Arg(100)->Arg(1000)->Arg(10000);

// ============================================================================
// Primitive benchmarks
// ============================================================================

static void BM_KeyedHash_Digest(benchmark::State& state) {
    KeyedHash mac(DEFAULT_DETERMINISTIC_KEY);
    const std::string message(static_cast<size_t>(state.range(0)), 'x');

    for (auto _ : state) {
        auto digest = mac.digest("column", message);
        benchmark::DoNotOptimize(digest);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_KeyedHash_Digest)->Arg(8)->Arg(32)->Arg(256);

static void BM_Bitwise_EncodeString(benchmark::State& state) {
    const auto& bitwise = registry().resolve(Method::BITWISE).as<BitwiseStrategy>();
    const ValueType value = std::string(static_cast<size_t>(state.range(0)), 'a');

    for (auto _ : state) {
        ValueType encoded = bitwise.encodeValue(value);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Bitwise_EncodeString)->Arg(8)->Arg(64)->Arg(4096);

static void BM_Generate_TestData(benchmark::State& state) {
    const int64_t size = state.range(0);
    for (auto _ : state) {
        Dataset data = generate(size);
        benchmark::DoNotOptimize(data);
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Generate_TestData)->Arg(1000)->Arg(10000);

static void BM_DatasetDigest(benchmark::State& state) {
    const int64_t size = state.range(0);
    const Dataset data = generate(size);
    for (auto _ : state) {
        auto digest = datasetDigest(data);
        benchmark::DoNotOptimize(digest);
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_DatasetDigest)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
