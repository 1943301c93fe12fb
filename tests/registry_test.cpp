/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file registry_test.cpp
 * @brief Tests for method names, the Strategy handle and StrategyRegistry
 */

#include <gtest/gtest.h>
#include <anonbench/anonbench.h>

#include <string>
#include <vector>

using namespace anonbench;

TEST(MethodTest, NamesRoundTrip) {
    for (Method m : ALL_METHODS) {
        EXPECT_EQ(parseMethod(methodName(m)), m);
    }
    EXPECT_EQ(methodName(Method::DETERMINISTIC), "deterministic");
    EXPECT_EQ(methodName(Method::SHUFFLE), "shuffle");
    EXPECT_EQ(methodName(Method::BITWISE), "bitwise");
}

TEST(MethodTest, ParseIsExact) {
    EXPECT_THROW(parseMethod("Shuffle"), UnknownMethodError);
    EXPECT_THROW(parseMethod(" shuffle"), UnknownMethodError);
    EXPECT_THROW(parseMethod(""), UnknownMethodError);
}

TEST(RegistryTest, ResolvesEveryKnownName) {
    const StrategyRegistry registry;
    EXPECT_EQ(registry.resolve("deterministic").method(), Method::DETERMINISTIC);
    EXPECT_EQ(registry.resolve("shuffle").method(), Method::SHUFFLE);
    EXPECT_EQ(registry.resolve("bitwise").method(), Method::BITWISE);
    EXPECT_EQ(registry.resolve(Method::BITWISE).name(), "bitwise");
}

TEST(RegistryTest, UnknownNameThrowsWithName) {
    const StrategyRegistry registry;
    try {
        registry.resolve("rot13");
        FAIL() << "expected UnknownMethodError";
    } catch (const UnknownMethodError& e) {
        EXPECT_EQ(e.name(), "rot13");
        EXPECT_NE(std::string(e.what()).find("rot13"), std::string::npos);
    }
}

TEST(RegistryTest, ListsMethodsInRegistryOrder) {
    const StrategyRegistry registry;
    EXPECT_EQ(registry.methods(), (std::vector<Method>{Method::DETERMINISTIC, Method::SHUFFLE, Method::BITWISE}));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"deterministic", "shuffle", "bitwise"}));
}

TEST(RegistryTest, ResolveReturnsTheSameStrategyEveryTime) {
    const StrategyRegistry registry;
    EXPECT_EQ(&registry.resolve("shuffle"), &registry.resolve(Method::SHUFFLE));
    EXPECT_EQ(&registry.resolve("bitwise"), &registry.resolve("bitwise"));
}

TEST(RegistryTest, OptionsReachTheStrategies) {
    StrategyOptions options;
    options.deterministic.token_bytes = 4;
    options.shuffle.mode = ShuffleMode::ROTATE;
    options.bitwise.primary_key = "p3";
    options.bitwise.secondary_key = "s";
    const StrategyRegistry registry(options);

    EXPECT_EQ(registry.resolve(Method::DETERMINISTIC).as<DeterministicStrategy>().options().token_bytes, 4u);
    EXPECT_EQ(registry.resolve(Method::SHUFFLE).as<ShuffleStrategy>().options().mode, ShuffleMode::ROTATE);
    EXPECT_EQ(registry.resolve(Method::BITWISE).as<BitwiseStrategy>().options().primary_key, "p3");
    EXPECT_THROW(registry.resolve(Method::BITWISE).as<ShuffleStrategy>(), std::bad_variant_access);
}

TEST(RegistryTest, InvalidStrategyOptionsFailConstruction) {
    StrategyOptions options;
    options.deterministic.token_bytes = 0;
    EXPECT_THROW(StrategyRegistry{options}, std::invalid_argument);
}

TEST(StrategyHandleTest, DispatchesToImplementation) {
    const StrategyRegistry registry;
    Dataset input = generate(50);

    const Strategy& bitwise = registry.resolve("bitwise");
    EXPECT_TRUE(bitwise.reversible());
    EXPECT_TRUE(identical(bitwise.anonymize(input), registry.resolve(Method::BITWISE).as<BitwiseStrategy>().anonymize(input)));
    EXPECT_EQ(bitwise.restore(bitwise.anonymize(input)), input);

    const Strategy& deterministic = registry.resolve("deterministic");
    EXPECT_FALSE(deterministic.reversible());
    EXPECT_THROW(deterministic.restore(input), IrreversibleMethodError);

    Strategy copy(ShuffleStrategy{});
    EXPECT_EQ(copy.method(), Method::SHUFFLE);
    EXPECT_TRUE(sameColumnMultiset(input, copy.anonymize(input)));
}
