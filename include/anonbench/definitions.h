/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the AnonBench library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the AnonBench library */
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace anonbench {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

#ifdef ANONBENCH_NO_RANGE_CHECKING
    constexpr bool RANGE_CHECKING = false;
#else
    constexpr bool RANGE_CHECKING = true;
#endif

    constexpr size_t MAX_COLUMN_COUNT = 65535 - 1;

    // Generator defaults
    constexpr uint64_t    DEFAULT_SEED            = 0x5EED0F00D5EED000ULL;
    constexpr const char* DEFAULT_PROFILE         = "test_data";

    // Benchmark defaults
    constexpr std::array<int64_t, 6> DEFAULT_SIZES = {100, 1000, 5000, 10000, 50000, 100000};

    // Deterministic method defaults
    constexpr const char* DEFAULT_DETERMINISTIC_KEY = "SecretKey#123";
    constexpr size_t      DEFAULT_TOKEN_BYTES       = 16;   // 32 hex characters
    constexpr size_t      MAX_TOKEN_BYTES           = 32;   // full SHA-256 digest
    constexpr double      DEFAULT_NOISE_AMPLITUDE   = 1.0;

    // Shuffle method defaults
    constexpr uint64_t    DEFAULT_SHUFFLE_SEED      = 0x5AFF1E5EEDULL;
    constexpr uint64_t    DEFAULT_ROTATION_EVEN     = 7;
    constexpr uint64_t    DEFAULT_ROTATION_ODD      = 13;

    // Bitwise method defaults
    constexpr const char* DEFAULT_PRIMARY_KEY       = "SecretKey#123";
    constexpr const char* DEFAULT_SECONDARY_KEY     = "SecretKet@987";
    constexpr size_t      KEY_SEQUENCE_LENGTH       = 2048; // keystream period in bytes

    // Column data type enumeration
    enum class ColumnType : uint16_t {
        BOOL    = 0x0001,
        UINT8   = 0x0002,
        UINT16  = 0x0003,
        UINT32  = 0x0004,
        UINT64  = 0x0005,
        INT8    = 0x0006,
        INT16   = 0x0007,
        INT32   = 0x0008,
        INT64   = 0x0009,
        FLOAT   = 0x000A,
        DOUBLE  = 0x000B,
        STRING  = 0x000C
    };

    using ValueType = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, int8_t, int16_t, int32_t, int64_t, float, double, std::string>;

    template<typename T>
    constexpr bool always_false = false;

    template<typename T>
    constexpr ColumnType toColumnType() {
        if constexpr (std::is_same_v<T, bool>) return ColumnType::BOOL;
        else if constexpr (std::is_same_v<T, int8_t>) return ColumnType::INT8;
        else if constexpr (std::is_same_v<T, int16_t>) return ColumnType::INT16;
        else if constexpr (std::is_same_v<T, int32_t>) return ColumnType::INT32;
        else if constexpr (std::is_same_v<T, int64_t>) return ColumnType::INT64;
        else if constexpr (std::is_same_v<T, uint8_t>) return ColumnType::UINT8;
        else if constexpr (std::is_same_v<T, uint16_t>) return ColumnType::UINT16;
        else if constexpr (std::is_same_v<T, uint32_t>) return ColumnType::UINT32;
        else if constexpr (std::is_same_v<T, uint64_t>) return ColumnType::UINT64;
        else if constexpr (std::is_same_v<T, float>) return ColumnType::FLOAT;
        else if constexpr (std::is_same_v<T, double>) return ColumnType::DOUBLE;
        else if constexpr (std::is_same_v<T, std::string>) return ColumnType::STRING;
        else static_assert(always_false<T>, "Unsupported type");
    }

    inline ColumnType toColumnType(const ValueType& value) {
        return std::visit([](const auto& arg) -> ColumnType {
            using T = std::decay_t<decltype(arg)>;
            return toColumnType<T>();
        }, value);
    }

    inline bool isType(const ValueType& value, ColumnType type) {
        return toColumnType(value) == type;
    }

    inline std::string toString(ColumnType type) {
        switch (type) {
            case ColumnType::BOOL:   return "bool";
            case ColumnType::UINT8:  return "uint8";
            case ColumnType::UINT16: return "uint16";
            case ColumnType::UINT32: return "uint32";
            case ColumnType::UINT64: return "uint64";
            case ColumnType::INT8:   return "int8";
            case ColumnType::INT16:  return "int16";
            case ColumnType::INT32:  return "int32";
            case ColumnType::INT64:  return "int64";
            case ColumnType::FLOAT:  return "float";
            case ColumnType::DOUBLE: return "double";
            case ColumnType::STRING: return "string";
            default:                 return "undefined";
        }
    }

    /** Parse a type name as produced by toString(ColumnType). Throws std::invalid_argument for unknown names. */
    inline ColumnType columnTypeFromString(std::string_view typeString) {
        if (typeString == "bool")   return ColumnType::BOOL;
        if (typeString == "uint8")  return ColumnType::UINT8;
        if (typeString == "uint16") return ColumnType::UINT16;
        if (typeString == "uint32") return ColumnType::UINT32;
        if (typeString == "uint64") return ColumnType::UINT64;
        if (typeString == "int8")   return ColumnType::INT8;
        if (typeString == "int16")  return ColumnType::INT16;
        if (typeString == "int32")  return ColumnType::INT32;
        if (typeString == "int64")  return ColumnType::INT64;
        if (typeString == "float")  return ColumnType::FLOAT;
        if (typeString == "double") return ColumnType::DOUBLE;
        if (typeString == "string") return ColumnType::STRING;
        throw std::invalid_argument("Unknown column type: " + std::string(typeString));
    }

    /**
     * @brief Get default value for a given column data type
     * @param type The column data type
     * @return Default ValueType for the specified type
     */
    inline ValueType defaultValue(ColumnType type) {
        switch (type) {
            case ColumnType::BOOL:   return bool{false};
            case ColumnType::UINT8:  return uint8_t{0};
            case ColumnType::UINT16: return uint16_t{0};
            case ColumnType::UINT32: return uint32_t{0};
            case ColumnType::UINT64: return uint64_t{0};
            case ColumnType::INT8:   return int8_t{0};
            case ColumnType::INT16:  return int16_t{0};
            case ColumnType::INT32:  return int32_t{0};
            case ColumnType::INT64:  return int64_t{0};
            case ColumnType::FLOAT:  return float{0.0f};
            case ColumnType::DOUBLE: return double{0.0};
            case ColumnType::STRING: return std::string{};
            default: throw std::runtime_error("Unknown column type");
        }
    }

} // namespace anonbench
