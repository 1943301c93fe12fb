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
 * @file errors.h
 * @brief Exception taxonomy of the AnonBench library.
 *
 * Every error raised by the library derives from anonbench::Error so callers
 * can catch the whole family at once. InvalidSizeError and UnknownMethodError
 * signal a malformed benchmark request and abort a run; they are never retried.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace anonbench {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Requested dataset size is negative.
class InvalidSizeError : public Error {
public:
    explicit InvalidSizeError(int64_t size)
        : Error("Invalid dataset size: " + std::to_string(size) + " (must be >= 0)"), size_(size) {}

    int64_t size() const { return size_; }

private:
    int64_t size_;
};

/// Requested method name is not in the strategy registry.
class UnknownMethodError : public Error {
public:
    explicit UnknownMethodError(const std::string& name)
        : Error("Unknown anonymization method '" + name + "'. Expected: deterministic, shuffle, bitwise."),
          name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class UnknownProfileError : public Error {
public:
    explicit UnknownProfileError(const std::string& name)
        : Error("Unknown dataset profile '" + name + "'"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A row or column does not conform to the dataset layout.
class LayoutError : public Error {
public:
    explicit LayoutError(const std::string& message) : Error("Layout error: " + message) {}
};

/// restore() was requested from a method configured as one-way.
class IrreversibleMethodError : public Error {
public:
    explicit IrreversibleMethodError(const std::string& method)
        : Error("Method '" + method + "' is not reversible in its current configuration") {}
};

/// A strategy output broke the guarantees of its method.
class ContractViolationError : public Error {
public:
    explicit ContractViolationError(const std::string& message) : Error("Contract violation: " + message) {}
};

/// OpenSSL reported a failure.
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message) : Error("Crypto error: " + message) {}
};

} // namespace anonbench
