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
 * @file deterministic.h
 * @brief Consistent-mapping anonymization via keyed one-way hashing.
 *
 * Every value v in column c is replaced by a function of
 * HMAC-SHA256(key, c || 0x00 || type tag || canonical bytes of v):
 *
 * | Type          | Output                                                  |
 * |---------------|---------------------------------------------------------|
 * | STRING        | lowercase hex of the first token_bytes digest bytes     |
 * | integer types | first sizeof(T) digest bytes, little-endian             |
 * | BOOL          | lowest bit of the first digest byte                     |
 * | FLOAT, DOUBLE | v + amplitude * sin(2*pi*u), u in [0,1) from the digest |
 *
 * The floating-point noise is additive and absolute: once amplitude falls below
 * half an ulp of v the result rounds back to v. At amplitude 1 that happens from
 * about 1.7e7 for FLOAT and 9e15 for DOUBLE; raise the column's amplitude for
 * larger magnitudes.
 *
 * Equal inputs in one column map to equal outputs, within a call and across
 * calls with the same key. The mapping is one-way: restore() throws.
 */

#include <string>
#include <vector>

#include "dataset.h"
#include "keyed_hash.h"
#include "strategy.h"

namespace anonbench {

    class DeterministicStrategy {
        DeterministicOptions    options_;

    public:
        static constexpr Method METHOD = Method::DETERMINISTIC;

        /** @throws std::invalid_argument if token_bytes is outside [1, MAX_TOKEN_BYTES] or an amplitude is negative */
        explicit DeterministicStrategy(DeterministicOptions options = {});

        const DeterministicOptions& options() const                         { return options_; }
        bool                        reversible() const                      { return false; }

        Dataset                     anonymize(const Dataset& data) const;
        Dataset                     restore(const Dataset& data) const;

        /// Anonymize a single value as if it appeared in the named column
        ValueType                   anonymizeValue(const std::string& column, const ValueType& value) const;

        /// Noise amplitude applied to a floating-point column
        double                      amplitudeFor(const std::string& column) const;

    private:
        ValueType                   transform(KeyedHash& mac, const std::string& prefix, const ValueType& value, double amplitude) const;
    };

} // namespace anonbench
