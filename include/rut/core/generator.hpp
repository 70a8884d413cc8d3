/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file generator.hpp
 * @brief Random source of valid RUT identifiers.
 *
 * @details
 * This file declares the `Generator` class, used to produce test data and
 * sample identifiers. Every identifier it returns passes `Checksum::validate`.
 */

#pragma once

#include "rut/core/normalizer.hpp"

#include <cstdint>
#include <random>

namespace rut::core {

/**
 * @class Generator
 * @brief Owns a random engine and emits valid identifiers from a numeric range.
 *
 * @details
 * The engine is seeded once at construction and advanced on every call; it is
 * never reseeded. An instance is not thread-safe: concurrent callers should
 * each own a `Generator`.
 */
class Generator {
  public:
    /// @brief Lower bound of the default body range.
    static constexpr std::int64_t DEFAULT_MIN = 5000000;

    /// @brief Exclusive upper bound of the default body range.
    static constexpr std::int64_t DEFAULT_MAX = 23000000;

    /// @brief Seeds the engine from `std::random_device`.
    Generator();

    /// @brief Seeds the engine with a fixed value for reproducible sequences.
    explicit Generator(std::uint64_t seed);

    /**
     * @brief Draws a body uniformly from `[min, max)` and completes it.
     *
     * @warning The upper bound is **exclusive**: `max` itself is never produced.
     *
     * @param min Smallest body value that may be drawn.
     * @param max One past the largest body value that may be drawn.
     * @return NormalizedRut A well-formed identifier with the correct check character.
     *
     * @throws std::invalid_argument if `min < 0` or `min >= max`.
     * @throws std::out_of_range if the drawn body is not 7 or 8 digits long.
     *
     * @code
     * rut::core::Generator gen;
     * auto rut = gen.generate(5000000, 23000000); // e.g. "17385920-1"
     * @endcode
     */
    NormalizedRut generate(std::int64_t min = DEFAULT_MIN, std::int64_t max = DEFAULT_MAX);

  private:
    std::mt19937_64 engine_;
};

} // namespace rut::core
