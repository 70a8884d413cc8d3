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
 * @file generator.cpp
 * @brief Implementation of the random identifier source.
 *
 * @details
 * Bodies are drawn with a 64-bit Mersenne Twister seeded from
 * `std::random_device`, then completed by the modulo-11 checksum.
 */

#include "rut/core/generator.hpp"
#include "rut/core/checksum.hpp"
#include "rut/infra/logger.hpp"

#include <stdexcept>
#include <string>

namespace rut::core {

Generator::Generator() : engine_(std::random_device{}()) {}

Generator::Generator(std::uint64_t seed) : engine_(seed) {}

/**
 * @brief Draws and completes one identifier.
 *
 * Implementation Strategy:
 * 1. **Bounds**: Rejects empty or negative ranges before touching the engine.
 * 2. **Draw**: `uniform_int_distribution` over the closed range `[min, max - 1]`.
 * 3. **Policy**: The body must satisfy the normalizer's 7-8 digit rule.
 * 4. **Completion**: Appends `-` and the computed check character.
 */
NormalizedRut Generator::generate(std::int64_t min, std::int64_t max)
{
    if (min < 0 || min >= max) {
        throw std::invalid_argument("Generator: empty or negative range [" +
                                    std::to_string(min) + ", " + std::to_string(max) + ")");
    }

    std::uniform_int_distribution<std::int64_t> dist(min, max - 1);
    std::string body = std::to_string(dist(engine_));

    const size_t length = body.size() + 2;
    if (length < Normalizer::MIN_LENGTH || length > Normalizer::MAX_LENGTH) {
        throw std::out_of_range("Generator: body " + body + " is not 7 or 8 digits long");
    }

    // A body rendered by std::to_string is always digits.
    const char check = *Checksum::expected_check(body);

    infra::Logger::log(infra::LogLevel::TRACE, "Generator: Drew " + body + "-" + check);
    return NormalizedRut(body + Normalizer::SEPARATOR + check);
}

} // namespace rut::core
