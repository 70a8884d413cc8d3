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
 * @file formatter.cpp
 * @brief Implementation of the display helpers.
 */

#include "rut/core/formatter.hpp"
#include "rut/infra/string.hpp"

#include <cstdint>
#include <string>

namespace rut::core {

std::string Formatter::decimal_format(const NormalizedRut& rut)
{
    // At most 8 digits by invariant, so stoull cannot overflow.
    const std::uint64_t body = std::stoull(rut.body());
    return infra::String::group_thousands(body, Normalizer::GROUPING) + Normalizer::SEPARATOR +
           rut.check();
}

} // namespace rut::core
