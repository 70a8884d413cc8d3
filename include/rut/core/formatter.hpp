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
 * @file formatter.hpp
 * @brief Display rendering of identifiers.
 */

#pragma once

#include "rut/core/normalizer.hpp"

#include <string>

namespace rut::core {

/**
 * @class Formatter
 * @brief Cosmetic output helpers. Never used for validation.
 */
class Formatter {
  public:
    /**
     * @brief Renders the body with `.` thousands separators.
     *
     * The body is read as a number, so leading zeros are dropped
     * (`01111111-4` renders as `1.111.111-4`).
     *
     * @param rut A normalized identifier. Callers should validate it first;
     * the check character is copied through as-is.
     * @return std::string e.g. `"11.111.111-1"`.
     */
    static std::string decimal_format(const NormalizedRut& rut);
};

} // namespace rut::core
