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
 * @file checksum.hpp
 * @brief Modulo-11 check character computation and verification.
 *
 * @details
 * The RUT check character is derived from the body with a weighted digit sum:
 * digits are read from right to left and multiplied by the repeating weights
 * `2, 3, 4, 5, 6, 7`. With `r = 11 - (sum % 11)` the check character is `'0'`
 * for `r == 11`, `'K'` for `r == 10` and the digit `r` otherwise.
 *
 * Worked example for `11111111`:
 * `1*2 + 1*3 + 1*4 + 1*5 + 1*6 + 1*7 + 1*2 + 1*3 = 32`, `32 % 11 = 10`,
 * `r = 1`, so the complete identifier is `11111111-1`.
 */

#pragma once

#include "rut/core/error.hpp"
#include "rut/core/normalizer.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rut::core {

/**
 * @struct ValidationResult
 * @brief Outcome of a checksum verification.
 *
 * `expected_check` holds the computed check character whenever the body could
 * be evaluated (on success and on `CHECK_MISMATCH`), and `'\0'` otherwise.
 */
struct ValidationResult {
    ErrorCode error = ErrorCode::NONE;
    char expected_check = '\0';

    bool ok() const { return error == ErrorCode::NONE; }
};

/**
 * @class Checksum
 * @brief Static modulo-11 operations.
 */
class Checksum {
  public:
    /**
     * @brief Computes the check character for a body.
     *
     * A `0` digit contributes nothing to the sum but still consumes a weight.
     *
     * @param body Decimal digits, most significant first.
     * @return The check character (`'0'`-`'9'` or `'K'`), or `std::nullopt`
     * if `body` contains a non-digit character.
     */
    static std::optional<char> expected_check(std::string_view body);

    /**
     * @brief Verifies the check character of a normalized identifier.
     *
     * @return `NONE` with the expected character on success, `CHECK_MISMATCH`
     * with the expected character on failure.
     */
    static ValidationResult validate(const NormalizedRut& rut);

    /**
     * @brief Normalizes then verifies a raw identifier.
     *
     * Normalizer failures are returned unchanged with no expected character.
     *
     * @code
     * auto res = rut::core::Checksum::validate("11.111.111-1");
     * // res.ok() == true, res.expected_check == '1'
     * @endcode
     */
    static ValidationResult validate(const std::string& raw);

    /// @brief `validate(raw).ok()`.
    static bool is_valid(const std::string& raw);
};

} // namespace rut::core
