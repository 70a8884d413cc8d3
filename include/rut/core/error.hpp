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
 * @file error.hpp
 * @brief Outcome codes shared by the normalizer and the checksum validator.
 */

#pragma once

#include <string>

namespace rut::core {

/**
 * @enum ErrorCode
 * @brief Reasons an identifier is rejected.
 *
 * Every code is terminal for the call that produced it. None is retryable.
 */
enum class ErrorCode {
    NONE,               ///< Accepted.
    TOO_SHORT,          ///< Fewer characters than `NNNNNNN-N` after stripping dots.
    TOO_LONG,           ///< More characters than `NNNNNNNN-N` after stripping dots.
    MISSING_SEPARATOR,  ///< No `-` right before the check character.
    INVALID_CHECK_CHAR, ///< Check character is neither a digit nor `K`/`k`.
    NON_DIGIT_BODY,     ///< Body contains something other than decimal digits.
    CHECK_MISMATCH      ///< Well formed, but the check character is wrong.
};

/**
 * @brief Human-readable description of a code.
 */
std::string describe(ErrorCode code);

/**
 * @brief Stable snake_case name of a code, used in JSON responses.
 *
 * @code
 * rut::core::code_name(ErrorCode::TOO_SHORT); // "too_short"
 * @endcode
 */
std::string code_name(ErrorCode code);

} // namespace rut::core
