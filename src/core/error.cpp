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
 * @file error.cpp
 * @brief Message tables for `ErrorCode`.
 */

#include "rut/core/error.hpp"

namespace rut::core {

std::string describe(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NONE:
        return "ok";
    case ErrorCode::TOO_SHORT:
        return "length less than expected";
    case ErrorCode::TOO_LONG:
        return "exceeded max length";
    case ErrorCode::MISSING_SEPARATOR:
        return "no valid check digit separator: '-'";
    case ErrorCode::INVALID_CHECK_CHAR:
        return "expected digit or 'K' as check digit, instead found invalid character";
    case ErrorCode::NON_DIGIT_BODY:
        return "expected digit in body, instead found invalid character";
    case ErrorCode::CHECK_MISMATCH:
        return "invalid check digit";
    }
    return "unknown error";
}

std::string code_name(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NONE:
        return "none";
    case ErrorCode::TOO_SHORT:
        return "too_short";
    case ErrorCode::TOO_LONG:
        return "too_long";
    case ErrorCode::MISSING_SEPARATOR:
        return "missing_separator";
    case ErrorCode::INVALID_CHECK_CHAR:
        return "invalid_check_char";
    case ErrorCode::NON_DIGIT_BODY:
        return "non_digit_body";
    case ErrorCode::CHECK_MISMATCH:
        return "check_mismatch";
    }
    return "unknown";
}

} // namespace rut::core
