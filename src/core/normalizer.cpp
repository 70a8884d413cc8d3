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
 * @file normalizer.cpp
 * @brief Implementation of the RUT format rules.
 */

#include "rut/core/normalizer.hpp"
#include "rut/infra/logger.hpp"
#include "rut/infra/string.hpp"

#include <cctype>

namespace rut::core {

namespace {

NormalizeResult reject(ErrorCode code, const std::string& value)
{
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Normalizer: Rejected '" + value + "' (" + describe(code) + ")");
    NormalizeResult result;
    result.error = code;
    return result;
}

} // namespace

std::string Normalizer::strip_separators(const std::string& raw)
{
    return infra::String::remove_all(raw, GROUPING);
}

NormalizeResult Normalizer::normalize(const std::string& raw)
{
    // 1. Work on a private copy without grouping dots.
    std::string value = strip_separators(raw);
    const size_t length = value.size();

    // 2. Length policy.
    if (length < MIN_LENGTH) {
        return reject(ErrorCode::TOO_SHORT, value);
    }
    if (length > MAX_LENGTH) {
        return reject(ErrorCode::TOO_LONG, value);
    }

    // 3. Separator position.
    if (value[length - 2] != SEPARATOR) {
        return reject(ErrorCode::MISSING_SEPARATOR, value);
    }

    // 4. Check character, folded to upper case.
    char& check = value[length - 1];
    if (!std::isdigit(static_cast<unsigned char>(check))) {
        switch (check) {
        case 'k':
            check = 'K';
            break;
        case 'K':
            break;
        default:
            return reject(ErrorCode::INVALID_CHECK_CHAR, value);
        }
    }

    // 5. Body digits.
    if (!infra::String::is_digits(value.substr(0, length - 2))) {
        return reject(ErrorCode::NON_DIGIT_BODY, value);
    }

    NormalizeResult result;
    result.rut = NormalizedRut(std::move(value));
    return result;
}

} // namespace rut::core
