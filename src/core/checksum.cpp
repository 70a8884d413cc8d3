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
 * @file checksum.cpp
 * @brief Implementation of the modulo-11 check character.
 */

#include "rut/core/checksum.hpp"
#include "rut/infra/logger.hpp"

#include <array>

namespace rut::core {

namespace {

constexpr std::array<int, 6> WEIGHTS = {2, 3, 4, 5, 6, 7};

} // namespace

std::optional<char> Checksum::expected_check(std::string_view body)
{
    int sum = 0;
    size_t cursor = 0;

    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        if (*it < '0' || *it > '9') {
            return std::nullopt;
        }
        // Reduced per digit so arbitrarily long bodies cannot overflow.
        sum = (sum + (*it - '0') * WEIGHTS[cursor]) % 11;
        cursor = (cursor + 1) % WEIGHTS.size();
    }

    const int r = 11 - (sum % 11);
    switch (r) {
    case 11:
        return '0';
    case 10:
        return 'K';
    default:
        return static_cast<char>('0' + r);
    }
}

ValidationResult Checksum::validate(const NormalizedRut& rut)
{
    ValidationResult result;

    const std::string body = rut.body();
    std::optional<char> expected = expected_check(body);
    if (!expected) {
        result.error = ErrorCode::NON_DIGIT_BODY;
        return result;
    }

    result.expected_check = *expected;
    infra::Logger::log(infra::LogLevel::TRACE, "Checksum: " + body + " -> " + *expected);

    if (*expected != rut.check()) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Checksum: Mismatch for " + rut.str() +
                                                       " (expected " + *expected + ")");
        result.error = ErrorCode::CHECK_MISMATCH;
    }
    return result;
}

ValidationResult Checksum::validate(const std::string& raw)
{
    NormalizeResult normalized = Normalizer::normalize(raw);
    if (!normalized.ok()) {
        ValidationResult result;
        result.error = normalized.error;
        return result;
    }
    return validate(*normalized.rut);
}

bool Checksum::is_valid(const std::string& raw)
{
    return validate(raw).ok();
}

} // namespace rut::core
