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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "rut/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace rut::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::remove_all(const std::string& s, char c)
{
    std::string out;
    out.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(out), [c](char ch) { return ch != c; });
    return out;
}

std::string String::to_lower(const std::string& s)
{
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

bool String::is_digits(const std::string& s)
{
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

/**
 * @brief Groups an integer into blocks of three digits.
 *
 * The decimal rendering is split so that the leading block holds the
 * remaining one to three digits and every following block holds exactly
 * three, e.g. `1000005` renders as `1.000.005`.
 */
std::string String::group_thousands(std::uint64_t value, char separator)
{
    std::string digits = std::to_string(value);

    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    size_t lead = digits.size() % 3;
    if (lead == 0) {
        lead = 3;
    }

    out.append(digits, 0, lead);
    for (size_t i = lead; i < digits.size(); i += 3) {
        out.push_back(separator);
        out.append(digits, i, 3);
    }

    return out;
}

} // namespace rut::infra
