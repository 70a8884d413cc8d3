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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` holding the small text helpers shared by the normalizer,
 * the decimal formatter and the command-line front end.
 */

#pragma once

#include <cstdint>
#include <string>

namespace rut::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if `s` is blank.
     *
     * @code
     * std::string clean = rut::infra::String::trim("  11.111.111-1\n"); // "11.111.111-1"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Returns a copy of `s` with every occurrence of `c` removed.
     */
    static std::string remove_all(const std::string& s, char c);

    /// @brief ASCII lower-casing.
    static std::string to_lower(const std::string& s);

    /// @brief True if `s` is non-empty and made only of ASCII decimal digits.
    static bool is_digits(const std::string& s);

    /**
     * @brief Renders an integer with a separator every three digits from the right.
     *
     * Groups other than the leading one are zero-padded to three digits.
     *
     * @param value The number to render.
     * @param separator The grouping character.
     * @return std::string e.g. `11111111` -> `"11.111.111"`, `1000005` -> `"1.000.005"`.
     */
    static std::string group_thousands(std::uint64_t value, char separator = '.');
};

} // namespace rut::infra
