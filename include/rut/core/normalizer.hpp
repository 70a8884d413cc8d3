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
 * @file normalizer.hpp
 * @brief Format gate for raw RUT strings.
 *
 * @details
 * This header declares the `Normalizer`, which turns user input such as
 * `"11.111.111-k"` into the canonical `NormalizedRut` `"11111111-K"`, and
 * the `NormalizedRut` value type itself. A `NormalizedRut` can only be
 * obtained through the normalizer (or the generator), so holding one is
 * proof that the format rules have been applied.
 */

#pragma once

#include "rut/core/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace rut::core {

class Normalizer;
class Generator;

/**
 * @class NormalizedRut
 * @brief Canonical `BODY-C` identifier.
 *
 * **Invariants:**
 * - Body is 7 or 8 ASCII decimal digits (leading zeros allowed).
 * - The separator `-` sits at `size() - 2`.
 * - The check character is `0`-`9` or upper-case `K`.
 *
 * The check character is not verified against the body here; that is the
 * job of `Checksum::validate`.
 */
class NormalizedRut {
  public:
    /// @brief Full canonical text, e.g. `"11111111-1"`.
    const std::string& str() const { return value_; }

    /// @brief Digits before the separator.
    std::string body() const { return value_.substr(0, value_.size() - 2); }

    /// @brief Trailing check character.
    char check() const { return value_.back(); }

    bool operator==(const NormalizedRut& other) const { return value_ == other.value_; }
    bool operator!=(const NormalizedRut& other) const { return value_ != other.value_; }

  private:
    friend class Normalizer;
    friend class Generator;

    explicit NormalizedRut(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/**
 * @struct NormalizeResult
 * @brief Outcome of `Normalizer::normalize`.
 *
 * `rut` is engaged if and only if `error == ErrorCode::NONE`.
 */
struct NormalizeResult {
    ErrorCode error = ErrorCode::NONE;
    std::optional<NormalizedRut> rut;

    bool ok() const { return error == ErrorCode::NONE; }
};

/**
 * @class Normalizer
 * @brief Static format rules for raw identifiers.
 */
class Normalizer {
  public:
    /// @brief Body/check delimiter.
    static constexpr char SEPARATOR = '-';

    /// @brief Grouping character accepted (and discarded) in raw input.
    static constexpr char GROUPING = '.';

    /// @brief `NNNNNNN-N`. Shorter bodies are rejected as policy.
    static constexpr std::size_t MIN_LENGTH = 9;

    /// @brief `NNNNNNNN-N`. Longer bodies are rejected as policy.
    static constexpr std::size_t MAX_LENGTH = 10;

    /**
     * @brief Applies the format rules to a raw identifier.
     *
     * Rules, evaluated in order (first failure wins):
     * 1. Every `.` is removed.
     * 2. Length must lie in `[MIN_LENGTH, MAX_LENGTH]` (`TOO_SHORT` / `TOO_LONG`).
     * 3. The character before the last must be `-` (`MISSING_SEPARATOR`).
     * 4. The last character must be a digit, `K` or `k` (`INVALID_CHECK_CHAR`);
     *    `k` is rewritten to `K`.
     * 5. The body must be all digits (`NON_DIGIT_BODY`).
     *
     * The caller's string is never modified.
     *
     * @param raw The identifier as typed by the user.
     * @return NormalizeResult The canonical identifier or the first rule violated.
     */
    static NormalizeResult normalize(const std::string& raw);

    /// @brief Step 1 of `normalize` on its own.
    static std::string strip_separators(const std::string& raw);
};

} // namespace rut::core
