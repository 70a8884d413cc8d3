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
 * @file options.hpp
 * @brief Command-line configuration for the `rutcheck` tool.
 *
 * @details
 * Settings resolve in three layers: compiled defaults, then the
 * `RUTCHECK_LOG_LEVEL` environment variable, then command-line flags.
 */

#pragma once

#include "rut/core/generator.hpp"
#include "rut/infra/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rut::cli {

/// @brief Environment variable consulted for the default log threshold.
inline constexpr const char* LOG_LEVEL_ENV = "RUTCHECK_LOG_LEVEL";

/**
 * @enum Command
 * @brief Subcommand selected on the command line.
 */
enum class Command {
    HELP,     ///< Print usage.
    VALIDATE, ///< Check one identifier.
    FORMAT,   ///< Validate then print with thousands separators.
    GENERATE, ///< Emit one random valid identifier.
    REQUEST   ///< Pass a raw JSON request to the protocol handler.
};

/**
 * @struct Options
 * @brief Fully resolved configuration for one invocation.
 */
struct Options {
    Command command = Command::HELP;

    /// @brief The identifier (`validate`, `format`) or the JSON payload (`request`).
    std::string argument;

    std::int64_t min = core::Generator::DEFAULT_MIN;
    std::int64_t max = core::Generator::DEFAULT_MAX;

    /// @brief Fixed generator seed; `std::random_device` when empty.
    std::optional<std::uint64_t> seed;

    /// @brief Emit handler JSON instead of plain text.
    bool json = false;

    infra::LogLevel log_level = infra::LogLevel::WARN;

    /**
     * @brief Resolves options from arguments (without the program name).
     *
     * @param args Tokens after `argv[0]`.
     * @param env_log_level Value of `RUTCHECK_LOG_LEVEL`, or `nullptr` if unset.
     * @return Options The resolved configuration.
     *
     * @throws std::invalid_argument on an unknown subcommand or flag, a missing
     * or extra positional argument, or a malformed number or level name.
     */
    static Options parse(const std::vector<std::string>& args, const char* env_log_level);
};

/// @brief Usage text printed by `--help` and on usage errors.
std::string usage(const std::string& binary_name);

} // namespace rut::cli
