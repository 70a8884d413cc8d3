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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for rutcheck.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used
 * by the validation core and the command-line front end. Output is serialized
 * across threads and filtered by a process-wide severity threshold.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace rut::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-digit checksum details.
    DEBUG, ///< Rejection reasons inside the core.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Anomalies that do not stop the current command.
    ERROR, ///< A command failed.
    FATAL  ///< Unrecoverable failure, the process exits.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are dropped before the lock is
 * taken. The default threshold is `WARN` so that a command's regular output
 * on stdout is not interleaved with diagnostics.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * rut::infra::Logger::log(LogLevel::DEBUG, "Normalizer: missing separator");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief Returns the current threshold.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive.
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;
};

} // namespace rut::infra
