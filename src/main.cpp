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
 * @file main.cpp
 * @brief Application Entry Point for the `rutcheck` tool.
 *
 * @details
 * 1. Argument and environment parsing.
 * 2. Logger configuration.
 * 3. Dispatch of exactly one command.
 *
 * Exit status: 0 on success, 1 when the identifier (or request) is rejected,
 * 2 on usage errors or unexpected failures.
 */

#include "rut/cli/options.hpp"
#include "rut/core/checksum.hpp"
#include "rut/core/formatter.hpp"
#include "rut/core/generator.hpp"
#include "rut/core/normalizer.hpp"
#include "rut/infra/logger.hpp"
#include "rut/protocol/handler.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using rut::infra::LogLevel;
using rut::infra::Logger;

namespace {

constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

/// @brief True if a handler response carries `"status":"ok"`.
bool response_ok(const std::string& response)
{
    cJSON* resp = cJSON_Parse(response.c_str());
    if (!resp) {
        return false;
    }
    cJSON* status = cJSON_GetObjectItem(resp, "status");
    const bool ok = status && cJSON_IsString(status) && std::string(status->valuestring) == "ok";
    cJSON_Delete(resp);
    return ok;
}

int print_json(const std::string& response)
{
    std::cout << response << std::endl;
    return response_ok(response) ? EXIT_SUCCESS : EXIT_REJECTED;
}

/// @brief Logs a rejection and returns the matching exit code.
int reject(const std::string& raw, rut::core::ErrorCode code, char expected)
{
    std::string message = "Rejected '" + raw + "': " + rut::core::describe(code);
    if (expected != '\0') {
        message += std::string(" (expected check digit ") + expected + ")";
    }
    Logger::log(LogLevel::ERROR, message);
    return EXIT_REJECTED;
}

int run_validate(const rut::cli::Options& opts)
{
    if (opts.json) {
        return print_json(rut::protocol::Handler::validate(opts.argument));
    }

    rut::core::NormalizeResult normalized = rut::core::Normalizer::normalize(opts.argument);
    if (!normalized.ok()) {
        return reject(opts.argument, normalized.error, '\0');
    }

    rut::core::ValidationResult result = rut::core::Checksum::validate(*normalized.rut);
    if (!result.ok()) {
        return reject(opts.argument, result.error, result.expected_check);
    }

    std::cout << normalized.rut->str() << std::endl;
    return EXIT_SUCCESS;
}

int run_format(const rut::cli::Options& opts)
{
    if (opts.json) {
        return print_json(rut::protocol::Handler::format(opts.argument));
    }

    rut::core::NormalizeResult normalized = rut::core::Normalizer::normalize(opts.argument);
    if (!normalized.ok()) {
        return reject(opts.argument, normalized.error, '\0');
    }

    rut::core::ValidationResult result = rut::core::Checksum::validate(*normalized.rut);
    if (!result.ok()) {
        return reject(opts.argument, result.error, result.expected_check);
    }

    std::cout << rut::core::Formatter::decimal_format(*normalized.rut) << std::endl;
    return EXIT_SUCCESS;
}

int run_generate(const rut::cli::Options& opts, rut::core::Generator& generator)
{
    if (opts.json) {
        return print_json(rut::protocol::Handler::generate(generator, opts.min, opts.max));
    }

    // Bad bounds throw and are reported by main().
    rut::core::NormalizedRut generated = generator.generate(opts.min, opts.max);
    std::cout << generated.str() << std::endl;
    return EXIT_SUCCESS;
}

/// @brief Builds the generator for commands that draw identifiers.
rut::core::Generator make_generator(const rut::cli::Options& opts)
{
    if (opts.seed) {
        Logger::log(LogLevel::INFO, "Config: Generator seed " + std::to_string(*opts.seed));
        return rut::core::Generator(*opts.seed);
    }
    return rut::core::Generator();
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    const std::string binary_name = argc > 0 ? argv[0] : "rutcheck";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    rut::cli::Options opts;
    try {
        opts = rut::cli::Options::parse(args, std::getenv(rut::cli::LOG_LEVEL_ENV));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << rut::cli::usage(binary_name);
        return EXIT_USAGE;
    }

    Logger::set_level(opts.log_level);

    if (opts.command == rut::cli::Command::HELP) {
        std::cout << rut::cli::usage(binary_name);
        return EXIT_SUCCESS;
    }

    try {
        switch (opts.command) {
        case rut::cli::Command::VALIDATE:
            return run_validate(opts);
        case rut::cli::Command::FORMAT:
            return run_format(opts);
        case rut::cli::Command::GENERATE: {
            rut::core::Generator generator = make_generator(opts);
            return run_generate(opts, generator);
        }
        case rut::cli::Command::REQUEST: {
            rut::core::Generator generator = make_generator(opts);
            return print_json(rut::protocol::Handler::process(generator, opts.argument));
        }
        case rut::cli::Command::HELP:
            break;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return EXIT_USAGE;
    }

    return EXIT_SUCCESS;
}
