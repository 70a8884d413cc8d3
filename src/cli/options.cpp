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
 * @file options.cpp
 * @brief Implementation of the command-line parser.
 */

#include "rut/cli/options.hpp"
#include "rut/infra/string.hpp"

#include <sstream>
#include <stdexcept>

namespace rut::cli {

namespace {

infra::LogLevel level_or_throw(const std::string& name)
{
    std::optional<infra::LogLevel> level = infra::Logger::parse_level(name);
    if (!level) {
        throw std::invalid_argument("Unknown log level: '" + name + "'");
    }
    return *level;
}

std::int64_t integer_or_throw(const std::string& text, const char* what)
{
    std::string digits = infra::String::trim(text);
    if (!infra::String::is_digits(digits)) {
        throw std::invalid_argument(std::string(what) + " must be a non-negative integer: '" +
                                    text + "'");
    }
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " is out of range: '" + text + "'");
    }
}

} // namespace

Options Options::parse(const std::vector<std::string>& args, const char* env_log_level)
{
    Options opts;

    // 1. Environment layer.
    if (env_log_level && *env_log_level) {
        opts.log_level = level_or_throw(env_log_level);
    }

    // 2. Flags and positionals.
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            opts.command = Command::HELP;
            return opts;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--log-level" || arg == "--seed") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            const std::string& value = args[++i];
            if (arg == "--log-level") {
                opts.log_level = level_or_throw(value);
            } else {
                opts.seed = static_cast<std::uint64_t>(integer_or_throw(value, "--seed"));
            }
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        opts.command = Command::HELP;
        return opts;
    }

    // 3. Subcommand.
    const std::string& name = positional[0];
    const size_t extra = positional.size() - 1;

    if (name == "validate" || name == "format" || name == "request") {
        if (extra != 1) {
            throw std::invalid_argument("'" + name + "' expects exactly one argument");
        }
        opts.command = name == "validate" ? Command::VALIDATE
                       : name == "format" ? Command::FORMAT
                                          : Command::REQUEST;
        opts.argument = positional[1];
    } else if (name == "generate") {
        if (extra != 0 && extra != 2) {
            throw std::invalid_argument("'generate' expects either no arguments or MIN MAX");
        }
        opts.command = Command::GENERATE;
        if (extra == 2) {
            opts.min = integer_or_throw(positional[1], "MIN");
            opts.max = integer_or_throw(positional[2], "MAX");
        }
    } else {
        throw std::invalid_argument("Unknown command: " + name);
    }

    return opts;
}

std::string usage(const std::string& binary_name)
{
    std::ostringstream out;
    out << "Usage: " << binary_name << " <command> [options]\n"
        << "Commands:\n"
        << "  validate RUT        Check the format and check digit of RUT\n"
        << "  format RUT          Validate RUT and print it as NN.NNN.NNN-C\n"
        << "  generate [MIN MAX]  Print a random valid RUT with body in [MIN, MAX)\n"
        << "                      (Default: [" << core::Generator::DEFAULT_MIN << ", "
        << core::Generator::DEFAULT_MAX << "), MAX is never produced)\n"
        << "  request JSON        Run a raw JSON request and print the JSON response\n"
        << "Options:\n"
        << "  --json              Print the JSON response instead of plain text\n"
        << "  --seed N            Seed the generator for a reproducible result\n"
        << "  --log-level LEVEL   trace|debug|info|warn|error|fatal (Default: warn,\n"
        << "                      or $" << LOG_LEVEL_ENV << ")\n"
        << "  --help              Show this help message\n";
    return out.str();
}

} // namespace rut::cli
