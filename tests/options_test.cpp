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
 * @file options_test.cpp
 * @brief Unit tests for command-line configuration.
 */

#include "rut/cli/options.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using rut::cli::Command;
using rut::cli::Options;
using rut::infra::LogLevel;

void test_options_defaults()
{
    Options opts = Options::parse({}, nullptr);

    ASSERT_TRUE(opts.command == Command::HELP);
    ASSERT_FALSE(opts.json);
    ASSERT_FALSE(opts.seed.has_value());
    ASSERT_TRUE(opts.log_level == LogLevel::WARN);
    ASSERT_EQ(opts.min, rut::core::Generator::DEFAULT_MIN);
    ASSERT_EQ(opts.max, rut::core::Generator::DEFAULT_MAX);
}

void test_options_subcommands()
{
    Options validate = Options::parse({"validate", "11.111.111-1"}, nullptr);
    ASSERT_TRUE(validate.command == Command::VALIDATE);
    ASSERT_EQ(validate.argument, std::string("11.111.111-1"));

    Options format = Options::parse({"--json", "format", "11111111-1"}, nullptr);
    ASSERT_TRUE(format.command == Command::FORMAT);
    ASSERT_TRUE(format.json);

    Options generate = Options::parse({"generate", "1000000", "2000000", "--seed", "5"}, nullptr);
    ASSERT_TRUE(generate.command == Command::GENERATE);
    ASSERT_EQ(generate.min, static_cast<std::int64_t>(1000000));
    ASSERT_EQ(generate.max, static_cast<std::int64_t>(2000000));
    ASSERT_TRUE(generate.seed.has_value());
    ASSERT_EQ(*generate.seed, static_cast<std::uint64_t>(5));

    Options request = Options::parse({"request", "{\"action\":\"generate\"}"}, nullptr);
    ASSERT_TRUE(request.command == Command::REQUEST);
}

/**
 * @brief The flag overrides the environment, which overrides the default.
 */
void test_options_log_level_layers()
{
    Options from_env = Options::parse({"validate", "11111111-1"}, "debug");
    ASSERT_TRUE(from_env.log_level == LogLevel::DEBUG);

    Options from_flag =
        Options::parse({"validate", "11111111-1", "--log-level", "error"}, "debug");
    ASSERT_TRUE(from_flag.log_level == LogLevel::ERROR);

    Options empty_env = Options::parse({"validate", "11111111-1"}, "");
    ASSERT_TRUE(empty_env.log_level == LogLevel::WARN);
}

void test_options_help_wins()
{
    Options opts = Options::parse({"validate", "11111111-1", "--help"}, nullptr);
    ASSERT_TRUE(opts.command == Command::HELP);
}

void test_options_usage_errors()
{
    using Args = std::vector<std::string>;

    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"explode"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"validate"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"validate", "a", "b"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"generate", "1"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"generate", "-1", "5"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"generate", "--seed"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"generate", "--verbose"}, nullptr));
    ASSERT_THROWS(std::invalid_argument,
                  Options::parse(Args{"generate", "--log-level", "loud"}, nullptr));
    ASSERT_THROWS(std::invalid_argument, Options::parse(Args{"generate"}, "loud"));
}

void test_options_usage_text()
{
    std::string text = rut::cli::usage("rutcheck");
    ASSERT_TRUE(text.find("Usage: rutcheck") != std::string::npos);
    ASSERT_TRUE(text.find("validate RUT") != std::string::npos);
    ASSERT_TRUE(text.find("RUTCHECK_LOG_LEVEL") != std::string::npos);
}
