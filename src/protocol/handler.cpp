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
 * @file handler.cpp
 * @brief Implementation of the JSON command pipeline.
 *
 * @details
 * 1. **Ingest**: Parsing the raw JSON request.
 * 2. **Execute**: Routing the action to the validation core.
 * 3. **Respond**: Formatting the outcome into a standardized JSON response.
 */

#include "rut/protocol/handler.hpp"
#include "rut/core/checksum.hpp"
#include "rut/core/formatter.hpp"
#include "rut/core/normalizer.hpp"
#include "rut/infra/logger.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace rut::protocol {

namespace {

/// @brief Serializes to compact JSON and releases the tree.
std::string emit(cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string response = raw_output ? std::string(raw_output) : std::string();

    free(raw_output);
    cJSON_Delete(root);
    return response;
}

std::string error_response(const std::string& message)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "error");
    cJSON_AddStringToObject(root, "message", message.c_str());
    return emit(root);
}

/// @brief Error response for a rejected identifier. `expected` is omitted when `'\0'`.
std::string rejection_response(core::ErrorCode code, char expected)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "error");
    cJSON_AddStringToObject(root, "code", core::code_name(code).c_str());
    cJSON_AddStringToObject(root, "message", core::describe(code).c_str());
    if (expected != '\0') {
        const char buf[2] = {expected, '\0'};
        cJSON_AddStringToObject(root, "expected", buf);
    }
    return emit(root);
}

/// @brief Reads an optional integral field, falling back to `fallback` when absent.
/// Fractional values are rejected rather than truncated.
bool read_bound(cJSON* req, const char* key, std::int64_t fallback, std::int64_t* out)
{
    cJSON* item = cJSON_GetObjectItem(req, key);
    if (!item) {
        *out = fallback;
        return true;
    }
    // Keep the double -> int64 conversion well defined.
    if (!cJSON_IsNumber(item) || item->valuedouble < -9.0e18 || item->valuedouble > 9.0e18) {
        return false;
    }
    if (item->valuedouble != std::floor(item->valuedouble)) {
        return false;
    }
    *out = static_cast<std::int64_t>(item->valuedouble);
    return true;
}

} // namespace

std::string Handler::validate(const std::string& raw)
{
    core::NormalizeResult normalized = core::Normalizer::normalize(raw);
    if (!normalized.ok()) {
        return rejection_response(normalized.error, '\0');
    }

    core::ValidationResult result = core::Checksum::validate(*normalized.rut);
    if (!result.ok()) {
        return rejection_response(result.error, result.expected_check);
    }

    const char expected[2] = {result.expected_check, '\0'};

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "ok");
    cJSON_AddStringToObject(root, "rut", normalized.rut->str().c_str());
    cJSON_AddStringToObject(root, "expected", expected);
    cJSON_AddBoolToObject(root, "valid", 1);
    return emit(root);
}

std::string Handler::format(const std::string& raw)
{
    core::NormalizeResult normalized = core::Normalizer::normalize(raw);
    if (!normalized.ok()) {
        return rejection_response(normalized.error, '\0');
    }

    // Formatting is only offered for identifiers that pass the checksum.
    core::ValidationResult result = core::Checksum::validate(*normalized.rut);
    if (!result.ok()) {
        return rejection_response(result.error, result.expected_check);
    }

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "ok");
    cJSON_AddStringToObject(root, "rut", normalized.rut->str().c_str());
    cJSON_AddStringToObject(root, "formatted",
                            core::Formatter::decimal_format(*normalized.rut).c_str());
    return emit(root);
}

std::string Handler::generate(core::Generator& generator, std::int64_t min, std::int64_t max)
{
    try {
        core::NormalizedRut rut = generator.generate(min, max);

        cJSON* root = cJSON_CreateObject();
        cJSON_AddStringToObject(root, "status", "ok");
        cJSON_AddStringToObject(root, "rut", rut.str().c_str());
        cJSON_AddStringToObject(root, "formatted", core::Formatter::decimal_format(rut).c_str());
        return emit(root);
    } catch (const std::logic_error& e) {
        // invalid_argument and out_of_range: bad bounds supplied by the client.
        infra::Logger::log(infra::LogLevel::WARN, std::string("Handler: ") + e.what());
        return error_response(e.what());
    }
}

/**
 * @brief Processes a raw client request and generates a JSON response.
 */
std::string Handler::process(core::Generator& generator, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response("Empty request payload");
    }

    // 1. INGEST PHASE
    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!req) {
        return error_response("Invalid JSON syntax");
    }
    if (!cJSON_IsObject(req)) {
        cJSON_Delete(req);
        return error_response("Request must be a JSON object");
    }

    cJSON* act = cJSON_GetObjectItem(req, "action");
    std::string action = (act && cJSON_IsString(act)) ? act->valuestring : "";

    cJSON* id = cJSON_GetObjectItem(req, "rut");
    const bool has_rut = id && cJSON_IsString(id);
    std::string rut = has_rut ? id->valuestring : "";

    infra::Logger::log(infra::LogLevel::DEBUG, "Handler: Dispatching '" + action + "'");

    // 2. COMMAND DISPATCH PHASE
    std::string response;
    if (action.empty()) {
        response = error_response("Missing required argument: 'action'");
    } else if (action == "validate" || action == "format") {
        if (!has_rut) {
            response = error_response("Missing required argument: 'rut'");
        } else if (action == "validate") {
            response = validate(rut);
        } else {
            response = format(rut);
        }
    } else if (action == "generate") {
        std::int64_t min = 0;
        std::int64_t max = 0;
        if (!read_bound(req, "min", core::Generator::DEFAULT_MIN, &min) ||
            !read_bound(req, "max", core::Generator::DEFAULT_MAX, &max)) {
            response = error_response("Arguments 'min' and 'max' must be numbers");
        } else {
            response = generate(generator, min, max);
        }
    } else {
        response = error_response("Unknown action opcode: " + action);
    }

    cJSON_Delete(req);
    return response;
}

} // namespace rut::protocol
