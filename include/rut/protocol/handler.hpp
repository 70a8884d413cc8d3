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
 * @file handler.hpp
 * @brief JSON command dispatcher over the validation core.
 *
 * @details
 * This header declares the `Handler` class, which lets a caller drive the
 * library with one JSON object instead of C++ calls. The CLI uses it for
 * `--json` output and for the `request` subcommand; embedders can call it
 * directly.
 */

#pragma once

#include "rut/core/generator.hpp"

#include <cstdint>
#include <string>

namespace rut::protocol {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 *
 * @details
 * 1. **Ingest:** Parses the raw JSON request.
 * 2. **Decode:** Extracts the `action` and its arguments.
 * 3. **Dispatch:** Calls the normalizer, checksum, formatter or generator.
 * 4. **Emit:** Serializes the outcome as compact JSON.
 *
 * No method throws; every failure is reported inside the response.
 */
class Handler {
  public:
    /**
     * @brief Processes one raw request.
     *
     * @param generator Random source used by the `generate` action.
     * @param raw_json The request payload.
     * @return std::string A serialized JSON response.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "rut": "...", ...}`
     * - **Error:** `{"status": "error", "message": "...", "code": "..."}`
     *
     * @code
     * // Example Request Payloads:
     * { "action": "validate", "rut": "11.111.111-1" }
     * { "action": "format",   "rut": "11111111-1" }
     * { "action": "generate", "min": 5000000, "max": 23000000 }
     * @endcode
     */
    static std::string process(core::Generator& generator, const std::string& raw_json);

    /// @brief Response for the `validate` action.
    static std::string validate(const std::string& raw);

    /// @brief Response for the `format` action. Rejects identifiers that fail validation.
    static std::string format(const std::string& raw);

    /// @brief Response for the `generate` action.
    static std::string generate(core::Generator& generator, std::int64_t min, std::int64_t max);
};

} // namespace rut::protocol
