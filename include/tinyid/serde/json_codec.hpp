/*
 * TINYID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 The TinyId Authors.
 *
 * This source code is licensed under the TinyId Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file json_codec.hpp
 * @brief cJSON adapter for `TinyId` and `TinyIdError`.
 *
 * @details
 * A thin layer over the checked textual conversions of `TinyId`:
 *
 * - **TinyId**: serialized as its 8-character text (`"abcdefgh"`). The null
 * identifier is serialized as JSON `null`. An identifier holding a NUL byte or
 * a byte above 0x7F is serialized as the array of its 8 byte values
 * (`[97,98,99,0,0,0,0,0]`), since neither survives a C string or a UTF-8
 * document. Deserialization applies the checked constructors to both shapes.
 * - **TinyIdError**: externally tagged. Unit kinds serialize as their kind
 * name (`"InvalidLength"`); the conversion kind carries its message
 * (`{"Conversion": "<message>"}`).
 *
 * @warning Functions returning `cJSON*` transfer ownership to the caller, who
 * must release it with `cJSON_Delete`.
 */

#pragma once

#include "tinyid/core/error.hpp"
#include "tinyid/core/result.hpp"
#include "tinyid/core/tiny_id.hpp"

#include <cJSON.h>
#include <optional>
#include <string>

namespace tinyid::serde {

/**
 * @class JsonCodec
 * @brief A static controller for marshaling identifiers to and from cJSON trees.
 */
class JsonCodec {
  public:
    /// Builds a JSON node for `id`. Caller owns the result.
    static cJSON* to_json(const core::TinyId& id);

    /**
     * @brief Reads an identifier from a JSON node.
     *
     * @return The identifier, or:
     * - `CONVERSION` if `node` is missing, is not a string, byte array or
     * `null`, or is an array that does not hold exactly 8 values in 0-255.
     * - `INVALID_LENGTH` / `INVALID_CHARACTERS` from the checked constructors.
     */
    static core::Result<core::TinyId> from_json(const cJSON* node);

    /// Builds the externally tagged JSON form of `error`. Caller owns the result.
    static cJSON* to_json(const core::TinyIdError& error);

    /**
     * @brief Reads an error from its externally tagged form.
     *
     * @return `std::nullopt` if `node` does not describe a known error kind.
     */
    static std::optional<core::TinyIdError> error_from_json(const cJSON* node);

    /// Serializes `id` to a compact JSON document (e.g., `"abcdefgh"`).
    static std::string dump(const core::TinyId& id);

    static std::string dump(const core::TinyIdError& error);

    /**
     * @brief Parses a JSON document holding a single identifier.
     *
     * @return `CONVERSION` on JSON syntax errors, otherwise as `from_json`.
     */
    static core::Result<core::TinyId> parse(const std::string& document);
};

} // namespace tinyid::serde
