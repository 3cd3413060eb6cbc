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
 * @file json_codec.cpp
 * @brief Implementation of the cJSON adapter.
 */

#include "tinyid/serde/json_codec.hpp"

#include "tinyid/infra/logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

namespace tinyid::serde {

namespace {

using core::TinyId;
using core::TinyIdError;

/**
 * @brief Serializes a tree and releases it.
 *
 * Takes ownership of `node`; the printed buffer is freed before returning.
 */
std::string print_and_delete(cJSON* node)
{
    char* raw_output = cJSON_PrintUnformatted(node);
    std::string result = raw_output ? std::string(raw_output) : std::string();

    free(raw_output);
    cJSON_Delete(node);
    return result;
}

/// True if every byte survives a C string and a UTF-8 document unchanged.
bool is_plain_ascii(const TinyId::Bytes& bytes)
{
    for (uint8_t b : bytes) {
        if (b == 0 || b >= 0x80) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Reads the `[b0, ..., b7]` form of an identifier.
 *
 * Bytes are validated with the checked constructor, so an array only ever
 * yields a well-formed identifier.
 */
core::Result<TinyId> from_byte_array(const cJSON* node)
{
    if (cJSON_GetArraySize(node) != static_cast<int>(TinyId::SIZE)) {
        return TinyIdError::conversion("expected an array of " + std::to_string(TinyId::SIZE) +
                                       " bytes");
    }

    TinyId::Bytes bytes{};
    std::size_t i = 0;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, node)
    {
        if (!cJSON_IsNumber(item) || item->valuedouble < 0 || item->valuedouble > 255 ||
            item->valuedouble != static_cast<double>(item->valueint)) {
            return TinyIdError::conversion("array element " + std::to_string(i) +
                                           " is not a byte");
        }
        bytes[i++] = static_cast<uint8_t>(item->valueint);
    }
    return TinyId::from_bytes(bytes);
}

} // namespace

cJSON* JsonCodec::to_json(const TinyId& id)
{
    if (id.is_null()) {
        return cJSON_CreateNull();
    }

    const TinyId::Bytes bytes = id.to_bytes();
    if (is_plain_ascii(bytes)) {
        std::string text = id.to_string();
        return cJSON_CreateString(text.c_str());
    }

    // NUL would cut the C string short and bytes >= 0x80 are not UTF-8.
    int values[TinyId::SIZE];
    for (std::size_t i = 0; i < TinyId::SIZE; ++i) {
        values[i] = bytes[i];
    }
    return cJSON_CreateIntArray(values, static_cast<int>(TinyId::SIZE));
}

core::Result<TinyId> JsonCodec::from_json(const cJSON* node)
{
    if (node == nullptr) {
        return TinyIdError::conversion("missing JSON value");
    }
    if (cJSON_IsNull(node)) {
        return TinyId::null();
    }
    if (cJSON_IsArray(node)) {
        auto parsed = from_byte_array(node);
        if (!parsed.ok()) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Serde: rejected byte array id: " + parsed.error().to_string());
        }
        return parsed;
    }
    if (!cJSON_IsString(node) || node->valuestring == nullptr) {
        return TinyIdError::conversion("expected a JSON string or byte array");
    }

    auto parsed = TinyId::from_string(node->valuestring);
    if (!parsed.ok()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Serde: rejected id '" + std::string(node->valuestring) +
                               "': " + parsed.error().to_string());
    }
    return parsed;
}

cJSON* JsonCodec::to_json(const TinyIdError& error)
{
    const char* name = core::kind_name(error.kind());
    if (error.kind() != TinyIdError::Kind::CONVERSION) {
        return cJSON_CreateString(name);
    }

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, name, error.message().c_str());
    return root;
}

std::optional<TinyIdError> JsonCodec::error_from_json(const cJSON* node)
{
    if (node == nullptr) {
        return std::nullopt;
    }

    // Unit variants: "InvalidLength", "InvalidCharacters", "GenerationFailure"
    if (cJSON_IsString(node) && node->valuestring) {
        const std::string name = node->valuestring;
        for (auto kind : {TinyIdError::Kind::INVALID_LENGTH, TinyIdError::Kind::INVALID_CHARACTERS,
                          TinyIdError::Kind::GENERATION_FAILURE}) {
            if (name == core::kind_name(kind)) {
                return TinyIdError(kind);
            }
        }
        return std::nullopt;
    }

    // Tagged variant: {"Conversion": "<message>"}
    if (cJSON_IsObject(node)) {
        const cJSON* msg = cJSON_GetObjectItemCaseSensitive(
            node, core::kind_name(TinyIdError::Kind::CONVERSION));
        if (msg && cJSON_IsString(msg) && msg->valuestring &&
            cJSON_GetArraySize(node) == 1) {
            return TinyIdError::conversion(msg->valuestring);
        }
    }
    return std::nullopt;
}

std::string JsonCodec::dump(const TinyId& id)
{
    return print_and_delete(to_json(id));
}

std::string JsonCodec::dump(const TinyIdError& error)
{
    return print_and_delete(to_json(error));
}

core::Result<TinyId> JsonCodec::parse(const std::string& document)
{
    cJSON* root = cJSON_Parse(document.c_str());
    if (!root) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Serde: invalid JSON syntax in id document");
        return TinyIdError::conversion("invalid JSON syntax");
    }

    auto result = from_json(root);
    cJSON_Delete(root);
    return result;
}

} // namespace tinyid::serde
