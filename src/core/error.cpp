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
 * @file error.cpp
 * @brief Rendering and comparison of `TinyIdError` values.
 */

#include "tinyid/core/error.hpp"

namespace tinyid::core {

std::string TinyIdError::to_string() const
{
    switch (kind_) {
    case Kind::INVALID_LENGTH:
        return "Invalid length";
    case Kind::INVALID_CHARACTERS:
        return "Invalid characters";
    case Kind::CONVERSION:
        return "Conversion error: " + message_;
    case Kind::GENERATION_FAILURE:
        return "TinyId generation failed";
    }
    return "Unknown error";
}

bool TinyIdError::operator==(const TinyIdError& other) const
{
    return kind_ == other.kind_ && message_ == other.message_;
}

bool TinyIdError::operator!=(const TinyIdError& other) const
{
    return !(*this == other);
}

bool TinyIdError::operator<(const TinyIdError& other) const
{
    if (kind_ != other.kind_) {
        return kind_ < other.kind_;
    }
    return message_ < other.message_;
}

const char* kind_name(TinyIdError::Kind kind)
{
    switch (kind) {
    case TinyIdError::Kind::INVALID_LENGTH:
        return "InvalidLength";
    case TinyIdError::Kind::INVALID_CHARACTERS:
        return "InvalidCharacters";
    case TinyIdError::Kind::CONVERSION:
        return "Conversion";
    case TinyIdError::Kind::GENERATION_FAILURE:
        return "GenerationFailure";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const TinyIdError& error)
{
    return os << error.to_string();
}

} // namespace tinyid::core
