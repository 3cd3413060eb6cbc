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
 * @file error.hpp
 * @brief Error taxonomy for fallible `TinyId` operations.
 *
 * @details
 * Every validating constructor of `TinyId` reports failure through a `TinyIdError`
 * value rather than throwing. The exception type `TinyIdException` exists only for
 * callers that unwrap a failed `Result` without checking it first.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tinyid::core {

/**
 * @class TinyIdError
 * @brief A value describing why a `TinyId` could not be produced.
 */
class TinyIdError {
  public:
    /**
     * @enum Kind
     * @brief Classification of the failure.
     */
    enum class Kind {
        INVALID_LENGTH,     ///< Text input did not contain exactly 8 units.
        INVALID_CHARACTERS, ///< One or more bytes fall outside the alphabet.
        CONVERSION,         ///< A low-level conversion failed. Carries a message.
        GENERATION_FAILURE  ///< Reserved. The current generator cannot fail.
    };

    /// Builds an error of the given kind with an optional detail message.
    explicit TinyIdError(Kind kind, std::string message = "")
        : kind_(kind), message_(std::move(message))
    {
    }

    static TinyIdError invalid_length()
    {
        return TinyIdError(Kind::INVALID_LENGTH);
    }

    static TinyIdError invalid_characters()
    {
        return TinyIdError(Kind::INVALID_CHARACTERS);
    }

    static TinyIdError conversion(std::string message)
    {
        return TinyIdError(Kind::CONVERSION, std::move(message));
    }

    static TinyIdError generation_failure()
    {
        return TinyIdError(Kind::GENERATION_FAILURE);
    }

    Kind kind() const
    {
        return kind_;
    }

    /// Detail message. Only populated for `Kind::CONVERSION`.
    const std::string& message() const
    {
        return message_;
    }

    /**
     * @brief Renders a human-readable description.
     *
     * - `INVALID_LENGTH`: "Invalid length"
     * - `INVALID_CHARACTERS`: "Invalid characters"
     * - `CONVERSION`: "Conversion error: <message>"
     * - `GENERATION_FAILURE`: "TinyId generation failed"
     */
    std::string to_string() const;

    bool operator==(const TinyIdError& other) const;
    bool operator!=(const TinyIdError& other) const;
    bool operator<(const TinyIdError& other) const;

  private:
    Kind kind_;
    std::string message_;
};

/// Stable identifier of an error kind ("InvalidLength", "Conversion", ...).
const char* kind_name(TinyIdError::Kind kind);

std::ostream& operator<<(std::ostream& os, const TinyIdError& error);

/**
 * @class TinyIdException
 * @brief Raised when a failed `Result` is unwrapped.
 */
class TinyIdException : public std::runtime_error {
  public:
    explicit TinyIdException(TinyIdError error)
        : std::runtime_error(error.to_string()), error_(std::move(error))
    {
    }

    const TinyIdError& error() const
    {
        return error_;
    }

  private:
    TinyIdError error_;
};

} // namespace tinyid::core
