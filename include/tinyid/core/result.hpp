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
 * @file result.hpp
 * @brief Success-or-failure return type for validating constructors.
 *
 * @details
 * `Result<T>` holds either a `T` or a `TinyIdError`. It is returned by every
 * checked conversion so that ordinary invalid input never surfaces as an
 * exception. Unwrapping a failed result with `value()` throws `TinyIdException`.
 *
 * @code
 * // Example Usage:
 * auto parsed = tinyid::core::TinyId::from_string("AAAABBBB");
 * if (parsed.ok()) {
 *     use(parsed.value());
 * } else {
 *     std::cerr << parsed.error() << std::endl;
 * }
 * @endcode
 */

#pragma once

#include "tinyid/core/error.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace tinyid::core {

template <typename T> class Result {
  public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(TinyIdError error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return ok();
    }

    /**
     * @brief Returns the contained value.
     * @throws TinyIdException if the result holds an error.
     */
    const T& value() const
    {
        if (!ok()) {
            throw TinyIdException(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    /// Returns the contained value, or `fallback` if the result holds an error.
    T value_or(T fallback) const
    {
        return ok() ? std::get<0>(state_) : std::move(fallback);
    }

    /**
     * @brief Returns the contained error.
     * @throws std::logic_error if the result holds a value.
     */
    const TinyIdError& error() const
    {
        if (ok()) {
            throw std::logic_error("Result: error() called on a successful result");
        }
        return std::get<1>(state_);
    }

  private:
    std::variant<T, TinyIdError> state_;
};

} // namespace tinyid::core
