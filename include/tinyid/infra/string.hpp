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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used for sanitizing configuration values and rendering
 * run statistics.
 */

#pragma once

#include <cstdint>
#include <string>

namespace tinyid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content. Empty if `s` is empty or
     * consists solely of whitespace.
     *
     * @code
     * // Example Usage:
     * std::string level = tinyid::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders an unsigned integer with comma thousands separators.
     *
     * @code
     * String::group_digits(1234567); // "1,234,567"
     * String::group_digits(999);     // "999"
     * @endcode
     */
    static std::string group_digits(uint64_t value);
};

} // namespace tinyid::infra
