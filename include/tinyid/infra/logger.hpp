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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for TinyId.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * library and its tool. Output to the standard streams is serialized so messages
 * from concurrent threads never interleave. A process-wide severity threshold
 * filters out messages below the configured level.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace tinyid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (e.g., rejected input documents).
    INFO,  ///< Nominal operational events (e.g., tool start, run summaries).
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Contract violations that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * Messages below the current threshold are discarded.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * // Example Usage:
     * tinyid::infra::Logger::log(LogLevel::INFO, "Tool: sampling 100 ids.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that will be written. Defaults to `INFO`.
    static void set_level(LogLevel level);

    static LogLevel level();

    /**
     * @brief Parses a level name such as `"debug"` or `" WARN "`.
     *
     * Surrounding whitespace is ignored and matching is case-insensitive.
     *
     * @return The level, or `std::nullopt` if the name is unknown.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// Current severity threshold.
    static std::atomic<LogLevel> threshold_;
};

} // namespace tinyid::infra
