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
 * @file commands.hpp
 * @brief Sub-commands of the `tinyid-tool` program.
 *
 * @details
 * Each command writes its report to the supplied stream and returns a process
 * exit status, so the dispatcher in `main.cpp` stays a thin argument parser.
 */

#pragma once

#include "tinyid/infra/random.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace tinyid::tool {

/**
 * @class Commands
 * @brief A static controller implementing the tool's operations.
 */
class Commands {
  public:
    /// Builds a fresh entropy source. Called concurrently from pool workers.
    using SourceFactory = std::function<std::unique_ptr<infra::RandomSource>()>;

    static constexpr std::size_t MAX_SAMPLE_COUNT = 1000000;
    static constexpr std::size_t MAX_TRIALS = 100000;
    static constexpr std::size_t MAX_THREADS = 256;

    /**
     * @brief Reads a positive decimal count from a command-line argument.
     *
     * @return `std::nullopt` unless `text` is all digits and the value lies in
     * `[1, max]`. Signs, whitespace and trailing characters are rejected.
     */
    static std::optional<std::size_t> parse_count(const std::string& text, std::size_t max);

    /**
     * @brief Prints `count` random identifiers, two per line.
     *
     * Format: `#001: abcdefgh | #002: ABCDEFGH`. An odd count leaves the last
     * line with a single entry.
     */
    static int sample(std::ostream& out, std::size_t count, infra::RandomSource& source);

    /**
     * @brief Generates identifiers until the first duplicate appears.
     *
     * @return The number of identifiers drawn, the duplicate included.
     */
    static uint64_t iterations_until_collision(infra::RandomSource& source);

    /**
     * @brief Runs one collision search and reports the count and elapsed time.
     *
     * The reported count is the number of distinct identifiers held when the
     * duplicate appeared, one less than `iterations_until_collision`.
     */
    static int collision(std::ostream& out, infra::RandomSource& source);

    /**
     * @brief Averages `iterations_until_collision` over `trials` runs.
     *
     * Trials run concurrently on a `Scheduler` with `threads` workers. Each
     * trial draws from its own source obtained from `make_source`.
     *
     * @return 0 on success, 1 if `trials` is 0.
     */
    static int collision_average(std::ostream& out, std::size_t trials, std::size_t threads,
                                 const SourceFactory& make_source);

    /**
     * @brief Parses `text` with the checked parser and describes the outcome.
     *
     * @return 0 on success, 1 if the text was rejected.
     */
    static int parse(std::ostream& out, const std::string& text);
};

} // namespace tinyid::tool
