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
 * @file commands.cpp
 * @brief Implementation of the `tinyid-tool` sub-commands.
 */

#include "tinyid/tool/commands.hpp"

#include "tinyid/core/tiny_id.hpp"
#include "tinyid/infra/logger.hpp"
#include "tinyid/infra/scheduler.hpp"
#include "tinyid/infra/string.hpp"
#include "tinyid/serde/json_codec.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace tinyid::tool {

using core::TinyId;

std::optional<std::size_t> Commands::parse_count(const std::string& text, std::size_t max)
{
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    bool digits = std::all_of(text.begin(), text.end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        return std::nullopt;
    }

    // At most 19 digits, so the value fits in 64 bits.
    uint64_t value = std::stoull(text);
    if (value == 0 || value > max) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

int Commands::sample(std::ostream& out, std::size_t count, infra::RandomSource& source)
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Tool: generating " + std::to_string(count) + " TinyIds...");

    for (std::size_t n = 1; n <= count; ++n) {
        // Padded in a local stream so the caller's fill character is untouched.
        std::ostringstream label;
        label << "#" << std::setw(3) << std::setfill('0') << n;
        out << label.str() << ": " << TinyId::random(source);
        out << ((n % 2 == 1 && n != count) ? " | " : "\n");
    }
    return 0;
}

uint64_t Commands::iterations_until_collision(infra::RandomSource& source)
{
    std::unordered_set<TinyId> seen;
    uint64_t iterations = 0;
    while (true) {
        ++iterations;
        if (!seen.insert(TinyId::random(source)).second) {
            return iterations;
        }
    }
}

int Commands::collision(std::ostream& out, infra::RandomSource& source)
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Tool: generating TinyIds until a collision occurs...");

    auto start = std::chrono::steady_clock::now();
    uint64_t distinct = iterations_until_collision(source) - 1;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    out << "Collision after " << infra::String::group_digits(distinct) << " iterations.\n";
    out << "Elapsed time: " << elapsed.count() << " ms\n";
    return 0;
}

/**
 * @brief Fans the trials out over the worker pool.
 *
 * Workers only touch atomics, so the shared totals need no lock.
 */
int Commands::collision_average(std::ostream& out, std::size_t trials, std::size_t threads,
                                const SourceFactory& make_source)
{
    if (trials == 0) {
        infra::Logger::log(infra::LogLevel::ERROR, "Tool: collision-average needs at least 1 trial");
        return 1;
    }

    std::atomic<uint64_t> total{0};
    std::atomic<std::size_t> done{0};

    infra::Scheduler scheduler(threads);
    infra::Logger::log(infra::LogLevel::INFO,
                       "Tool: averaging " + std::to_string(trials) + " collision runs on " +
                           std::to_string(scheduler.worker_count()) +
                           " workers. This may take several minutes...");

    for (std::size_t i = 0; i < trials; ++i) {
        scheduler.enqueue([&total, &done, &make_source, trials] {
            std::unique_ptr<infra::RandomSource> source = make_source();
            total += iterations_until_collision(*source);
            std::size_t finished = ++done;
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Tool: trial " + std::to_string(finished) + "/" +
                                   std::to_string(trials) + " finished");
        });
    }
    scheduler.wait_idle();

    out << "Average iterations until collision after " << trials
        << " attempts: " << infra::String::group_digits(total.load() / trials) << "\n";
    return 0;
}

int Commands::parse(std::ostream& out, const std::string& text)
{
    auto parsed = TinyId::from_string(text);
    if (!parsed.ok()) {
        out << "error: " << parsed.error() << "\n";
        out << "json:  " << serde::JsonCodec::dump(parsed.error()) << "\n";
        return 1;
    }

    const TinyId& id = parsed.value();
    out << "id:    " << id << "\n";
    out << "u64:   " << id.to_u64() << "\n";
    out << "json:  " << serde::JsonCodec::dump(id) << "\n";
    out << "valid: " << (id.is_valid() ? "true" : "false") << "\n";
    return 0;
}

} // namespace tinyid::tool
