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
 * @file main.cpp
 * @brief `tinyid-tool` entry point.
 *
 * @details
 * Orchestrates the startup sequence:
 * 1. Logger configuration from the `TINYID_LOG_LEVEL` environment variable.
 * 2. Argument parsing.
 * 3. Dispatch to the selected command.
 */

#include "tinyid/infra/logger.hpp"
#include "tinyid/infra/random.hpp"
#include "tinyid/tool/commands.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tinyid::infra::Logger;
using tinyid::infra::LogLevel;
using tinyid::tool::Commands;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " COMMAND [ARGS]\n"
              << "Commands:\n"
              << "  sample [COUNT]                      Print COUNT random ids (Default: 100)\n"
              << "  collision                           Generate ids until the first duplicate\n"
              << "  collision-average [TRIALS] [--threads N]\n"
              << "                                      Average iterations until collision "
                 "(Default: 100 trials)\n"
              << "  parse TEXT                          Validate TEXT as a TinyId\n"
              << "  --help                              Show this help message\n"
              << "Environment:\n"
              << "  TINYID_LOG_LEVEL    trace|debug|info|warn|error|fatal (Default: info)\n";
}

/**
 * @brief Applies the `TINYID_LOG_LEVEL` environment variable, if set.
 */
void configure_logging()
{
    const char* env = std::getenv("TINYID_LOG_LEVEL");
    if (!env) {
        return;
    }

    auto level = Logger::parse_level(env);
    if (level) {
        Logger::set_level(*level);
    } else {
        Logger::log(LogLevel::WARN,
                    "Config: Unknown TINYID_LOG_LEVEL '" + std::string(env) + "', using info");
    }
}

/**
 * @brief Parses a count argument, logging the rejection.
 */
std::optional<std::size_t> read_count(const char* what, const std::string& text, std::size_t max)
{
    auto count = Commands::parse_count(text, max);
    if (!count) {
        Logger::log(LogLevel::ERROR, "Config: " + std::string(what) + " must be between 1 and " +
                                         std::to_string(max) + ", got '" + text + "'");
    }
    return count;
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    configure_logging();

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help") {
        print_help(argv[0]);
        return args.empty() ? 1 : 0;
    }

    const std::string& command = args[0];

    try {
        if (command == "sample") {
            std::optional<std::size_t> count = 100;
            if (args.size() > 1) {
                count = read_count("COUNT", args[1], Commands::MAX_SAMPLE_COUNT);
            }
            if (!count) {
                return 1;
            }
            return Commands::sample(std::cout, *count, tinyid::infra::ThreadRandom::instance());
        }

        if (command == "collision") {
            return Commands::collision(std::cout, tinyid::infra::ThreadRandom::instance());
        }

        if (command == "collision-average") {
            std::optional<std::size_t> trials = 100;
            std::optional<std::size_t> threads = std::thread::hardware_concurrency();
            if (*threads == 0) {
                threads = 1;
            }
            for (std::size_t i = 1; i < args.size() && trials && threads; ++i) {
                if (args[i] == "--threads" && i + 1 < args.size()) {
                    threads = read_count("--threads", args[++i], Commands::MAX_THREADS);
                } else {
                    trials = read_count("TRIALS", args[i], Commands::MAX_TRIALS);
                }
            }
            if (!trials || !threads) {
                return 1;
            }
            Logger::log(LogLevel::DEBUG,
                        "Config: trials=" + std::to_string(*trials) +
                            " threads=" + std::to_string(*threads));
            return Commands::collision_average(
                std::cout, *trials, *threads,
                [] { return std::make_unique<tinyid::infra::ThreadRandom>(); });
        }

        if (command == "parse") {
            if (args.size() < 2) {
                Logger::log(LogLevel::ERROR, "Tool: 'parse' requires a TEXT argument");
                return 1;
            }
            return Commands::parse(std::cout, args[1]);
        }

        Logger::log(LogLevel::ERROR, "Tool: Unknown command '" + command + "'");
        print_help(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "Tool: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}
