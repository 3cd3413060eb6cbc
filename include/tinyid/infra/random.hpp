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
 * @file random.hpp
 * @brief Entropy sources consumed by `TinyId` generation.
 *
 * @details
 * Generation needs exactly one capability from its environment: a uniformly
 * distributed unsigned 64-bit integer on demand. This header declares the
 * `RandomSource` interface plus two implementations: a lock-free thread-local
 * source used by default, and a seeded source for reproducible tests.
 *
 * @warning None of these sources are cryptographically secure.
 */

#pragma once

#include <cstdint>
#include <random>

namespace tinyid::infra {

/**
 * @class RandomSource
 * @brief Abstract producer of uniform 64-bit values.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /// Draws one uniformly distributed value over the full `uint64_t` range.
    virtual uint64_t next_u64() = 0;
};

/**
 * @class ThreadRandom
 * @brief Default source backed by a per-thread Mersenne Twister.
 *
 * @details
 * Every thread owns an independent `std::mt19937_64` seeded from
 * `std::random_device` on first use. The object itself is stateless, so
 * any number of instances may be shared or copied across threads.
 */
class ThreadRandom : public RandomSource {
  public:
    uint64_t next_u64() override;

    /// Convenience accessor used by `TinyId::random()`.
    static ThreadRandom& instance();
};

/**
 * @class SeededRandom
 * @brief Deterministic source for reproducible sequences.
 *
 * @note Not thread-safe. Use one instance per thread.
 */
class SeededRandom : public RandomSource {
  public:
    explicit SeededRandom(uint64_t seed);

    uint64_t next_u64() override;

  private:
    std::mt19937_64 engine_;
    std::uniform_int_distribution<uint64_t> dist_;
};

} // namespace tinyid::infra
