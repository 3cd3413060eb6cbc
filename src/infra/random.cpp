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
 * @file random.cpp
 * @brief Implementation of the entropy sources.
 */

#include "tinyid/infra/random.hpp"

namespace tinyid::infra {

/**
 * @brief Draws a value from the calling thread's private engine.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: Employs `thread_local` engines so concurrent callers
 * never contend on a lock.
 * 2. **Seeding**: Each engine is seeded once from `std::random_device`.
 */
uint64_t ThreadRandom::next_u64()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    return dis(gen);
}

ThreadRandom& ThreadRandom::instance()
{
    static ThreadRandom source;
    return source;
}

SeededRandom::SeededRandom(uint64_t seed) : engine_(seed) {}

uint64_t SeededRandom::next_u64()
{
    return dist_(engine_);
}

} // namespace tinyid::infra
