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
 * @file tiny_id.cpp
 * @brief Implementation of `TinyId` generation, conversion and comparison.
 */

#include "tinyid/core/tiny_id.hpp"

#include "tinyid/infra/logger.hpp"

#include <algorithm>
#include <cstdlib>

namespace tinyid::core {

TinyId::Bytes TinyId::to_be_bytes(uint64_t n)
{
    Bytes bytes;
    for (std::size_t i = 0; i < SIZE; ++i) {
        bytes[i] = static_cast<uint8_t>(n >> (8 * (SIZE - 1 - i)));
    }
    return bytes;
}

// ============================================================================
//  GENERATION
// ============================================================================

TinyId TinyId::random()
{
    return random(infra::ThreadRandom::instance());
}

/**
 * @brief Maps one 64-bit draw onto 8 alphabet symbols.
 *
 * A single call to the source per identifier (instead of one per byte) keeps
 * generation cheap. Each byte spans 0..255, and 256 / 64 == 4, so every
 * symbol is hit by exactly four byte values.
 */
TinyId TinyId::random(infra::RandomSource& source)
{
    Bytes data = to_be_bytes(source.next_u64());
    for (auto& b : data) {
        b = LETTERS[b % LETTER_COUNT];
    }
    return TinyId(data);
}

TinyId TinyId::null()
{
    return TinyId(NULL_DATA);
}

// ============================================================================
//  CHECKED CONSTRUCTION
// ============================================================================

Result<TinyId> TinyId::from_string(std::string_view text)
{
    if (text.size() != SIZE) {
        return TinyIdError::invalid_length();
    }

    Bytes data = NULL_DATA;
    for (std::size_t i = 0; i < SIZE; ++i) {
        auto byte = static_cast<uint8_t>(text[i]);
        if (!is_valid_byte(byte)) {
            return TinyIdError::invalid_characters();
        }
        data[i] = byte;
    }
    return TinyId(data);
}

Result<TinyId> TinyId::from_u64(uint64_t n)
{
    return from_bytes(to_be_bytes(n));
}

Result<TinyId> TinyId::from_bytes(const Bytes& bytes)
{
    TinyId id(bytes);
    if (!id.is_valid()) {
        return TinyIdError::invalid_characters();
    }
    return id;
}

Result<TinyId> TinyId::from_bytes(const uint8_t* data, std::size_t size)
{
    if (size != SIZE || data == nullptr) {
        return TinyIdError::conversion("could not convert " + std::to_string(size) +
                                       " bytes to an array of " + std::to_string(SIZE));
    }

    Bytes bytes;
    std::copy(data, data + SIZE, bytes.begin());
    return from_bytes(bytes);
}

// ============================================================================
//  UNCHECKED CONSTRUCTION
// ============================================================================

TinyId TinyId::from_string_unchecked(std::string_view text)
{
    // Writing past the 8-byte storage is never acceptable, even on the trusted path.
    if (text.size() > SIZE) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           "TinyId: unchecked parse of " + std::to_string(text.size()) +
                               " bytes exceeds the " + std::to_string(SIZE) + "-byte storage");
        std::abort();
    }

    Bytes data = NULL_DATA;
    std::copy(text.begin(), text.end(), data.begin());
    return TinyId(data);
}

TinyId TinyId::from_u64_unchecked(uint64_t n)
{
    return TinyId(to_be_bytes(n));
}

TinyId TinyId::from_bytes_unchecked(const Bytes& bytes)
{
    return TinyId(bytes);
}

// ============================================================================
//  QUERIES
// ============================================================================

bool TinyId::is_valid() const
{
    return !is_null() && std::all_of(data_.begin(), data_.end(), is_valid_byte);
}

bool TinyId::is_null() const
{
    return data_ == NULL_DATA;
}

void TinyId::make_null()
{
    data_ = NULL_DATA;
}

std::string TinyId::to_string() const
{
    return std::string(data_.begin(), data_.end());
}

uint64_t TinyId::to_u64() const
{
    uint64_t n = 0;
    for (uint8_t b : data_) {
        n = (n << 8) | b;
    }
    return n;
}

bool TinyId::starts_with(std::string_view prefix) const
{
    if (prefix.empty()) {
        return true;
    }
    if (prefix.size() > SIZE) {
        return false;
    }
    std::string text = to_string();
    return text.compare(0, prefix.size(), prefix.data(), prefix.size()) == 0;
}

bool TinyId::ends_with(std::string_view suffix) const
{
    if (suffix.empty()) {
        return true;
    }
    if (suffix.size() > SIZE) {
        return false;
    }
    std::string text = to_string();
    return text.compare(SIZE - suffix.size(), suffix.size(), suffix.data(), suffix.size()) == 0;
}

std::size_t TinyId::hash() const
{
    std::size_t hash = 5381;
    for (uint8_t b : data_)
        hash = ((hash << 5) + hash) + b;
    return hash;
}

bool TinyId::operator==(const TinyId& other) const
{
    return data_ == other.data_;
}

bool TinyId::operator!=(const TinyId& other) const
{
    return data_ != other.data_;
}

bool TinyId::operator<(const TinyId& other) const
{
    return data_ < other.data_;
}

bool TinyId::operator<=(const TinyId& other) const
{
    return data_ <= other.data_;
}

bool TinyId::operator>(const TinyId& other) const
{
    return data_ > other.data_;
}

bool TinyId::operator>=(const TinyId& other) const
{
    return data_ >= other.data_;
}

std::ostream& operator<<(std::ostream& os, const TinyId& id)
{
    return os << id.to_string();
}

} // namespace tinyid::core
