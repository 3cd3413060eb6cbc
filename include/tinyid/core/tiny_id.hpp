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
 * @file tiny_id.hpp
 * @brief Compact, human-friendly 8-byte identifier.
 *
 * @details
 * This header declares `TinyId`, a fixed-width identifier whose 8 bytes are
 * drawn from a 64-symbol alphabet (`a-z`, `A-Z`, `0-9`, `_`, `-`). It is easy
 * to read, type and compare, and unique enough to create 1-10 million instances
 * without collision. It occupies exactly as much space as a `uint64_t`.
 *
 * @warning `TinyId` is **NOT** cryptographically secure. Do not use it where
 * unpredictability or adversarial collision resistance matters.
 *
 * **Construction Families:**
 * - **Checked** (`from_string`, `from_u64`, `from_bytes`): validate every byte
 * and return a `Result<TinyId>`.
 * - **Unchecked** (`*_unchecked`): trust the caller and never validate. The
 * resulting value may be invalid; query it with `is_valid()`.
 *
 * @code
 * // Example Usage:
 * auto id = tinyid::core::TinyId::random();
 * auto parsed = tinyid::core::TinyId::from_string("AAAABBBB");
 * if (parsed.ok() && parsed.value().starts_with("AAAA")) { ... }
 * @endcode
 */

#pragma once

#include "tinyid/core/error.hpp"
#include "tinyid/core/result.hpp"
#include "tinyid/infra/random.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace tinyid::core {

class TinyId {
  public:
    /// Raw storage type.
    using Bytes = std::array<uint8_t, 8>;

    /// Width of every identifier, in bytes and in rendered characters.
    static constexpr std::size_t SIZE = 8;

    /// Number of symbols in the alphabet. Divides 256 exactly.
    static constexpr std::size_t LETTER_COUNT = 64;

    /// The alphabet, in generation order.
    static constexpr std::array<uint8_t, LETTER_COUNT> LETTERS = {
        'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p',
        'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z', 'A', 'B', 'C', 'D', 'E', 'F',
        'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V',
        'W', 'X', 'Y', 'Z', '1', '2', '3', '4', '5', '6', '7', '8', '9', '0', '_', '-'};

    /// Byte used to mark null storage. Never part of the alphabet.
    static constexpr uint8_t NULL_CHAR = 0;

    /// The sentinel storage of a null identifier.
    static constexpr Bytes NULL_DATA = {0, 0, 0, 0, 0, 0, 0, 0};

    static_assert(256 % LETTER_COUNT == 0, "alphabet size must divide 256 to stay unbiased");

    /// Constructs the null identifier.
    TinyId() : data_(NULL_DATA) {}

    // ========================================================================
    //  GENERATION
    // ========================================================================

    /**
     * @brief Generates a random identifier from the calling thread's source.
     *
     * Draws one 64-bit value, splits it into 8 big-endian bytes and maps each
     * byte `b` onto `LETTERS[b % 64]`. Since 256 is a multiple of 64 the mapping
     * introduces no bias. Thread-safe.
     */
    static TinyId random();

    /// Same as `random()`, drawing exactly one value from `source`.
    static TinyId random(infra::RandomSource& source);

    /// Returns the null identifier.
    static TinyId null();

    // ========================================================================
    //  CHECKED CONSTRUCTION
    // ========================================================================

    /**
     * @brief Parses the canonical 8-character text form.
     *
     * @return `INVALID_LENGTH` if `text` is not exactly 8 bytes long,
     * `INVALID_CHARACTERS` if any byte is outside the alphabet.
     */
    static Result<TinyId> from_string(std::string_view text);

    /**
     * @brief Builds an identifier from the big-endian bytes of `n`.
     *
     * @return `INVALID_CHARACTERS` if any resulting byte is outside the alphabet.
     */
    static Result<TinyId> from_u64(uint64_t n);

    /// @return `INVALID_CHARACTERS` if any byte is outside the alphabet.
    static Result<TinyId> from_bytes(const Bytes& bytes);

    /**
     * @brief Builds an identifier from a byte range of arbitrary length.
     *
     * @return `CONVERSION` if `size` is not 8, `INVALID_CHARACTERS` if any byte
     * is outside the alphabet.
     */
    static Result<TinyId> from_bytes(const uint8_t* data, std::size_t size);

    // ========================================================================
    //  UNCHECKED CONSTRUCTION
    // ========================================================================

    /**
     * @brief Copies the bytes of `text` into a new identifier without validation.
     *
     * Shorter input is zero-padded.
     *
     * @warning Input longer than 8 bytes violates the contract of this function.
     * The violation is logged at `FATAL` and the process is aborted.
     */
    static TinyId from_string_unchecked(std::string_view text);

    static TinyId from_u64_unchecked(uint64_t n);

    static TinyId from_bytes_unchecked(const Bytes& bytes);

    // ========================================================================
    //  QUERIES
    // ========================================================================

    /// Tests whether `byte` belongs to the alphabet.
    static constexpr bool is_valid_byte(uint8_t byte)
    {
        return byte == '-' || (byte >= '0' && byte <= '9') || (byte >= 'A' && byte <= 'Z') ||
               byte == '_' || (byte >= 'a' && byte <= 'z');
    }

    /// True iff the identifier is not null and every byte is in the alphabet.
    bool is_valid() const;

    bool is_null() const;

    /// Overwrites the storage with the null sentinel.
    void make_null();

    /**
     * @brief Renders the identifier as text.
     *
     * Always returns exactly 8 characters, one per byte, even for null or
     * invalid identifiers (a null identifier renders as 8 NUL characters).
     */
    std::string to_string() const;

    /// Reinterprets the storage as a big-endian unsigned integer.
    uint64_t to_u64() const;

    const Bytes& to_bytes() const
    {
        return data_;
    }

    /**
     * @brief Checks whether the rendered text starts with `prefix`.
     *
     * An empty prefix always matches; a prefix longer than 8 never does.
     */
    bool starts_with(std::string_view prefix) const;

    /// Mirror of `starts_with` for the end of the rendered text.
    bool ends_with(std::string_view suffix) const;

    /// DJB2 hash over the raw storage bytes.
    std::size_t hash() const;

    bool operator==(const TinyId& other) const;
    bool operator!=(const TinyId& other) const;
    bool operator<(const TinyId& other) const;
    bool operator<=(const TinyId& other) const;
    bool operator>(const TinyId& other) const;
    bool operator>=(const TinyId& other) const;

  private:
    explicit TinyId(const Bytes& data) : data_(data) {}

    static Bytes to_be_bytes(uint64_t n);

    Bytes data_;
};

std::ostream& operator<<(std::ostream& os, const TinyId& id);

} // namespace tinyid::core

namespace std {
template <> struct hash<tinyid::core::TinyId> {
    std::size_t operator()(const tinyid::core::TinyId& id) const
    {
        return id.hash();
    }
};
} // namespace std
