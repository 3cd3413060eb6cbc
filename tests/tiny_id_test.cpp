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
 * @file tiny_id_test.cpp
 * @brief Unit tests for `TinyId` construction, conversion and comparison.
 */

#include "tinyid/core/tiny_id.hpp"
#include "tinyid/infra/random.hpp"
#include "framework.hpp"

#include <csignal>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <unordered_set>

using tinyid::core::TinyId;
using tinyid::core::TinyIdError;

namespace {

const TinyId::Bytes ABCDEFGH = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
const uint64_t ABCDEFGH_U64 = 7017280452245743464ULL;

} // namespace

/**
 * @brief Every alphabet symbol passes `is_valid_byte`; NUL never does.
 */
void test_alphabet_membership()
{
    for (uint8_t letter : TinyId::LETTERS) {
        ASSERT_TRUE(TinyId::is_valid_byte(letter));
    }
    ASSERT_FALSE(TinyId::is_valid_byte(TinyId::NULL_CHAR));

    // Exactly 64 of the 256 byte values are members.
    int members = 0;
    for (int b = 0; b < 256; ++b) {
        if (TinyId::is_valid_byte(static_cast<uint8_t>(b))) {
            members++;
        }
    }
    ASSERT_EQ(members, 64);

    // Symbols are distinct.
    std::set<uint8_t> distinct(TinyId::LETTERS.begin(), TinyId::LETTERS.end());
    ASSERT_EQ(distinct.size(), TinyId::LETTER_COUNT);
}

void test_random_is_valid()
{
    for (int i = 0; i < 1000; ++i) {
        TinyId id = TinyId::random();
        ASSERT_TRUE(id.is_valid());
        ASSERT_FALSE(id.is_null());
        ASSERT_EQ(id.to_string().size(), TinyId::SIZE);
    }
}

/**
 * @brief Generation maps each big-endian byte `b` onto `LETTERS[b % 64]`.
 */
void test_random_mapping_with_fixed_source()
{
    class FixedSource : public tinyid::infra::RandomSource {
      public:
        explicit FixedSource(uint64_t value) : value_(value) {}
        uint64_t next_u64() override
        {
            calls++;
            return value_;
        }
        int calls = 0;

      private:
        uint64_t value_;
    };

    // Bytes 0x00, 0x01, 0x3F, 0x40, 0x41, 0x7F, 0xC0, 0xFF
    FixedSource source(0x00013F40417FC0FFULL);
    TinyId id = TinyId::random(source);

    ASSERT_EQ(source.calls, 1);
    ASSERT_EQ(id.to_string(), std::string("ab-ab-a-"));

    FixedSource zero(0);
    ASSERT_EQ(TinyId::random(zero).to_string(), std::string("aaaaaaaa"));
}

void test_seeded_generation_is_reproducible()
{
    tinyid::infra::SeededRandom a(42);
    tinyid::infra::SeededRandom b(42);
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(TinyId::random(a), TinyId::random(b));
    }
}

void test_null_and_make_null()
{
    TinyId null = TinyId::null();
    ASSERT_TRUE(null.is_null());
    ASSERT_FALSE(null.is_valid());
    ASSERT_EQ(null, TinyId());
    ASSERT_EQ(null.to_u64(), static_cast<uint64_t>(0));

    // Rendering stays lossless: 8 NUL characters.
    ASSERT_EQ(null.to_string(), std::string(8, '\0'));

    TinyId id = TinyId::random();
    id.make_null();
    ASSERT_TRUE(id.is_null());
    ASSERT_FALSE(id.is_valid());
    ASSERT_EQ(id, TinyId::null());

    TinyId bad = TinyId::from_u64_unchecked(std::numeric_limits<uint64_t>::max());
    bad.make_null();
    ASSERT_EQ(bad, TinyId::null());
}

void test_from_bytes()
{
    auto result = TinyId::from_bytes(ABCDEFGH);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().to_string(), std::string("abcdefgh"));
    ASSERT_EQ(result.value().to_u64(), ABCDEFGH_U64);
    ASSERT_TRUE(result.value().to_bytes() == ABCDEFGH);

    auto bad = TinyId::from_bytes(TinyId::Bytes{'!', 'b', 'c', 'd', 'e', 'f', 'g', 'h'});
    ASSERT_FALSE(bad.ok());
    ASSERT_EQ(bad.error(), TinyIdError::invalid_characters());

    auto null = TinyId::from_bytes(TinyId::NULL_DATA);
    ASSERT_EQ(null.error(), TinyIdError::invalid_characters());
}

void test_from_byte_range()
{
    const uint8_t good[] = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
    auto result = TinyId::from_bytes(good, sizeof(good));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().to_string(), std::string("abcdefgh"));

    const uint8_t bad[] = {'!', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
    ASSERT_EQ(TinyId::from_bytes(bad, sizeof(bad)).error(), TinyIdError::invalid_characters());

    // A range of the wrong width fails before any byte is inspected.
    auto short_range = TinyId::from_bytes(good, 7);
    ASSERT_FALSE(short_range.ok());
    ASSERT_TRUE(short_range.error().kind() == TinyIdError::Kind::CONVERSION);
    ASSERT_FALSE(short_range.error().message().empty());
}

void test_from_u64()
{
    auto result = TinyId::from_u64(ABCDEFGH_U64);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().to_string(), std::string("abcdefgh"));

    auto max = TinyId::from_u64(std::numeric_limits<uint64_t>::max());
    ASSERT_FALSE(max.ok());
    ASSERT_EQ(max.error(), TinyIdError::invalid_characters());

    ASSERT_FALSE(TinyId::from_u64(0).ok());
}

void test_from_string()
{
    auto ok = TinyId::from_string("AAAABBBB");
    ASSERT_TRUE(ok.ok());
    ASSERT_EQ(ok.value(), TinyId::from_string_unchecked("AAAABBBB"));

    ASSERT_EQ(TinyId::from_string("AAAABBB").error(), TinyIdError::invalid_length());
    ASSERT_EQ(TinyId::from_string("AAAABBBBB").error(), TinyIdError::invalid_length());
    ASSERT_EQ(TinyId::from_string("").error(), TinyIdError::invalid_length());
    ASSERT_EQ(TinyId::from_string("abcdefghijklmnopqrstuvwxyz").error(),
              TinyIdError::invalid_length());

    ASSERT_EQ(TinyId::from_string("abcdefg!").error(), TinyIdError::invalid_characters());
    ASSERT_EQ(TinyId::from_string("abc@efgh").error(), TinyIdError::invalid_characters());
    ASSERT_EQ(TinyId::from_string("abcd fgh").error(), TinyIdError::invalid_characters());
    ASSERT_EQ(TinyId::from_string(std::string("abc\0efgh", 8)).error(),
              TinyIdError::invalid_characters());
    ASSERT_EQ(TinyId::from_string("!@#$%^&*").error(), TinyIdError::invalid_characters());

    // Multi-byte UTF-8 is counted in bytes: "\xC3\xA9" is one symbol, two bytes.
    ASSERT_EQ(TinyId::from_string("abcdef\xC3\xA9").error(), TinyIdError::invalid_characters());
}

void test_unwrapping_failed_result_throws()
{
    auto bad = TinyId::from_string("short");
    bool thrown = false;
    try {
        (void)bad.value();
    } catch (const tinyid::core::TinyIdException& e) {
        thrown = true;
        ASSERT_EQ(e.error(), TinyIdError::invalid_length());
        ASSERT_EQ(std::string(e.what()), std::string("Invalid length"));
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(bad.value_or(TinyId::null()), TinyId::null());
}

void test_unchecked_constructors()
{
    ASSERT_FALSE(TinyId::from_bytes_unchecked({'!', 'b', 'c', 'd', 'e', 'f', 'g', 'h'}).is_valid());
    ASSERT_FALSE(TinyId::from_u64_unchecked(std::numeric_limits<uint64_t>::max()).is_valid());
    ASSERT_FALSE(TinyId::from_string_unchecked("abcdefg!").is_valid());

    // Short input is zero-padded.
    TinyId padded = TinyId::from_string_unchecked("abc");
    ASSERT_FALSE(padded.is_valid());
    ASSERT_EQ(padded.to_string(), std::string("abc\0\0\0\0\0", 8));
    ASSERT_TRUE(TinyId::from_string_unchecked("").is_null());
}

/**
 * @brief Oversized unchecked input terminates the process.
 *
 * Runs the violation in a forked child and expects it to die with SIGABRT.
 */
void test_unchecked_oversized_input_aborts()
{
    pid_t pid = fork();
    ASSERT_TRUE(pid >= 0);
    if (pid == 0) {
        TinyId::from_string_unchecked("oopsie poopsie!");
        _exit(0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    ASSERT_EQ(WTERMSIG(status), SIGABRT);
}

void test_round_trips()
{
    tinyid::infra::SeededRandom source(7);
    for (int i = 0; i < 1000; ++i) {
        TinyId id = TinyId::random(source);
        ASSERT_EQ(TinyId::from_string(id.to_string()).value(), id);
        ASSERT_EQ(TinyId::from_u64(id.to_u64()).value(), id);
        ASSERT_EQ(TinyId::from_bytes(id.to_bytes()).value(), id);
    }
}

void test_equality_across_constructors()
{
    TinyId a = TinyId::from_bytes_unchecked(ABCDEFGH);
    TinyId b = TinyId::from_u64_unchecked(a.to_u64());
    TinyId c = TinyId::from_string_unchecked("abcdefgh");
    TinyId d = TinyId::from_string("abcdefgh").value();
    TinyId e = TinyId::from_u64(ABCDEFGH_U64).value();

    ASSERT_TRUE(a.is_valid() && b.is_valid() && c.is_valid());
    ASSERT_EQ(a, b);
    ASSERT_EQ(b, c);
    ASSERT_EQ(c, d);
    ASSERT_EQ(d, e);
    ASSERT_TRUE(a.to_bytes() == ABCDEFGH);

    // Case-sensitive.
    ASSERT_NE(TinyId::from_string_unchecked("aaaaBBBB"), TinyId::from_string_unchecked("AAAABBBB"));

    // Copies are independent.
    TinyId copy = a;
    copy.make_null();
    ASSERT_NE(copy, a);
    ASSERT_TRUE(a.is_valid());
}

void test_ordering_is_bytewise()
{
    TinyId upper = TinyId::from_string("AAAAAAAA").value();
    TinyId lower = TinyId::from_string("aaaaaaaa").value();
    TinyId lower2 = TinyId::from_string("aaaaaaab").value();

    // 'A' (0x41) sorts before 'a' (0x61).
    ASSERT_TRUE(upper < lower);
    ASSERT_TRUE(lower < lower2);
    ASSERT_TRUE(lower2 > upper);
    ASSERT_TRUE(lower <= lower);
    ASSERT_TRUE(lower >= lower);
    ASSERT_TRUE(TinyId::null() < upper);

    // Byte order agrees with integer order.
    ASSERT_TRUE((upper < lower) == (upper.to_u64() < lower.to_u64()));
}

void test_hash_consistent_with_equality()
{
    TinyId a = TinyId::from_string("abcdefgh").value();
    TinyId b = TinyId::from_u64_unchecked(ABCDEFGH_U64);
    std::hash<TinyId> hasher;
    ASSERT_EQ(hasher(a), hasher(b));

    std::unordered_set<TinyId> set;
    set.insert(a);
    ASSERT_FALSE(set.insert(b).second);
    ASSERT_EQ(set.size(), static_cast<size_t>(1));
}

void test_starts_and_ends_with()
{
    TinyId id = TinyId::from_string_unchecked("AAAABBBB");

    ASSERT_TRUE(id.starts_with(""));
    ASSERT_TRUE(id.ends_with(""));
    ASSERT_TRUE(id.starts_with("AAAA"));
    ASSERT_TRUE(id.ends_with("BBBB"));
    ASSERT_FALSE(id.starts_with("BBBB"));
    ASSERT_FALSE(id.ends_with("AAAA"));
    ASSERT_TRUE(id.starts_with("AAAABBBB"));
    ASSERT_TRUE(id.ends_with("AAAABBBB"));
    ASSERT_FALSE(id.starts_with("AAAABBBBB"));
    ASSERT_FALSE(id.ends_with("AAAABBBBB"));
    ASSERT_FALSE(id.starts_with("aaaa"));

    ASSERT_TRUE(TinyId::null().starts_with(""));
    ASSERT_FALSE(TinyId::null().starts_with("a"));
}

/**
 * @brief Regression signal for the collision property.
 *
 * One million draws are expected to be collision-free with high probability.
 */
void test_no_collisions_in_one_million()
{
    std::unordered_set<TinyId> ids;
    ids.reserve(1000000);
    for (int i = 0; i < 1000000; ++i) {
        ASSERT_TRUE(ids.insert(TinyId::random()).second);
    }
}

void test_size_matches_u64()
{
    ASSERT_EQ(sizeof(TinyId), sizeof(uint64_t));
}
