// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "utf8.hpp"
#include <gtest/gtest.h>
#include <test/utils/hex.hpp>
#include <utility>

using namespace stasis;
using namespace stasis::test;

namespace
{
bool is_valid_utf8(std::string_view hex_input)
{
    const auto input = from_hex(hex_input);
    return utf8_validate(input.data(), input.data() + input.size());
}
}  // namespace

TEST(utf8, empty)
{
    EXPECT_TRUE(utf8_validate(nullptr, nullptr));
    EXPECT_TRUE(is_valid_utf8(""));
}

TEST(utf8, ascii)
{
    EXPECT_TRUE(is_valid_utf8("00"));
    EXPECT_TRUE(is_valid_utf8("7f"));
    EXPECT_TRUE(is_valid_utf8("656e76"));  // "env"
}

TEST(utf8, invalid_lead_bytes)
{
    for (unsigned b = 0x80; b <= 0xff; ++b)
    {
        if (b >= 0xc2 && b <= 0xf4)
            continue;
        const uint8_t input[]{uint8_t(b), 0x80, 0x80, 0x80};
        EXPECT_FALSE(utf8_validate(input, input + 1)) << b;
        EXPECT_FALSE(utf8_validate(input, input + sizeof(input))) << b;
    }
}

TEST(utf8, two_byte_sequences)
{
    EXPECT_TRUE(is_valid_utf8("c280"));
    EXPECT_TRUE(is_valid_utf8("c2bf"));
    EXPECT_TRUE(is_valid_utf8("dfbf"));
    EXPECT_FALSE(is_valid_utf8("c2"));
    EXPECT_FALSE(is_valid_utf8("c27f"));
    EXPECT_FALSE(is_valid_utf8("c2c0"));
    // Overlong encoding of '/'.
    EXPECT_FALSE(is_valid_utf8("c0af"));
}

TEST(utf8, three_byte_sequences)
{
    EXPECT_TRUE(is_valid_utf8("e0a080"));
    EXPECT_TRUE(is_valid_utf8("e0bfbf"));
    EXPECT_TRUE(is_valid_utf8("e18080"));
    EXPECT_TRUE(is_valid_utf8("ecbfbf"));
    EXPECT_TRUE(is_valid_utf8("ed8080"));
    EXPECT_TRUE(is_valid_utf8("ed9fbf"));
    EXPECT_TRUE(is_valid_utf8("ee8080"));
    EXPECT_TRUE(is_valid_utf8("efbfbf"));

    // Overlong.
    EXPECT_FALSE(is_valid_utf8("e09f80"));
    // Surrogates.
    EXPECT_FALSE(is_valid_utf8("eda080"));
    EXPECT_FALSE(is_valid_utf8("edbfbf"));

    EXPECT_FALSE(is_valid_utf8("e1807f"));
    EXPECT_FALSE(is_valid_utf8("e180c0"));
    EXPECT_FALSE(is_valid_utf8("ee70"));
}

TEST(utf8, four_byte_sequences)
{
    EXPECT_TRUE(is_valid_utf8("f0908080"));
    EXPECT_TRUE(is_valid_utf8("f0bfbfbf"));
    EXPECT_TRUE(is_valid_utf8("f1808080"));
    EXPECT_TRUE(is_valid_utf8("f3bfbfbf"));
    EXPECT_TRUE(is_valid_utf8("f4808080"));
    EXPECT_TRUE(is_valid_utf8("f48fbfbf"));

    // Overlong.
    EXPECT_FALSE(is_valid_utf8("f08fbfbf"));
    // Above U+10FFFF.
    EXPECT_FALSE(is_valid_utf8("f4908080"));

    EXPECT_FALSE(is_valid_utf8("f1c0bfbf"));
    EXPECT_FALSE(is_valid_utf8("f1bfc0bf"));
    EXPECT_FALSE(is_valid_utf8("f1bfbfc0"));
}

TEST(utf8, truncated_sequences)
{
    // Lead bytes with a valid second byte.
    constexpr std::pair<uint8_t, uint8_t> prefixes[]{{0xc2, 0x80}, {0xdf, 0xbf}, {0xe0, 0xa0},
        {0xe1, 0x80}, {0xed, 0x9f}, {0xef, 0xbf}, {0xf0, 0x90}, {0xf3, 0xbf}, {0xf4, 0x8f}};
    for (const auto& [lead, second] : prefixes)
    {
        const uint8_t input[]{lead, second, 0x80, 0x80};
        const auto full_length = lead < 0xe0 ? 2 : (lead < 0xf0 ? 3 : 4);
        for (int length = 1; length < full_length; ++length)
            EXPECT_FALSE(utf8_validate(input, input + length)) << int{lead} << " " << length;
        EXPECT_TRUE(utf8_validate(input, input + full_length)) << int{lead};
    }
}

TEST(utf8, mixed_text)
{
    // "abc" followed by characters of every encoded length.
    EXPECT_TRUE(is_valid_utf8("616263c2bfe0a080ecbabaed9fbfee8181efaa81f09081a0f1a0a081f4819f85"));
    // A valid prefix does not save an invalid tail.
    EXPECT_FALSE(is_valid_utf8("616263c2bfe0a080ff"));
}
