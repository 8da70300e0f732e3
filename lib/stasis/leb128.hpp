// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include "exceptions.hpp"
#include <cstdint>
#include <limits>
#include <utility>

static_assert((int8_t{-1} >> 1) == int8_t{-1},
    "signed LEB128 decoder assumes arithmetic shift of negative values");

namespace stasis
{
/// Decodes unsigned LEB128 value of type T.
///
/// Non-minimal encodings are accepted as long as they fit in ceil(bits(T) / 7) bytes.
template <typename T>
inline std::pair<T, const uint8_t*> leb128u_decode(const uint8_t* input, const uint8_t* end)
{
    static_assert(!std::numeric_limits<T>::is_signed);

    T result = 0;
    int result_shift = 0;

    for (; result_shift < std::numeric_limits<T>::digits; ++input, result_shift += 7)
    {
        if (input == end)
            throw parser_error{input, "unexpected EOF"};

        result |= static_cast<T>((static_cast<T>(*input) & 0x7F) << result_shift);
        if ((*input & 0x80) == 0)
        {
            if (*input != (result >> result_shift))
                throw parser_error{input, "invalid LEB128 encoding: unused bits set"};

            return {result, input + 1};
        }
    }

    throw parser_error{input, "invalid LEB128 encoding: too many bytes"};
}

/// Decodes signed LEB128 value of type T.
template <typename T>
inline std::pair<T, const uint8_t*> leb128s_decode(const uint8_t* input, const uint8_t* end)
{
    static_assert(std::numeric_limits<T>::is_signed);

    using T_unsigned = typename std::make_unsigned<T>::type;
    T_unsigned result = 0;
    size_t result_shift = 0;

    for (; result_shift < std::numeric_limits<T_unsigned>::digits; ++input, result_shift += 7)
    {
        if (input == end)
            throw parser_error{input, "unexpected EOF"};

        result |= static_cast<T_unsigned>((static_cast<T_unsigned>(*input) & 0x7F) << result_shift);
        if ((*input & 0x80) == 0)
        {
            if (result_shift + 7 < sizeof(T_unsigned) * 8)
            {
                // Not all bits of T are covered yet, sign-extend from bit 6 of the last byte.
                if ((*input & 0x40) != 0)
                {
                    constexpr auto all_ones = std::numeric_limits<T_unsigned>::max();
                    const auto mask = static_cast<T_unsigned>(all_ones << (result_shift + 7));
                    result |= mask;
                }
            }
            else
            {
                // The last possible byte: the bits not fitting in T must copy the sign bit.
                const auto expected =
                    (static_cast<uint8_t>(static_cast<T>(result) >> result_shift) & 0x7F);

                if (*input != expected)
                {
                    throw parser_error{
                        input, "invalid LEB128 encoding: unused bits not equal to sign bit"};
                }
            }

            return {static_cast<T>(result), input + 1};
        }
    }

    throw parser_error{input, "invalid LEB128 encoding: too many bytes"};
}

/// Encodes the value as minimal unsigned LEB128.
inline bytes leb128u_encode(uint64_t value)
{
    bytes result;
    do
    {
        auto byte = static_cast<uint8_t>(value & 0x7f);
        value >>= 7;
        if (value != 0)
            byte |= 0x80;
        result.push_back(byte);
    } while (value != 0);
    return result;
}

/// Encodes the value as minimal signed LEB128.
inline bytes leb128s_encode(int64_t value)
{
    bytes result;
    bool more = true;
    while (more)
    {
        auto byte = static_cast<uint8_t>(value & 0x7f);
        value >>= 7;
        // Done when the remaining bits are all copies of the sign bit just emitted.
        if ((value == 0 && (byte & 0x40) == 0) || (value == -1 && (byte & 0x40) != 0))
            more = false;
        else
            byte |= 0x80;
        result.push_back(byte);
    }
    return result;
}

}  // namespace stasis
