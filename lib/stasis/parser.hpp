// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "exceptions.hpp"
#include "leb128.hpp"
#include "module.hpp"
#include <cstring>
#include <memory>

namespace stasis
{
constexpr uint8_t wasm_prefix_data[]{0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};
constexpr bytes_view wasm_prefix{wasm_prefix_data, sizeof(wasm_prefix_data)};

template <typename T>
using parser_result = std::pair<T, const uint8_t*>;

/// Decodes `input` into a Module.
///
/// Checks only the well-formedness of the binary. The result must be validated with validate()
/// before instantiation.
///
/// @param  input    The WebAssembly binary. No need to persist by the caller, since all relevant
///                  parts will be copied.
/// @return          The decoded module.
/// @throws parser_error with the offset of the failure in the input.
std::unique_ptr<const Module> decode(bytes_view input);

/// Computes the module fingerprint: 64-bit FNV-1a hash of the binary.
uint64_t fingerprint(bytes_view input) noexcept;

inline parser_result<uint8_t> parse_byte(const uint8_t* pos, const uint8_t* end)
{
    if (pos == end)
        throw parser_error{pos, "unexpected EOF"};

    return {*pos, pos + 1};
}

template <typename T>
inline parser_result<T> parse_value(const uint8_t* pos, const uint8_t* end)
{
    constexpr ptrdiff_t size = sizeof(T);
    if ((end - pos) < size)
        throw parser_error{end, "unexpected EOF"};

    T value;
    memcpy(&value, pos, size);
    return {value, pos + size};
}

/// Parses `expr`, i.e. an instruction sequence terminated by the end opcode. The terminating
/// end is consumed and not included in the result.
/// https://webassembly.github.io/spec/core/binary/instructions.html#binary-expr
///
/// Nested blocks are decoded recursively into the bodies of their block instructions.
///
/// @param  input_begin The beginning of the module binary, source locations are relative to it.
/// @param  pos         The beginning of the expr binary input.
/// @param  end         The end of the binary input.
/// @return             The decoded instructions.
parser_result<std::vector<Instr>> parse_expr(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end);

/// Parses a string and validates it against UTF-8 encoding rules.
/// @param  pos    The beginning of the string input.
/// @param  end    The end of the string input.
/// @return        The parsed and UTF-8 validated string.
parser_result<std::string> parse_string(const uint8_t* pos, const uint8_t* end);

/// Parses the vec of u32 values.
/// This is used in parse_expr() (parser_expr.cpp).
parser_result<std::vector<uint32_t>> parse_vec_i32(const uint8_t* pos, const uint8_t* end);

/// Validates and converts the byte at `pos` to valtype.
ValType validate_valtype(const uint8_t* pos, uint8_t byte);

/// Validates and converts the byte at `pos` to reftype.
ValType validate_reftype(const uint8_t* pos, uint8_t byte);
}  // namespace stasis
