// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "parser.hpp"
#include <limits>

namespace stasis
{
namespace
{
/// How an instruction sequence ended.
enum class Terminator : uint8_t
{
    end,
    else_
};

constexpr bool is_single_byte_opcode(uint8_t byte) noexcept
{
    return byte <= 0x05 || (byte >= 0x0b && byte <= 0x11) || (byte >= 0x1a && byte <= 0x1c) ||
           (byte >= 0x20 && byte <= 0x26) || (byte >= 0x28 && byte <= 0xc4) ||
           (byte >= 0xd0 && byte <= 0xd2);
}

/// The last defined subopcode of the 0xFC prefix (table.fill).
constexpr uint32_t MaxPrefixFCSubopcode = 0x11;

/// Parses blocktype.
///
/// Spec: https://webassembly.github.io/spec/core/binary/instructions.html#binary-blocktype.
parser_result<BlockType> parse_blocktype(const uint8_t* pos, const uint8_t* end)
{
    // The byte meaning an empty wasm result type.
    // https://webassembly.github.io/spec/core/binary/types.html#result-types
    constexpr uint8_t BlockTypeEmpty = 0x40;

    BlockType result;

    uint8_t byte;
    std::tie(byte, std::ignore) = parse_byte(pos, end);
    if (byte == BlockTypeEmpty)
        return {result, pos + 1};

    // Value types are negative numbers in the s33 encoding, so they never collide with a type
    // index.
    if ((byte & 0xc0) == 0x40)
    {
        result.kind = BlockType::Kind::value;
        result.value_type = validate_valtype(pos, byte);
        return {result, pos + 1};
    }

    // Type index as s33: at most 5 bytes, non-negative.
    const auto [type_idx, next] = leb128s_decode<int64_t>(pos, end);
    if (next - pos > 5 || type_idx < 0 || type_idx > std::numeric_limits<uint32_t>::max())
        throw parser_error{pos, "invalid block type"};

    result.kind = BlockType::Kind::type_index;
    result.type_index = static_cast<TypeIdx>(type_idx);
    return {result, next};
}

inline const uint8_t* parse_zero_byte(const uint8_t* pos, const uint8_t* end)
{
    uint8_t byte;
    std::tie(byte, pos) = parse_byte(pos, end);
    if (byte != 0)
        throw parser_error{pos - 1, "zero byte expected"};
    return pos;
}

inline const uint8_t* parse_memarg(Instr& instr, const uint8_t* pos, const uint8_t* end)
{
    std::tie(instr.index, pos) = leb128u_decode<uint32_t>(pos, end);  // alignment
    std::tie(instr.offset, pos) = leb128u_decode<uint32_t>(pos, end);
    return pos;
}

parser_result<Opcode> parse_opcode(const uint8_t* pos, const uint8_t* end)
{
    const auto opcode_pos = pos;
    uint8_t byte;
    std::tie(byte, pos) = parse_byte(pos, end);

    if (byte == OpcodePrefixFC)
    {
        uint32_t subopcode;
        std::tie(subopcode, pos) = leb128u_decode<uint32_t>(pos, end);
        if (subopcode > MaxPrefixFCSubopcode)
        {
            throw parser_error{
                opcode_pos, "invalid instruction 252 " + std::to_string(subopcode)};
        }
        return {static_cast<Opcode>((uint32_t{OpcodePrefixFC} << 8) | subopcode), pos};
    }

    if (!is_single_byte_opcode(byte))
        throw parser_error{opcode_pos, "invalid instruction " + std::to_string(byte)};

    return {static_cast<Opcode>(byte), pos};
}

parser_result<std::vector<Instr>> parse_instructions(const uint8_t* input_begin,
    const uint8_t* pos, const uint8_t* end, bool else_allowed, Terminator& terminator)
{
    std::vector<Instr> instructions;

    while (true)
    {
        const auto instr_begin = pos;

        Instr instr;
        std::tie(instr.opcode, pos) = parse_opcode(pos, end);

        switch (instr.opcode)
        {
        case Opcode::end:
            terminator = Terminator::end;
            return {std::move(instructions), pos};

        case Opcode::else_:
            if (!else_allowed)
                throw parser_error{instr_begin, "unexpected else"};
            terminator = Terminator::else_;
            return {std::move(instructions), pos};

        case Opcode::block:
        case Opcode::loop:
        {
            std::tie(instr.block_type, pos) = parse_blocktype(pos, end);
            Terminator body_terminator{};
            std::tie(instr.body, pos) =
                parse_instructions(input_begin, pos, end, false, body_terminator);
            break;
        }

        case Opcode::if_:
        {
            std::tie(instr.block_type, pos) = parse_blocktype(pos, end);
            Terminator then_terminator{};
            std::tie(instr.body, pos) =
                parse_instructions(input_begin, pos, end, true, then_terminator);
            if (then_terminator == Terminator::else_)
            {
                Terminator else_terminator{};
                std::tie(instr.else_body, pos) =
                    parse_instructions(input_begin, pos, end, false, else_terminator);
            }
            break;
        }

        case Opcode::br:
        case Opcode::br_if:
        case Opcode::call:
        case Opcode::local_get:
        case Opcode::local_set:
        case Opcode::local_tee:
        case Opcode::global_get:
        case Opcode::global_set:
        case Opcode::table_get:
        case Opcode::table_set:
        case Opcode::ref_func:
        case Opcode::data_drop:
        case Opcode::elem_drop:
        case Opcode::table_grow:
        case Opcode::table_size:
        case Opcode::table_fill:
            std::tie(instr.index, pos) = leb128u_decode<uint32_t>(pos, end);
            break;

        case Opcode::br_table:
            std::tie(instr.targets, pos) = parse_vec_i32(pos, end);
            std::tie(instr.index, pos) = leb128u_decode<uint32_t>(pos, end);
            break;

        case Opcode::call_indirect:
        case Opcode::table_init:
        case Opcode::table_copy:
            std::tie(instr.index, pos) = leb128u_decode<uint32_t>(pos, end);
            std::tie(instr.index2, pos) = leb128u_decode<uint32_t>(pos, end);
            break;

        case Opcode::select_t:
        {
            uint32_t count;
            std::tie(count, pos) = leb128u_decode<uint32_t>(pos, end);
            instr.index = count;
            for (uint32_t i = 0; i < count; ++i)
            {
                uint8_t byte;
                std::tie(byte, pos) = parse_byte(pos, end);
                const auto type = validate_valtype(pos - 1, byte);
                if (i == 0)
                    instr.type = type;
            }
            break;
        }

        case Opcode::ref_null:
        {
            uint8_t byte;
            std::tie(byte, pos) = parse_byte(pos, end);
            instr.type = validate_reftype(pos - 1, byte);
            break;
        }

        case Opcode::i32_load:
        case Opcode::i64_load:
        case Opcode::f32_load:
        case Opcode::f64_load:
        case Opcode::i32_load8_s:
        case Opcode::i32_load8_u:
        case Opcode::i32_load16_s:
        case Opcode::i32_load16_u:
        case Opcode::i64_load8_s:
        case Opcode::i64_load8_u:
        case Opcode::i64_load16_s:
        case Opcode::i64_load16_u:
        case Opcode::i64_load32_s:
        case Opcode::i64_load32_u:
        case Opcode::i32_store:
        case Opcode::i64_store:
        case Opcode::f32_store:
        case Opcode::f64_store:
        case Opcode::i32_store8:
        case Opcode::i32_store16:
        case Opcode::i64_store8:
        case Opcode::i64_store16:
        case Opcode::i64_store32:
            pos = parse_memarg(instr, pos, end);
            break;

        case Opcode::memory_size:
        case Opcode::memory_grow:
        case Opcode::memory_fill:
            pos = parse_zero_byte(pos, end);
            break;

        case Opcode::memory_copy:
            pos = parse_zero_byte(pos, end);
            pos = parse_zero_byte(pos, end);
            break;

        case Opcode::memory_init:
            std::tie(instr.index, pos) = leb128u_decode<uint32_t>(pos, end);
            pos = parse_zero_byte(pos, end);
            break;

        case Opcode::i32_const:
        {
            int32_t value;
            std::tie(value, pos) = leb128s_decode<int32_t>(pos, end);
            instr.value = Value{value};
            break;
        }

        case Opcode::i64_const:
        {
            int64_t value;
            std::tie(value, pos) = leb128s_decode<int64_t>(pos, end);
            instr.value = Value{value};
            break;
        }

        case Opcode::f32_const:
        {
            uint32_t bits;
            std::tie(bits, pos) = parse_value<uint32_t>(pos, end);
            instr.value = Value::from_bits(ValType::f32, bits);
            break;
        }

        case Opcode::f64_const:
        {
            uint64_t bits;
            std::tie(bits, pos) = parse_value<uint64_t>(pos, end);
            instr.value = Value::from_bits(ValType::f64, bits);
            break;
        }

        default:
            // No immediates.
            break;
        }

        instr.location = {static_cast<size_t>(instr_begin - input_begin),
            static_cast<size_t>(pos - instr_begin)};
        instructions.emplace_back(std::move(instr));
    }
}
}  // namespace

parser_result<std::vector<Instr>> parse_expr(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    Terminator terminator{};
    return parse_instructions(input_begin, pos, end, false, terminator);
}
}  // namespace stasis
