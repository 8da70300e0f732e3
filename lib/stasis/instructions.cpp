// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"
#include <array>
#include <initializer_list>

namespace stasis
{
namespace
{
/// Single byte opcodes occupy indices [0, 256), 0xFC-prefixed ones follow.
constexpr size_t PrefixFCBase = 256;
constexpr size_t TableSize = PrefixFCBase + 0x12;

constexpr size_t get_table_index(Opcode opcode) noexcept
{
    const auto value = static_cast<uint16_t>(opcode);
    return value < PrefixFCBase ? value : PrefixFCBase + (value & 0xff);
}

struct TableEntry
{
    bool defined = false;
    InstructionType type;
};

using InstructionTypeTable = std::array<TableEntry, TableSize>;

InstructionTypeTable build_instruction_type_table()
{
    constexpr auto i32 = ValType::i32;
    constexpr auto i64 = ValType::i64;
    constexpr auto f32 = ValType::f32;
    constexpr auto f64 = ValType::f64;

    InstructionTypeTable table{};

    const auto set = [&table](std::initializer_list<Opcode> opcodes,
                         std::initializer_list<ValType> inputs,
                         std::initializer_list<ValType> outputs) {
        for (const auto opcode : opcodes)
            table[get_table_index(opcode)] = {true, {inputs, outputs}};
    };

    set({Opcode::nop, Opcode::data_drop, Opcode::elem_drop}, {}, {});

    set({Opcode::i32_const, Opcode::memory_size}, {}, {i32});
    set({Opcode::i64_const}, {}, {i64});
    set({Opcode::f32_const}, {}, {f32});
    set({Opcode::f64_const}, {}, {f64});

    set({Opcode::i32_eqz, Opcode::i32_clz, Opcode::i32_ctz, Opcode::i32_popcnt,
            Opcode::i32_extend8_s, Opcode::i32_extend16_s, Opcode::memory_grow},
        {i32}, {i32});
    set({Opcode::i32_eq, Opcode::i32_ne, Opcode::i32_lt_s, Opcode::i32_lt_u, Opcode::i32_gt_s,
            Opcode::i32_gt_u, Opcode::i32_le_s, Opcode::i32_le_u, Opcode::i32_ge_s,
            Opcode::i32_ge_u, Opcode::i32_add, Opcode::i32_sub, Opcode::i32_mul,
            Opcode::i32_div_s, Opcode::i32_div_u, Opcode::i32_rem_s, Opcode::i32_rem_u,
            Opcode::i32_and, Opcode::i32_or, Opcode::i32_xor, Opcode::i32_shl, Opcode::i32_shr_s,
            Opcode::i32_shr_u, Opcode::i32_rotl, Opcode::i32_rotr},
        {i32, i32}, {i32});

    set({Opcode::i64_eqz}, {i64}, {i32});
    set({Opcode::i64_clz, Opcode::i64_ctz, Opcode::i64_popcnt, Opcode::i64_extend8_s,
            Opcode::i64_extend16_s, Opcode::i64_extend32_s},
        {i64}, {i64});
    set({Opcode::i64_eq, Opcode::i64_ne, Opcode::i64_lt_s, Opcode::i64_lt_u, Opcode::i64_gt_s,
            Opcode::i64_gt_u, Opcode::i64_le_s, Opcode::i64_le_u, Opcode::i64_ge_s,
            Opcode::i64_ge_u},
        {i64, i64}, {i32});
    set({Opcode::i64_add, Opcode::i64_sub, Opcode::i64_mul, Opcode::i64_div_s,
            Opcode::i64_div_u, Opcode::i64_rem_s, Opcode::i64_rem_u, Opcode::i64_and,
            Opcode::i64_or, Opcode::i64_xor, Opcode::i64_shl, Opcode::i64_shr_s,
            Opcode::i64_shr_u, Opcode::i64_rotl, Opcode::i64_rotr},
        {i64, i64}, {i64});

    set({Opcode::f32_eq, Opcode::f32_ne, Opcode::f32_lt, Opcode::f32_gt, Opcode::f32_le,
            Opcode::f32_ge},
        {f32, f32}, {i32});
    set({Opcode::f64_eq, Opcode::f64_ne, Opcode::f64_lt, Opcode::f64_gt, Opcode::f64_le,
            Opcode::f64_ge},
        {f64, f64}, {i32});

    set({Opcode::f32_abs, Opcode::f32_neg, Opcode::f32_ceil, Opcode::f32_floor,
            Opcode::f32_trunc, Opcode::f32_nearest, Opcode::f32_sqrt},
        {f32}, {f32});
    set({Opcode::f32_add, Opcode::f32_sub, Opcode::f32_mul, Opcode::f32_div, Opcode::f32_min,
            Opcode::f32_max, Opcode::f32_copysign},
        {f32, f32}, {f32});
    set({Opcode::f64_abs, Opcode::f64_neg, Opcode::f64_ceil, Opcode::f64_floor,
            Opcode::f64_trunc, Opcode::f64_nearest, Opcode::f64_sqrt},
        {f64}, {f64});
    set({Opcode::f64_add, Opcode::f64_sub, Opcode::f64_mul, Opcode::f64_div, Opcode::f64_min,
            Opcode::f64_max, Opcode::f64_copysign},
        {f64, f64}, {f64});

    set({Opcode::i32_wrap_i64}, {i64}, {i32});
    set({Opcode::i32_trunc_f32_s, Opcode::i32_trunc_f32_u, Opcode::i32_reinterpret_f32,
            Opcode::i32_trunc_sat_f32_s, Opcode::i32_trunc_sat_f32_u},
        {f32}, {i32});
    set({Opcode::i32_trunc_f64_s, Opcode::i32_trunc_f64_u, Opcode::i32_trunc_sat_f64_s,
            Opcode::i32_trunc_sat_f64_u},
        {f64}, {i32});
    set({Opcode::i64_extend_i32_s, Opcode::i64_extend_i32_u}, {i32}, {i64});
    set({Opcode::i64_trunc_f32_s, Opcode::i64_trunc_f32_u, Opcode::i64_trunc_sat_f32_s,
            Opcode::i64_trunc_sat_f32_u},
        {f32}, {i64});
    set({Opcode::i64_trunc_f64_s, Opcode::i64_trunc_f64_u, Opcode::i64_reinterpret_f64,
            Opcode::i64_trunc_sat_f64_s, Opcode::i64_trunc_sat_f64_u},
        {f64}, {i64});
    set({Opcode::f32_convert_i32_s, Opcode::f32_convert_i32_u, Opcode::f32_reinterpret_i32},
        {i32}, {f32});
    set({Opcode::f32_convert_i64_s, Opcode::f32_convert_i64_u}, {i64}, {f32});
    set({Opcode::f32_demote_f64}, {f64}, {f32});
    set({Opcode::f64_convert_i32_s, Opcode::f64_convert_i32_u}, {i32}, {f64});
    set({Opcode::f64_convert_i64_s, Opcode::f64_convert_i64_u, Opcode::f64_reinterpret_i64},
        {i64}, {f64});
    set({Opcode::f64_promote_f32}, {f32}, {f64});

    set({Opcode::i32_load, Opcode::i32_load8_s, Opcode::i32_load8_u, Opcode::i32_load16_s,
            Opcode::i32_load16_u},
        {i32}, {i32});
    set({Opcode::i64_load, Opcode::i64_load8_s, Opcode::i64_load8_u, Opcode::i64_load16_s,
            Opcode::i64_load16_u, Opcode::i64_load32_s, Opcode::i64_load32_u},
        {i32}, {i64});
    set({Opcode::f32_load}, {i32}, {f32});
    set({Opcode::f64_load}, {i32}, {f64});
    set({Opcode::i32_store, Opcode::i32_store8, Opcode::i32_store16}, {i32, i32}, {});
    set({Opcode::i64_store, Opcode::i64_store8, Opcode::i64_store16, Opcode::i64_store32},
        {i32, i64}, {});
    set({Opcode::f32_store}, {i32, f32}, {});
    set({Opcode::f64_store}, {i32, f64}, {});

    set({Opcode::memory_init, Opcode::memory_copy, Opcode::memory_fill, Opcode::table_init,
            Opcode::table_copy},
        {i32, i32, i32}, {});

    return table;
}
}  // namespace

const InstructionType* get_instruction_type(Opcode opcode) noexcept
{
    static const auto table = build_instruction_type_table();

    const auto index = get_table_index(opcode);
    if (index >= table.size() || !table[index].defined)
        return nullptr;
    return &table[index].type;
}

std::optional<uint8_t> get_instruction_max_align(Opcode opcode) noexcept
{
    switch (opcode)
    {
    case Opcode::i32_load8_s:
    case Opcode::i32_load8_u:
    case Opcode::i64_load8_s:
    case Opcode::i64_load8_u:
    case Opcode::i32_store8:
    case Opcode::i64_store8:
        return 0;

    case Opcode::i32_load16_s:
    case Opcode::i32_load16_u:
    case Opcode::i64_load16_s:
    case Opcode::i64_load16_u:
    case Opcode::i32_store16:
    case Opcode::i64_store16:
        return 1;

    case Opcode::i32_load:
    case Opcode::f32_load:
    case Opcode::i64_load32_s:
    case Opcode::i64_load32_u:
    case Opcode::i32_store:
    case Opcode::f32_store:
    case Opcode::i64_store32:
        return 2;

    case Opcode::i64_load:
    case Opcode::f64_load:
    case Opcode::i64_store:
    case Opcode::f64_store:
        return 3;

    default:
        return std::nullopt;
    }
}
}  // namespace stasis
