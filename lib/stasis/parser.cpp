// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "parser.hpp"
#include "asserts.hpp"
#include "limits.hpp"
#include "utf8.hpp"
#include <cassert>
#include <type_traits>

namespace stasis
{
namespace
{
/// Detects module nodes keeping their source location.
template <typename T, typename = void>
struct has_location : std::false_type
{};

template <typename T>
struct has_location<T, std::void_t<decltype(std::declval<T&>().location)>> : std::true_type
{};

/// The position of the section in the order required by the binary format.
/// The data count section goes between the element and the code sections.
/// Returns 0 for the custom section and unknown ids.
constexpr int get_section_order(SectionId id) noexcept
{
    switch (id)
    {
    case SectionId::type:
        return 1;
    case SectionId::import:
        return 2;
    case SectionId::function:
        return 3;
    case SectionId::table:
        return 4;
    case SectionId::memory:
        return 5;
    case SectionId::global:
        return 6;
    case SectionId::export_:
        return 7;
    case SectionId::start:
        return 8;
    case SectionId::element:
        return 9;
    case SectionId::datacount:
        return 10;
    case SectionId::code:
        return 11;
    case SectionId::data:
        return 12;
    default:
        return 0;
    }
}

inline SourceLocation make_location(
    const uint8_t* input_begin, const uint8_t* node_begin, const uint8_t* node_end) noexcept
{
    return {static_cast<size_t>(node_begin - input_begin),
        static_cast<size_t>(node_end - node_begin)};
}

template <typename T>
parser_result<T> parse(const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end);

template <typename T>
inline parser_result<std::vector<T>> parse_vec(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    uint32_t size;
    std::tie(size, pos) = leb128u_decode<uint32_t>(pos, end);

    std::vector<T> result;

    // Reserve memory for vec elements if `size` value is reasonable.
    if (size < 128)
        result.reserve(size);

    for (uint32_t i = 0; i < size; ++i)
    {
        const auto item_begin = pos;
        T item;
        std::tie(item, pos) = parse<T>(input_begin, pos, end);
        if constexpr (has_location<T>::value)
            item.location = make_location(input_begin, item_begin, pos);
        result.emplace_back(std::move(item));
    }
    return {std::move(result), pos};
}

template <>
inline parser_result<uint32_t> parse(const uint8_t*, const uint8_t* pos, const uint8_t* end)
{
    return leb128u_decode<uint32_t>(pos, end);
}

template <>
parser_result<ValType> parse(const uint8_t*, const uint8_t* pos, const uint8_t* end)
{
    uint8_t byte;
    std::tie(byte, pos) = parse_byte(pos, end);
    return {validate_valtype(pos - 1, byte), pos};
}

template <>
inline parser_result<FuncType> parse(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    uint8_t kind;
    std::tie(kind, pos) = parse_byte(pos, end);
    if (kind != 0x60)
    {
        throw parser_error{pos - 1,
            "unexpected byte value " + std::to_string(kind) + ", expected 0x60 for functype"};
    }

    FuncType result;
    std::tie(result.inputs, pos) = parse_vec<ValType>(input_begin, pos, end);
    std::tie(result.outputs, pos) = parse_vec<ValType>(input_begin, pos, end);
    return {std::move(result), pos};
}

inline parser_result<GlobalType> parse_global_type(const uint8_t* pos, const uint8_t* end)
{
    GlobalType type;
    uint8_t byte;
    std::tie(byte, pos) = parse_byte(pos, end);
    type.value_type = validate_valtype(pos - 1, byte);

    uint8_t mutability;
    std::tie(mutability, pos) = parse_byte(pos, end);
    if (mutability != 0x00 && mutability != 0x01)
    {
        throw parser_error{pos - 1, "unexpected byte value " + std::to_string(mutability) +
                                        ", expected 0x00 or 0x01 for global mutability"};
    }

    type.is_mutable = (mutability == 0x01);
    return {type, pos};
}

inline parser_result<ConstantExpression> parse_constant_expression(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    const auto expr_begin = pos;
    ConstantExpression result;
    std::tie(result.instructions, pos) = parse_expr(input_begin, pos, end);
    result.location = make_location(input_begin, expr_begin, pos);
    return {std::move(result), pos};
}

template <>
inline parser_result<Global> parse(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    Global result;
    std::tie(result.type, pos) = parse_global_type(pos, end);
    std::tie(result.expression, pos) = parse_constant_expression(input_begin, pos, end);
    return {std::move(result), pos};
}

inline parser_result<Limits> parse_limits(const uint8_t* pos, const uint8_t* end)
{
    Limits result;

    uint8_t kind;
    std::tie(kind, pos) = parse_byte(pos, end);
    switch (kind)
    {
    case 0x00:
        std::tie(result.min, pos) = leb128u_decode<uint32_t>(pos, end);
        return {result, pos};
    case 0x01:
        std::tie(result.min, pos) = leb128u_decode<uint32_t>(pos, end);
        std::tie(result.max, pos) = leb128u_decode<uint32_t>(pos, end);
        return {result, pos};
    default:
        throw parser_error{pos - 1, "invalid limits " + std::to_string(kind)};
    }
}

template <>
inline parser_result<Table> parse(const uint8_t*, const uint8_t* pos, const uint8_t* end)
{
    Table result;
    uint8_t elemtype;
    std::tie(elemtype, pos) = parse_byte(pos, end);
    result.elem_type = validate_reftype(pos - 1, elemtype);
    std::tie(result.limits, pos) = parse_limits(pos, end);
    return {result, pos};
}

template <>
inline parser_result<Memory> parse(const uint8_t*, const uint8_t* pos, const uint8_t* end)
{
    Limits limits;
    std::tie(limits, pos) = parse_limits(pos, end);
    return {{limits}, pos};
}

template <>
inline parser_result<Import> parse(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    Import result{};
    std::tie(result.module, pos) = parse_string(pos, end);
    std::tie(result.name, pos) = parse_string(pos, end);

    uint8_t kind;
    std::tie(kind, pos) = parse_byte(pos, end);
    switch (kind)
    {
    case 0x00:
        result.kind = ExternalKind::Function;
        std::tie(result.function_type_index, pos) = leb128u_decode<uint32_t>(pos, end);
        break;
    case 0x01:
        result.kind = ExternalKind::Table;
        std::tie(result.table, pos) = parse<Table>(input_begin, pos, end);
        break;
    case 0x02:
        result.kind = ExternalKind::Memory;
        std::tie(result.memory, pos) = parse<Memory>(input_begin, pos, end);
        break;
    case 0x03:
        result.kind = ExternalKind::Global;
        std::tie(result.global, pos) = parse_global_type(pos, end);
        break;
    default:
        throw parser_error{pos - 1, "unexpected import kind value " + std::to_string(kind)};
    }

    return {std::move(result), pos};
}

template <>
inline parser_result<Export> parse(const uint8_t*, const uint8_t* pos, const uint8_t* end)
{
    Export result;
    std::tie(result.name, pos) = parse_string(pos, end);

    uint8_t kind;
    std::tie(kind, pos) = parse_byte(pos, end);
    if (kind > static_cast<uint8_t>(ExternalKind::Global))
        throw parser_error{pos - 1, "unexpected export kind value " + std::to_string(kind)};
    result.kind = static_cast<ExternalKind>(kind);

    std::tie(result.index, pos) = leb128u_decode<uint32_t>(pos, end);
    return {std::move(result), pos};
}

template <>
inline parser_result<ConstantExpression> parse(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    return parse_constant_expression(input_begin, pos, end);
}

/// Converts a function index of an element segment into the equivalent ref.func expression.
inline ConstantExpression make_ref_func_expression(FuncIdx func_idx, SourceLocation location)
{
    Instr instr;
    instr.opcode = Opcode::ref_func;
    instr.index = func_idx;
    instr.location = location;

    ConstantExpression result;
    result.instructions.emplace_back(std::move(instr));
    result.location = location;
    return result;
}

// https://webassembly.github.io/spec/core/binary/modules.html#element-section
template <>
inline parser_result<Element> parse(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    const auto flags_pos = pos;
    uint32_t flags;
    std::tie(flags, pos) = leb128u_decode<uint32_t>(pos, end);
    if (flags > 7)
        throw parser_error{flags_pos, "invalid element segment kind " + std::to_string(flags)};

    // Bit 0: passive or declarative, bit 1: explicit table index or declarative,
    // bit 2: initializers are expressions.
    const bool uses_expressions = (flags & 0x04) != 0;

    Element result;
    if ((flags & 0x01) != 0)
        result.mode = (flags & 0x02) != 0 ? SegmentMode::declarative : SegmentMode::passive;
    else
    {
        result.mode = SegmentMode::active;
        if ((flags & 0x02) != 0)
            std::tie(result.table, pos) = leb128u_decode<uint32_t>(pos, end);
        std::tie(result.offset, pos) = parse_constant_expression(input_begin, pos, end);
    }

    if ((flags & 0x03) != 0)
    {
        uint8_t kind;
        std::tie(kind, pos) = parse_byte(pos, end);
        if (uses_expressions)
            result.type = validate_reftype(pos - 1, kind);
        else if (kind != 0x00)
            throw parser_error{pos - 1, "invalid element kind " + std::to_string(kind)};
    }

    if (uses_expressions)
        std::tie(result.init, pos) = parse_vec<ConstantExpression>(input_begin, pos, end);
    else
    {
        uint32_t size;
        std::tie(size, pos) = leb128u_decode<uint32_t>(pos, end);
        for (uint32_t i = 0; i < size; ++i)
        {
            const auto index_begin = pos;
            FuncIdx func_idx;
            std::tie(func_idx, pos) = leb128u_decode<uint32_t>(pos, end);
            result.init.emplace_back(
                make_ref_func_expression(func_idx, make_location(input_begin, index_begin, pos)));
        }
    }

    return {std::move(result), pos};
}

// https://webassembly.github.io/spec/core/binary/modules.html#code-section
template <>
inline parser_result<Func> parse(const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    uint32_t code_size;
    std::tie(code_size, pos) = leb128u_decode<uint32_t>(pos, end);
    if (static_cast<size_t>(end - pos) < code_size)
        throw parser_error{end, "unexpected EOF"};
    const auto code_end = pos + code_size;

    Func result;

    uint32_t locals_vec_size;
    std::tie(locals_vec_size, pos) = leb128u_decode<uint32_t>(pos, code_end);
    uint64_t local_count = 0;
    for (uint32_t i = 0; i < locals_vec_size; ++i)
    {
        const auto locals_begin = pos;
        uint32_t count;
        std::tie(count, pos) = leb128u_decode<uint32_t>(pos, code_end);
        uint8_t type_byte;
        std::tie(type_byte, pos) = parse_byte(pos, code_end);
        const auto type = validate_valtype(pos - 1, type_byte);

        local_count += count;
        if (local_count > MaxLocalsPerFunction)
            throw parser_error{locals_begin, "too many locals"};
        result.locals.insert(result.locals.end(), count, type);
    }

    std::tie(result.body, pos) = parse_expr(input_begin, pos, code_end);

    // Size is the total bytes of locals and expressions.
    if (pos != code_end)
        throw parser_error{pos, "malformed size field for function"};

    return {std::move(result), pos};
}

// https://webassembly.github.io/spec/core/binary/modules.html#data-section
template <>
inline parser_result<Data> parse(const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    const auto flags_pos = pos;
    uint32_t flags;
    std::tie(flags, pos) = leb128u_decode<uint32_t>(pos, end);

    Data result;
    switch (flags)
    {
    case 0:
        result.mode = SegmentMode::active;
        std::tie(result.offset, pos) = parse_constant_expression(input_begin, pos, end);
        break;
    case 1:
        result.mode = SegmentMode::passive;
        break;
    case 2:
        result.mode = SegmentMode::active;
        std::tie(result.memory, pos) = leb128u_decode<uint32_t>(pos, end);
        std::tie(result.offset, pos) = parse_constant_expression(input_begin, pos, end);
        break;
    default:
        throw parser_error{flags_pos, "invalid data segment kind " + std::to_string(flags)};
    }

    // NOTE: this is an optimised version of parse_vec<uint8_t>
    uint32_t size;
    std::tie(size, pos) = leb128u_decode<uint32_t>(pos, end);
    if (static_cast<size_t>(end - pos) < size)
        throw parser_error{end, "unexpected EOF"};

    result.init = bytes(pos, pos + size);
    pos += size;

    return {std::move(result), pos};
}

inline CustomSection parse_custom_section(
    const uint8_t* input_begin, const uint8_t* pos, const uint8_t* end)
{
    const auto section_begin = pos;
    CustomSection result;
    std::tie(result.name, pos) = parse_string(pos, end);
    // The payload of other custom sections is not interpreted.
    if (result.name == "name")
        result.payload = bytes(pos, end);
    result.location = make_location(input_begin, section_begin, end);
    return result;
}

std::unique_ptr<const Module> parse_module(bytes_view input)
{
    const auto input_begin = input.data();
    const auto input_end = input_begin + input.size();

    for (size_t i = 0; i < wasm_prefix.size(); ++i)
    {
        if (i == input.size())
            throw parser_error{input_end, "unexpected EOF"};
        if (input[i] != wasm_prefix[i])
            throw parser_error{input_begin + i, "invalid wasm module prefix"};
    }

    auto module{std::make_unique<Module>()};
    module->fingerprint = fingerprint(input);

    std::vector<TypeIdx> function_types;
    std::vector<Func> code;
    const uint8_t* code_section_pos = input_end;
    const uint8_t* data_section_pos = input_end;
    int last_order = 0;
    for (auto it = input_begin + wasm_prefix.size(); it != input_end;)
    {
        const auto section_pos = it;
        const auto id = static_cast<SectionId>(*it++);
        if (id != SectionId::custom)
        {
            const auto order = get_section_order(id);
            if (order == 0)
            {
                throw parser_error{section_pos,
                    "unknown section encountered " + std::to_string(static_cast<int>(id))};
            }
            if (order <= last_order)
                throw parser_error{section_pos, "unexpected out-of-order section type"};
            last_order = order;
        }

        uint32_t size;
        std::tie(size, it) = leb128u_decode<uint32_t>(it, input_end);

        assert(it <= input_end);
        if (static_cast<size_t>(input_end - it) < size)
            throw parser_error{input_end, "unexpected EOF"};

        const auto section_end = it + size;
        switch (id)
        {
        case SectionId::type:
            std::tie(module->typesec, it) = parse_vec<FuncType>(input_begin, it, section_end);
            break;
        case SectionId::import:
            std::tie(module->importsec, it) = parse_vec<Import>(input_begin, it, section_end);
            break;
        case SectionId::function:
            std::tie(function_types, it) = parse_vec<TypeIdx>(input_begin, it, section_end);
            break;
        case SectionId::table:
            std::tie(module->tablesec, it) = parse_vec<Table>(input_begin, it, section_end);
            break;
        case SectionId::memory:
            std::tie(module->memorysec, it) = parse_vec<Memory>(input_begin, it, section_end);
            break;
        case SectionId::global:
            std::tie(module->globalsec, it) = parse_vec<Global>(input_begin, it, section_end);
            break;
        case SectionId::export_:
            std::tie(module->exportsec, it) = parse_vec<Export>(input_begin, it, section_end);
            break;
        case SectionId::start:
            std::tie(module->startfunc, it) = leb128u_decode<uint32_t>(it, section_end);
            break;
        case SectionId::element:
            std::tie(module->elementsec, it) = parse_vec<Element>(input_begin, it, section_end);
            break;
        case SectionId::datacount:
            std::tie(module->datacount, it) = leb128u_decode<uint32_t>(it, section_end);
            break;
        case SectionId::code:
            code_section_pos = section_pos;
            std::tie(code, it) = parse_vec<Func>(input_begin, it, section_end);
            break;
        case SectionId::data:
            data_section_pos = section_pos;
            std::tie(module->datasec, it) = parse_vec<Data>(input_begin, it, section_end);
            break;
        case SectionId::custom:
            module->customsec.emplace_back(parse_custom_section(input_begin, it, section_end));
            it = section_end;
            break;
        default:                   // LCOV_EXCL_LINE
            STASIS_UNREACHABLE();  // LCOV_EXCL_LINE
        }

        if (it != section_end)
        {
            throw parser_error{it, "incorrect section " + std::to_string(static_cast<int>(id)) +
                                       " size, difference: " + std::to_string(it - section_end)};
        }
    }

    if (function_types.size() != code.size())
    {
        throw parser_error{
            code_section_pos, "malformed binary: number of function and code entries must match"};
    }

    if (module->datacount.has_value() && *module->datacount != module->datasec.size())
    {
        throw parser_error{data_section_pos,
            "malformed binary: data count and data section have inconsistent lengths"};
    }

    for (size_t i = 0; i < code.size(); ++i)
        code[i].type = function_types[i];
    module->funcsec = std::move(code);

    // Split imports by kind
    for (const auto& import : module->importsec)
    {
        switch (import.kind)
        {
        case ExternalKind::Function:
            module->imported_function_types.emplace_back(import.function_type_index);
            break;
        case ExternalKind::Table:
            module->imported_table_types.emplace_back(import.table);
            break;
        case ExternalKind::Memory:
            module->imported_memory_types.emplace_back(import.memory);
            break;
        case ExternalKind::Global:
            module->imported_global_types.emplace_back(import.global);
            break;
        }
    }

    return module;
}
}  // namespace

ValType validate_valtype(const uint8_t* pos, uint8_t byte)
{
    switch (byte)
    {
    case 0x7F:
        return ValType::i32;
    case 0x7E:
        return ValType::i64;
    case 0x7D:
        return ValType::f32;
    case 0x7C:
        return ValType::f64;
    case 0x70:
        return ValType::funcref;
    case 0x6F:
        return ValType::externref;
    default:
        throw parser_error{pos, "invalid valtype " + std::to_string(byte)};
    }
}

ValType validate_reftype(const uint8_t* pos, uint8_t byte)
{
    switch (byte)
    {
    case 0x70:
        return ValType::funcref;
    case 0x6F:
        return ValType::externref;
    default:
        throw parser_error{pos, "invalid reftype " + std::to_string(byte)};
    }
}

parser_result<std::string> parse_string(const uint8_t* pos, const uint8_t* end)
{
    // NOTE: this is an optimised version of parse_vec<uint8_t>
    uint32_t size;
    std::tie(size, pos) = leb128u_decode<uint32_t>(pos, end);

    assert(pos <= end);
    if (static_cast<size_t>(end - pos) < size)
        throw parser_error{end, "unexpected EOF"};

    if (!utf8_validate(pos, pos + size))
        throw parser_error{pos, "invalid UTF-8"};

    const auto str_end = pos + size;
    return {std::string{pos, str_end}, str_end};
}

parser_result<std::vector<uint32_t>> parse_vec_i32(const uint8_t* pos, const uint8_t* end)
{
    return parse_vec<uint32_t>(nullptr, pos, end);
}

uint64_t fingerprint(bytes_view input) noexcept
{
    constexpr uint64_t FnvOffsetBasis = 0xcbf29ce484222325;
    constexpr uint64_t FnvPrime = 0x100000001b3;

    auto hash = FnvOffsetBasis;
    for (const auto byte : input)
    {
        hash ^= byte;
        hash *= FnvPrime;
    }
    return hash;
}

std::unique_ptr<const Module> decode(bytes_view input)
{
    try
    {
        return parse_module(input);
    }
    catch (parser_error& error)
    {
        error.resolve_offset(input.data());
        throw;
    }
}
}  // namespace stasis
