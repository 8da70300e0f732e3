// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "parser.hpp"
#include "validate.hpp"
#include <gtest/gtest.h>
#include <test/utils/asserts.hpp>
#include <test/utils/hex.hpp>
#include <test/utils/module_builder.hpp>

using namespace stasis;
using namespace stasis::test;

namespace
{
auto validate(Module module)
{
    return stasis::validate(std::make_unique<const Module>(std::move(module)));
}

/// Validates the module expecting validation_error and returns it.
validation_error validation_failure(Module module)
{
    try
    {
        validate(std::move(module));
    }
    catch (const validation_error& error)
    {
        return error;
    }
    ADD_FAILURE() << "validation_error expected";
    return validation_error{STASIS_ERROR_OTHER, "none"};
}

ConstantExpression const_expr(std::vector<Instr> instructions)
{
    ConstantExpression expr;
    expr.instructions = std::move(instructions);
    return expr;
}

Global make_global(ValType type, bool is_mutable, std::vector<Instr> init)
{
    Global global;
    global.type = {type, is_mutable};
    global.expression = const_expr(std::move(init));
    return global;
}

void add_imported_global(Module& module, GlobalType type)
{
    Import import;
    import.module = "env";
    import.name = "g" + std::to_string(module.importsec.size());
    import.kind = ExternalKind::Global;
    import.global = type;
    module.importsec.push_back(import);
    module.imported_global_types.push_back(type);
}

Module module_with_memory(std::vector<Instr> body, FuncType type = {})
{
    auto module = make_function_module(std::move(type), std::move(body));
    module.memorysec.push_back({{1, std::nullopt}});
    return module;
}

const FuncType void_to_i32{{}, {ValType::i32}};
}  // namespace

TEST(validation, null_module)
{
    EXPECT_THROW_MESSAGE(
        stasis::validate(std::unique_ptr<const Module>{}), std::invalid_argument,
        "module must not be null");
}

TEST(validation, empty_module)
{
    EXPECT_NE(validate(Module{}), nullptr);
}

TEST(validation, simple_function)
{
    const auto validated = validate(make_function_module({{ValType::i32, ValType::i32}, {ValType::i32}},
        {make_instr(Opcode::local_get, 0), make_instr(Opcode::local_get, 1),
            make_instr(Opcode::i32_add)}));
    ASSERT_NE(validated, nullptr);
    EXPECT_EQ(validated->module().funcsec.size(), 1);
    EXPECT_EQ(validated->module().funcsec[0].body.size(), 3);
}

TEST(validation, operand_type_mismatch)
{
    const auto error = validation_failure(make_function_module(void_to_i32,
        {make_const(Value{int64_t{1}}), make_const(Value{2}), make_instr(Opcode::i32_add)}));
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: expected i32, got i64");
    EXPECT_EQ(error.func_idx, 0);
}

TEST(validation, stack_underflow)
{
    const auto error = validation_failure(
        make_function_module(void_to_i32, {make_const(Value{1}), make_instr(Opcode::i32_add)}));
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: stack underflow");

    EXPECT_STREQ(validation_failure(make_function_module(void_to_i32, {})).what(),
        "type mismatch: stack underflow");
}

TEST(validation, too_many_values_at_end)
{
    const auto error = validation_failure(make_function_module({}, {make_const(Value{1})}));
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: too many values at the end of block");

    const auto block_error = validation_failure(make_function_module(
        {}, {make_block(Opcode::block, {}, {make_const(Value{1})})}));
    EXPECT_STREQ(block_error.what(), "type mismatch: too many values at the end of block");
}

TEST(validation, unreachable_makes_stack_polymorphic)
{
    EXPECT_NO_THROW(validate(make_function_module(
        void_to_i32, {make_instr(Opcode::unreachable), make_instr(Opcode::i32_add)})));
    EXPECT_NO_THROW(validate(make_function_module(void_to_i32,
        {make_instr(Opcode::unreachable), make_instr(Opcode::select)})));

    // The polymorphic stack still checks the values which are there.
    const auto error = validation_failure(make_function_module(void_to_i32,
        {make_instr(Opcode::unreachable), make_const(Value{int64_t{0}}),
            make_instr(Opcode::i32_eqz)}));
    EXPECT_STREQ(error.what(), "type mismatch: expected i32, got i64");
}

TEST(validation, unknown_indices)
{
    const auto expect_unknown = [](Module module, const char* message) {
        const auto error = validation_failure(std::move(module));
        EXPECT_EQ(error.code, STASIS_ERROR_UNKNOWN_INDEX) << message;
        EXPECT_STREQ(error.what(), message);
    };

    expect_unknown(make_function_module(void_to_i32, {make_instr(Opcode::local_get, 0)}),
        "unknown local 0");
    expect_unknown(make_function_module(void_to_i32, {make_instr(Opcode::global_get, 0)}),
        "unknown global 0");
    expect_unknown(make_function_module({}, {make_instr(Opcode::call, 1)}), "unknown function 1");
    expect_unknown(make_function_module({}, {make_instr(Opcode::br, 1)}), "unknown label 1");
    expect_unknown(
        make_function_module({}, {make_block(Opcode::block, block_type_index(5), {})}),
        "unknown type 5");
    expect_unknown(make_function_module({}, {make_instr(Opcode::table_size, 0),
                                                make_instr(Opcode::drop)}),
        "unknown table 0");
    expect_unknown(make_function_module(void_to_i32, {make_instr(Opcode::memory_size)}),
        "unknown memory 0");
    expect_unknown(make_function_module(void_to_i32,
                       {make_const(Value{0}), make_memory_instr(Opcode::i32_load)}),
        "unknown memory 0");
    expect_unknown(make_function_module({}, {make_instr(Opcode::elem_drop, 0)}),
        "unknown elem segment 0");
}

TEST(validation, unknown_function_type)
{
    auto module = make_function_module({}, {});
    module.funcsec[0].type = 3;
    const auto error = validation_failure(std::move(module));
    EXPECT_EQ(error.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(error.what(), "unknown type 3");
}

TEST(validation, block_results)
{
    EXPECT_NO_THROW(validate(make_function_module(void_to_i32,
        {make_block(Opcode::block, block_result(ValType::i32), {make_const(Value{1})})})));

    const auto error = validation_failure(make_function_module(void_to_i32,
        {make_block(
            Opcode::block, block_result(ValType::i32), {make_const(Value{int64_t{1}})})}));
    EXPECT_STREQ(error.what(), "type mismatch: expected i32, got i64");
}

TEST(validation, block_params)
{
    // (type 1) is [i32] -> [i32].
    auto module = make_function_module(void_to_i32,
        {make_const(Value{1}),
            make_block(Opcode::block, block_type_index(1),
                {make_const(Value{2}), make_instr(Opcode::i32_add)})});
    module.typesec.push_back({{ValType::i32}, {ValType::i32}});
    EXPECT_NO_THROW(validate(std::move(module)));

    // The block cannot see the values below its params.
    auto module2 = make_function_module(void_to_i32,
        {make_const(Value{1}), make_const(Value{1}),
            make_block(Opcode::block, block_type_index(1),
                {make_instr(Opcode::i32_add), make_const(Value{1})}),
            make_instr(Opcode::drop)});
    module2.typesec.push_back({{ValType::i32}, {ValType::i32}});
    EXPECT_STREQ(validation_failure(std::move(module2)).what(), "type mismatch: stack underflow");
}

TEST(validation, if_without_else)
{
    // A missing else must produce the results from the params.
    const auto error = validation_failure(make_function_module(void_to_i32,
        {make_const(Value{1}),
            make_block(Opcode::if_, block_result(ValType::i32), {make_const(Value{1})})}));
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: stack underflow");

    // (type 1) is [i32] -> [i32]: params pass through the missing else.
    auto module = make_function_module(void_to_i32,
        {make_const(Value{7}), make_const(Value{0}),
            make_block(Opcode::if_, block_type_index(1),
                {make_const(Value{1}), make_instr(Opcode::i32_add)})});
    module.typesec.push_back({{ValType::i32}, {ValType::i32}});
    EXPECT_NO_THROW(validate(std::move(module)));
}

TEST(validation, if_condition_type)
{
    const auto error = validation_failure(make_function_module(
        {}, {make_const(Value{int64_t{1}}), make_block(Opcode::if_, {}, {})}));
    EXPECT_STREQ(error.what(), "type mismatch: expected i32, got i64");
}

TEST(validation, loop_label_takes_params)
{
    // br 0 in a loop goes to the loop start, it carries no values even if the loop has a result.
    EXPECT_NO_THROW(validate(make_function_module(void_to_i32,
        {make_block(Opcode::loop, block_result(ValType::i32), {make_instr(Opcode::br, 0)})})));

    // The same branch in a block needs the block result.
    const auto error = validation_failure(make_function_module(void_to_i32,
        {make_block(Opcode::block, block_result(ValType::i32), {make_instr(Opcode::br, 0)})}));
    EXPECT_STREQ(error.what(), "type mismatch: stack underflow");
}

TEST(validation, br_if_keeps_values)
{
    EXPECT_NO_THROW(validate(make_function_module(void_to_i32,
        {make_block(Opcode::block, block_result(ValType::i32),
            {make_const(Value{1}), make_const(Value{0}), make_instr(Opcode::br_if, 0)})})));
}

TEST(validation, br_table_arity_mismatch)
{
    const auto error = validation_failure(make_function_module({},
        {make_block(Opcode::block, {},
            {make_block(Opcode::block, block_result(ValType::i32),
                 {make_const(Value{1}), make_const(Value{0}), make_br_table({1}, 0)}),
                make_instr(Opcode::drop)})}));
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: br_table arity mismatch");
}

TEST(validation, return_checks_function_results)
{
    EXPECT_NO_THROW(validate(make_function_module(void_to_i32,
        {make_block(Opcode::block, {}, {make_const(Value{1}), make_instr(Opcode::return_)})})));

    const auto error = validation_failure(
        make_function_module(void_to_i32, {make_const(Value{1.0f}), make_instr(Opcode::return_)}));
    EXPECT_STREQ(error.what(), "type mismatch: expected i32, got f32");
}

TEST(validation, select)
{
    Instr ref_null = make_instr(Opcode::ref_null);
    ref_null.type = ValType::funcref;

    const auto error = validation_failure(make_function_module({},
        {ref_null, ref_null, make_const(Value{0}),
            make_instr(Opcode::select), make_instr(Opcode::drop)}));
    EXPECT_STREQ(error.what(), "type mismatch: select requires numeric operands");

    const auto mixed = validation_failure(make_function_module({},
        {make_const(Value{1}), make_const(Value{int64_t{1}}), make_const(Value{0}),
            make_instr(Opcode::select), make_instr(Opcode::drop)}));
    EXPECT_STREQ(mixed.what(), "type mismatch: select operands differ");

    auto typed_select = make_instr(Opcode::select_t, 1);
    typed_select.type = ValType::funcref;
    EXPECT_NO_THROW(validate(make_function_module(
        {}, {ref_null, ref_null, make_const(Value{0}), typed_select, make_instr(Opcode::drop)})));

    typed_select.index = 2;
    const auto arity = validation_failure(make_function_module(
        {}, {ref_null, ref_null, make_const(Value{0}), typed_select, make_instr(Opcode::drop)}));
    EXPECT_EQ(arity.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(arity.what(), "invalid result arity of select");
}

TEST(validation, global_set_immutable)
{
    auto module =
        make_function_module({}, {make_const(Value{1}), make_instr(Opcode::global_set, 0)});
    module.globalsec.push_back(make_global(ValType::i32, false, {make_const(Value{0})}));
    const auto error = validation_failure(std::move(module));
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "global is immutable 0");
}

TEST(validation, data_count_required)
{
    auto module = module_with_memory({make_const(Value{0}), make_const(Value{0}),
        make_const(Value{0}), make_instr(Opcode::memory_init, 0)});
    Data data;
    data.mode = SegmentMode::passive;
    module.datasec.push_back(data);

    auto without_datacount = module;
    const auto error = validation_failure(std::move(without_datacount));
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "data count section required");

    module.datacount = 1;
    EXPECT_NO_THROW(validate(module));

    module.funcsec[0].body = {make_instr(Opcode::data_drop, 1)};
    EXPECT_STREQ(validation_failure(std::move(module)).what(), "unknown data segment 1");
}

TEST(validation, alignment)
{
    auto load = make_memory_instr(Opcode::i32_load);
    load.index = 2;
    EXPECT_NO_THROW(validate(module_with_memory({make_const(Value{0}), load}, void_to_i32)));

    load.index = 3;
    const auto error =
        validation_failure(module_with_memory({make_const(Value{0}), load}, void_to_i32));
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "alignment must not be larger than natural");
}

TEST(validation, ref_func_must_be_declared)
{
    const FuncType void_to_funcref{{}, {ValType::funcref}};
    auto module = make_function_module(void_to_funcref, {make_instr(Opcode::ref_func, 0)});
    const auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "undeclared function reference");

    auto exported = module;
    exported.exportsec.push_back({"f", ExternalKind::Function, 0, {}});
    EXPECT_NO_THROW(validate(std::move(exported)));

    auto declared = module;
    Element element;
    element.mode = SegmentMode::declarative;
    element.init.push_back(const_expr({make_instr(Opcode::ref_func, 0)}));
    declared.elementsec.push_back(element);
    EXPECT_NO_THROW(validate(std::move(declared)));
}

TEST(validation, call_indirect_requires_funcref_table)
{
    Instr call_indirect = make_instr(Opcode::call_indirect, 0);
    auto module = make_function_module({}, {make_const(Value{0}), call_indirect});
    module.tablesec.push_back({ValType::externref, {1, std::nullopt}});
    const auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: call_indirect requires funcref table");

    module.tablesec[0].elem_type = ValType::funcref;
    EXPECT_NO_THROW(validate(module));

    module.funcsec[0].body[1].index = 4;
    EXPECT_STREQ(validation_failure(std::move(module)).what(), "unknown type 4");
}

TEST(validation, table_instructions)
{
    auto module = make_function_module({},
        {make_const(Value{0}), make_instr(Opcode::table_get, 0), make_instr(Opcode::drop),
            make_const(Value{0}), make_const(Value{0}), make_const(Value{0}),
            [] {
                auto copy = make_instr(Opcode::table_copy, 0);
                copy.index2 = 1;
                return copy;
            }()});
    module.tablesec.push_back({ValType::funcref, {1, std::nullopt}});
    module.tablesec.push_back({ValType::externref, {1, std::nullopt}});
    const auto error = validation_failure(module);
    EXPECT_STREQ(error.what(), "type mismatch: table.copy element types differ");

    module.tablesec[1].elem_type = ValType::funcref;
    EXPECT_NO_THROW(validate(std::move(module)));
}

TEST(validation, constant_expressions)
{
    Module module;
    module.globalsec.push_back(make_global(ValType::i32, false,
        {make_const(Value{1}), make_const(Value{2}), make_instr(Opcode::i32_add)}));
    auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "constant expression required");

    module.globalsec[0] = make_global(ValType::i64, false, {make_const(Value{1})});
    error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: constant expression must produce i64");

    module.globalsec[0] = make_global(ValType::i32, false, {});
    EXPECT_STREQ(validation_failure(module).what(),
        "type mismatch: constant expression must produce i32");
}

TEST(validation, error_copy_assignment)
{
    const validation_error first{STASIS_ERROR_UNKNOWN_INDEX, "unknown function 3", 1, 20};
    validation_error second{STASIS_ERROR_INVALID, "other"};
    second = first;
    EXPECT_EQ(second.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(second.what(), "unknown function 3");
    ASSERT_TRUE(second.func_idx.has_value());
    EXPECT_EQ(*second.func_idx, 1);
    EXPECT_EQ(second.offset, 20);

    exception base{STASIS_ERROR_OTHER, "base"};
    base = first;
    EXPECT_EQ(base.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(base.what(), "unknown function 3");
}

TEST(validation, constant_expression_global_get)
{
    Module module;
    add_imported_global(module, {ValType::i32, false});
    add_imported_global(module, {ValType::i32, true});
    module.globalsec.push_back(
        make_global(ValType::i32, false, {make_instr(Opcode::global_get, 0)}));
    // An earlier defined immutable global is visible too.
    module.globalsec.push_back(
        make_global(ValType::i32, false, {make_instr(Opcode::global_get, 2)}));
    EXPECT_NO_THROW(validate(module));

    auto mutable_import = module;
    mutable_import.globalsec[0].expression = const_expr({make_instr(Opcode::global_get, 1)});
    const auto error = validation_failure(std::move(mutable_import));
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "constant expression required: global.get of a mutable global");

    auto later_global = module;
    later_global.globalsec[0].expression = const_expr({make_instr(Opcode::global_get, 3)});
    const auto later_error = validation_failure(std::move(later_global));
    EXPECT_EQ(later_error.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(later_error.what(), "unknown global 3");
}

TEST(validation, limits)
{
    Module module;
    module.memorysec.push_back({{65537, std::nullopt}});
    auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "memory size must be at most 65536");

    module.memorysec[0] = {{2, 1}};
    EXPECT_STREQ(
        validation_failure(module).what(), "size minimum must not be greater than maximum");

    module.memorysec[0] = {{1, 65536}};
    EXPECT_NO_THROW(validate(module));

    module.memorysec.push_back({{1, std::nullopt}});
    error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "multiple memories");
}

TEST(validation, start_function)
{
    auto module = make_function_module(void_to_i32, {make_const(Value{0})});
    module.startfunc = 0;
    auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "start function must have type [] -> []");

    module.startfunc = 1;
    error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(error.what(), "unknown function 1");
}

TEST(validation, exports)
{
    auto module = make_function_module({}, {});
    module.exportsec.push_back({"f", ExternalKind::Function, 0, {}});
    module.exportsec.push_back({"f", ExternalKind::Function, 0, {}});
    auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_INVALID);
    EXPECT_STREQ(error.what(), "duplicate export name f");

    module.exportsec[1] = {"m", ExternalKind::Memory, 0, {}};
    error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_UNKNOWN_INDEX);
    EXPECT_STREQ(error.what(), "unknown memory 0");
}

TEST(validation, element_segment_type)
{
    Module module;
    module.tablesec.push_back({ValType::externref, {1, std::nullopt}});
    Element element;
    element.offset = const_expr({make_const(Value{0})});
    module.elementsec.push_back(element);
    const auto error = validation_failure(module);
    EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
    EXPECT_STREQ(error.what(), "type mismatch: element segment type differs from table type");

    module.elementsec[0].table = 1;
    EXPECT_STREQ(validation_failure(module).what(), "unknown table 1");
}

TEST(validation, error_location)
{
    /* wat2wasm
    (func)
    (func (result i32)
      i64.const 0
    )
    */
    const auto wasm = from_hex(
        "0061736d010000000108026000006000017f03030200010a090202000b040042000b");
    auto module = decode(wasm);
    try
    {
        stasis::validate(std::move(module));
        ADD_FAILURE() << "validation_error expected";
    }
    catch (const validation_error& error)
    {
        EXPECT_EQ(error.code, STASIS_ERROR_TYPE_MISMATCH);
        EXPECT_STREQ(error.what(), "type mismatch: expected i32, got i64");
        ASSERT_TRUE(error.func_idx.has_value());
        EXPECT_EQ(*error.func_idx, 1);
        // The offset of i64.const, the last instruction before the function end.
        EXPECT_EQ(error.offset, 31);
    }
}
