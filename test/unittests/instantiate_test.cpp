// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instantiate.hpp"
#include "parser.hpp"
#include <gmock/gmock.h>
#include <test/utils/asserts.hpp>
#include <test/utils/execute_helpers.hpp>
#include <test/utils/hex.hpp>

using namespace stasis;
using namespace stasis::test;
using testing::ElementsAre;

namespace
{
std::shared_ptr<const ValidatedModule> validate_wasm(bytes_view wasm)
{
    return validate(decode(wasm));
}
}  // namespace

TEST(instantiate, empty_module)
{
    Store store;
    const auto addr = instantiate(store, validate_wasm("0061736d01000000"_bytes));
    EXPECT_EQ(addr, 0);
    ASSERT_EQ(store.modules.size(), 1);
    EXPECT_TRUE(store.modules[0].funcs.empty());
    EXPECT_TRUE(store.modules[0].exports.empty());

    // The next instance gets the next address.
    EXPECT_EQ(instantiate(store, validate_wasm("0061736d01000000"_bytes)), 1);
}

TEST(instantiate, null_module)
{
    Store store;
    EXPECT_THROW_MESSAGE(
        instantiate(store, nullptr), std::invalid_argument, "module must not be null");
}

TEST(instantiate, instance_shares_module_ownership)
{
    Store store;
    auto module = validate_wasm("0061736d01000000"_bytes);
    const std::weak_ptr<const ValidatedModule> observer = module;
    instantiate(store, std::move(module));
    EXPECT_FALSE(observer.expired());
    EXPECT_EQ(store.modules[0].module.get(), observer.lock().get());
}

TEST(instantiate, imports_count_mismatch)
{
    /* wat2wasm
    (func (import "env" "f") (param i32))
    */
    const auto wasm = from_hex("0061736d0100000001050160017f0002090103656e7601660000");

    Store store;
    EXPECT_THROW_MESSAGE(instantiate(store, validate_wasm(wasm)), instantiate_error,
        "module requires 1 imports, 0 provided");
}

TEST(instantiate, imported_function)
{
    /* wat2wasm
    (func (import "env" "f") (param i32))
    */
    const auto wasm = from_hex("0061736d0100000001050160017f0002090103656e7601660000");

    Store store;
    const auto matching = allocate_host_function(store, {{ValType::i32}, {}}, "host", "g");
    const auto other = allocate_host_function(store, {{ValType::i64}, {}}, "host", "h");

    const auto addr = instantiate(store, validate_wasm(wasm), {{ExternalKind::Function, matching}});
    EXPECT_THAT(store.modules[addr].funcs, ElementsAre(matching));

    EXPECT_THROW_MESSAGE(
        instantiate(store, validate_wasm(wasm), {{ExternalKind::Function, other}}),
        instantiate_error, "import 0 (env.f) function type doesn't match");
    EXPECT_THROW_MESSAGE(instantiate(store, validate_wasm(wasm), {{ExternalKind::Function, 7}}),
        instantiate_error, "import 0 (env.f) has unknown function address");
    EXPECT_THROW_MESSAGE(instantiate(store, validate_wasm(wasm), {{ExternalKind::Memory, 0}}),
        instantiate_error, "import 0 (env.f) requires function, memory provided");
}

TEST(instantiate, imported_memory_limits)
{
    /* wat2wasm
    (memory (import "env" "m") 1 2)
    */
    const auto wasm = from_hex("0061736d01000000020b0103656e76016d02010102");
    const auto module = validate_wasm(wasm);

    Store store;
    const auto exact = allocate_memory(store, {1, 2});
    const auto smaller_max = allocate_memory(store, {2, 2});
    const auto too_small = allocate_memory(store, {0, std::nullopt});
    const auto unbounded = allocate_memory(store, {1, std::nullopt});
    const auto larger_max = allocate_memory(store, {1, 3});

    EXPECT_NO_THROW(instantiate(store, module, {{ExternalKind::Memory, exact}}));
    EXPECT_NO_THROW(instantiate(store, module, {{ExternalKind::Memory, smaller_max}}));
    EXPECT_THROW_MESSAGE(instantiate(store, module, {{ExternalKind::Memory, too_small}}),
        instantiate_error, "provided import's min is below import's min defined in module");
    EXPECT_THROW_MESSAGE(instantiate(store, module, {{ExternalKind::Memory, unbounded}}),
        instantiate_error, "provided import's max is above import's max defined in module");
    EXPECT_THROW_MESSAGE(instantiate(store, module, {{ExternalKind::Memory, larger_max}}),
        instantiate_error, "provided import's max is above import's max defined in module");
}

TEST(instantiate, imported_table)
{
    /* wat2wasm
    (table (import "env" "t") 2 funcref)
    */
    const auto wasm = from_hex("0061736d01000000020b0103656e76017401700002");
    const auto module = validate_wasm(wasm);

    Store store;
    const auto table = allocate_table(store, {ValType::funcref, {2, std::nullopt}});
    const auto small = allocate_table(store, {ValType::funcref, {1, std::nullopt}});
    const auto externs = allocate_table(store, {ValType::externref, {2, std::nullopt}});

    const auto addr = instantiate(store, module, {{ExternalKind::Table, table}});
    EXPECT_THAT(store.modules[addr].tables, ElementsAre(table));
    EXPECT_THROW_MESSAGE(instantiate(store, module, {{ExternalKind::Table, small}}),
        instantiate_error, "provided import's min is below import's min defined in module");
    EXPECT_THROW_MESSAGE(instantiate(store, module, {{ExternalKind::Table, externs}}),
        instantiate_error, "import 0 (env.t) table element type doesn't match");
}

TEST(instantiate, imported_global)
{
    /* wat2wasm
    (global (import "env" "g") i32)
    (global (export "g") i32 (global.get 0))
    */
    const auto wasm = from_hex(
        "0061736d01000000020a0103656e760167037f000606017f0023000b07050101670301");
    const auto module = validate_wasm(wasm);

    Store store;
    const auto imported = allocate_global(store, {ValType::i32, false}, Value{42});
    const auto mutable_global = allocate_global(store, {ValType::i32, true}, Value{42});

    const std::vector<ExternVal> imports{{ExternalKind::Global, imported}};
    const auto addr = instantiate(store, module, imports);
    const auto exported = find_export(store, addr, "g");
    ASSERT_TRUE(exported.has_value());
    EXPECT_EQ(exported->kind, ExternalKind::Global);
    EXPECT_NE(exported->addr, imported);
    EXPECT_EQ(read_global(store, exported->addr), Value{42});

    const std::vector<ExternVal> mutable_imports{{ExternalKind::Global, mutable_global}};
    EXPECT_THROW_MESSAGE(instantiate(store, module, mutable_imports),
        instantiate_error, "import 0 (env.g) global type doesn't match");
}

TEST(instantiate, resolve_imports)
{
    /* wat2wasm
    (func (import "env" "f") (param i32))
    */
    const auto wasm = from_hex("0061736d0100000001050160017f0002090103656e7601660000");
    const auto module = decode(wasm);

    Store store;
    const auto externs = resolve_imports(store, *module, {});
    ASSERT_EQ(externs.size(), 1);
    EXPECT_EQ(externs[0].kind, ExternalKind::Function);
    ASSERT_EQ(store.funcs.size(), 1);
    const auto& host = store.funcs[externs[0].addr];
    EXPECT_TRUE(host.is_host());
    EXPECT_EQ(host.host_module, "env");
    EXPECT_EQ(host.host_name, "f");
    EXPECT_EQ(host.type, (FuncType{{ValType::i32}, {}}));

    // The provided extern is used as is.
    const auto provided =
        resolve_imports(store, *module, {{"env", "f", {ExternalKind::Function, 0}}});
    ASSERT_EQ(provided.size(), 1);
    EXPECT_EQ(provided[0].addr, 0);
    EXPECT_EQ(store.funcs.size(), 1);
}

TEST(instantiate, resolve_imports_missing_memory)
{
    /* wat2wasm
    (memory (import "env" "m") 1 2)
    */
    const auto wasm = from_hex("0061736d01000000020b0103656e76016d02010102");
    Store store;
    EXPECT_THROW_MESSAGE(resolve_imports(store, *decode(wasm), {}), instantiate_error,
        "imported memory env.m is required");
}

TEST(instantiate, memory_hard_limit)
{
    /* wat2wasm
    (memory 2)
    */
    const auto wasm = from_hex("0061736d010000000503010002");

    const auto instance = instantiate(wasm);
    EXPECT_EQ(instance.store.mems.at(0).pages(), 2);
    EXPECT_EQ(instance.store.mems.at(0).data.size(), 2 * PageSize);

    EXPECT_THROW_MESSAGE(
        instantiate(wasm, 1), instantiate_error, "cannot exceed hard memory limit of 65536 bytes");
}

TEST(instantiate, element_segments)
{
    /* wat2wasm
    (table 3 funcref)
    (elem (i32.const 1) func 0 1)
    (elem func 1)
    (func)
    (func)
    */
    const auto wasm = from_hex(
        "0061736d010000000104016000000303020000040401700003090c020041010b020001010001010a07020200"
        "0b02000b");

    const auto instance = instantiate(wasm);
    const auto& module_instance = instance.module_instance();
    const auto& table = instance.store.tables.at(module_instance.tables.at(0));
    ASSERT_EQ(table.elements.size(), 3);
    EXPECT_TRUE(table.elements[0].is_null());
    EXPECT_EQ(table.elements[1], Value::funcref(module_instance.funcs[0]));
    EXPECT_EQ(table.elements[2], Value::funcref(module_instance.funcs[1]));

    // The active segment is dropped once applied, the passive one stays.
    ASSERT_EQ(module_instance.elems.size(), 2);
    EXPECT_TRUE(instance.store.elems[module_instance.elems[0]].elements.empty());
    EXPECT_THAT(instance.store.elems[module_instance.elems[1]].elements,
        ElementsAre(Value::funcref(module_instance.funcs[1])));
}

TEST(instantiate, element_segment_out_of_bounds)
{
    /* wat2wasm
    (table 3 funcref)
    (elem (i32.const 2) func 0 0)
    (func)
    */
    const auto wasm = from_hex(
        "0061736d01000000010401600000030201000404017000030908010041020b0200000a040102000b");

    Store store;
    EXPECT_THROW_MESSAGE(
        instantiate_into(store, wasm), instantiate_error, "element segment is out of table bounds");
    // Allocations made before the failure stay in the Store.
    EXPECT_EQ(store.tables.size(), 1);
    EXPECT_EQ(store.funcs.size(), 1);
}

TEST(instantiate, data_segments)
{
    /* wat2wasm
    (memory 1)
    (data (i32.const 1) "\aa\bb")
    (data "\cc")
    */
    const auto wasm = from_hex(
        "0061736d0100000005030100010c01020b0b020041010b02aabb0101cc");

    auto instance = instantiate(wasm);
    EXPECT_EQ(hex(bytes_view{instance.memory().data}.substr(0, 4)), "00aabb00");

    const auto& datas = instance.module_instance().datas;
    ASSERT_EQ(datas.size(), 2);
    EXPECT_TRUE(instance.store.datas[datas[0]].data.empty());
    EXPECT_EQ(instance.store.datas[datas[1]].data, "cc"_bytes);
}

TEST(instantiate, data_segment_out_of_bounds)
{
    /* wat2wasm
    (memory 1)
    (data (i32.const 65535) "\aa\bb")
    */
    const auto wasm = from_hex("0061736d0100000005030100010b0a010041ffff030b02aabb");
    EXPECT_THROW_MESSAGE(
        instantiate(wasm), instantiate_error, "data segment is out of memory bounds");
}

TEST(instantiate, shared_memory)
{
    /* wat2wasm
    (memory (export "mem") 1)
    */
    const auto exporter = from_hex("0061736d010000000503010001070701036d656d0200");
    /* wat2wasm
    (memory (import "a" "mem") 1)
    (data (i32.const 10) "\2a")
    */
    const auto importer =
        from_hex("0061736d01000000020a010161036d656d0200010b070100410a0b012a");

    Store store;
    const auto exporter_addr = instantiate_into(store, exporter);
    const auto mem = find_export(store, exporter_addr, "mem");
    ASSERT_TRUE(mem.has_value());
    EXPECT_EQ(mem->kind, ExternalKind::Memory);

    const auto importer_addr = instantiate_into(store, importer, {{"a", "mem", *mem}});
    EXPECT_THAT(store.modules[importer_addr].mems, ElementsAre(mem->addr));
    EXPECT_EQ(store.mems.size(), 1);
    EXPECT_EQ(store.mems[mem->addr].data[10], 0x2a);
}

TEST(instantiate, start_function)
{
    /* wat2wasm
    (global (export "g") (mut i32) (i32.const 0))
    (func
      i32.const 42
      global.set 0
    )
    (start 0)
    */
    const auto wasm = from_hex(
        "0061736d01000000010401600000030201000606017f0141000b070501016703000801000a08010600412a24"
        "000b");

    const auto instance = instantiate(wasm);
    const auto global = find_export(instance.store, instance.module, "g");
    ASSERT_TRUE(global.has_value());
    EXPECT_EQ(read_global(instance.store, global->addr), Value{42});
}

TEST(instantiate, start_function_trap)
{
    /* wat2wasm
    (func unreachable)
    (start 0)
    */
    const auto wasm = from_hex("0061736d01000000010401600000030201000801000a05010300000b");
    EXPECT_THROW_MESSAGE(
        instantiate(wasm), instantiate_error, "start function failed to execute: unreachable");
}

TEST(instantiate, start_function_calls_host)
{
    /* wat2wasm
    (func (import "env" "f"))
    (func call 0)
    (start 1)
    */
    const auto wasm = from_hex(
        "0061736d0100000001040160000002090103656e7601660000030201000801010a0601040010000b");
    EXPECT_THROW_MESSAGE(instantiate(wasm), instantiate_error,
        "start function called host function env.f during instantiation");

    /* wat2wasm
    (func (import "env" "f"))
    (start 0)
    */
    const auto host_start =
        from_hex("0061736d0100000001040160000002090103656e7601660000080100");
    EXPECT_THROW_MESSAGE(
        instantiate(host_start), instantiate_error, "start function cannot be a host function");
}

TEST(instantiate, exports)
{
    /* wat2wasm
    (func (export "f"))
    (table (export "t") 1 funcref)
    (memory (export "m") 1)
    (global (export "g") i32 (i32.const 7))
    */
    const auto wasm = from_hex(
        "0061736d010000000104016000000302010004040170000105030100010606017f0041070b07110401660000"
        "01740100016d0200016703000a040102000b");

    const auto instance = instantiate(wasm);
    const auto& store = instance.store;
    const auto& module_instance = instance.module_instance();

    const auto func = find_export(store, instance.module, "f");
    ASSERT_TRUE(func.has_value());
    EXPECT_EQ(func->kind, ExternalKind::Function);
    EXPECT_EQ(func->addr, module_instance.funcs[0]);
    const auto func_addr = find_exported_function(store, instance.module, "f");
    ASSERT_TRUE(func_addr.has_value());
    EXPECT_EQ(*func_addr, module_instance.funcs[0]);

    const auto table = find_export(store, instance.module, "t");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->kind, ExternalKind::Table);
    EXPECT_EQ(table->addr, module_instance.tables[0]);

    const auto memory = find_export(store, instance.module, "m");
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->kind, ExternalKind::Memory);

    const auto global = find_export(store, instance.module, "g");
    ASSERT_TRUE(global.has_value());
    EXPECT_EQ(read_global(store, global->addr), Value{7});

    EXPECT_FALSE(find_export(store, instance.module, "x").has_value());
    EXPECT_FALSE(find_exported_function(store, instance.module, "m").has_value());
}

TEST(instantiate, exported_imported_function)
{
    /* wat2wasm
    (func (import "env" "f"))
    (func)
    (export "f" (func 0))
    (export "g" (func 1))
    */
    const auto wasm = from_hex(
        "0061736d0100000001040160000002090103656e76016600000302010007090201660000016700010a040102"
        "000b");

    Store store;
    const auto addr = instantiate_into(store, wasm);
    ASSERT_EQ(store.funcs.size(), 2);
    EXPECT_TRUE(store.funcs[*find_exported_function(store, addr, "f")].is_host());
    EXPECT_FALSE(store.funcs[*find_exported_function(store, addr, "g")].is_host());
    EXPECT_EQ(store.funcs[*find_exported_function(store, addr, "g")].module, addr);
}
