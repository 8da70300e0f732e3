// Stasis: A resumable WebAssembly interpreter
// Copyright 2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "parser.hpp"
#include "snapshot.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <test/utils/asserts.hpp>
#include <test/utils/execute_helpers.hpp>
#include <test/utils/hex.hpp>

using namespace stasis;
using namespace stasis::test;
using testing::ElementsAre;

namespace
{
/* wat2wasm
(func $tick (import "env" "tick") (param i32) (result i32))
(memory 1)
(global (mut i32) (i32.const 0))
(func (export "work") (param i32) (result i32) (local i32)
  (loop
    local.get 1
    local.get 0
    i32.add
    local.set 1
    local.get 0
    i32.const 4
    i32.mul
    local.get 1
    i32.store
    global.get 0
    i32.const 1
    i32.add
    global.set 0
    local.get 0
    i32.const 1
    i32.sub
    local.tee 0
    br_if 0
  )
  local.get 1
  call $add_counter
)
(func $add_counter (param i32) (result i32)
  (block (result i32)
    local.get 0
    global.get 0
    i32.add
  )
)
(func (export "ask") (param i32) (result i32)
  local.get 0
  call $tick
  i32.const 100
  i32.add
)
*/
const auto work_wasm = from_hex(
    "0061736d0100000001060160017f017f020c0103656e76047469636b000003040300000005030100010606017f01"
    "41000b070e0204776f726b00010361736b00030a44032c01017f0340200120006a2101200041046c200136020023"
    "0041016a2400200041016b22000d000b200110020b0a00027f200023006a0b0b0a002000100041e4006a0b");

/* wat2wasm
(func (export "work") (param i32) (result i32) local.get 0)
*/
const auto other_wasm =
    from_hex("0061736d0100000001060160017f017f0302010007080104776f726b00000a0601040020000b");

/// Moves the execution with the Store contents to another Store through the binary forms.
ExecutionState transfer(const ExecutionState& state, const Store& from, Store& to)
{
    restore_store(decode_store_image(encode_store_image(capture_store(from))), to);
    return restore(decode_snapshot(encode_snapshot(capture(state, from))), to);
}
}  // namespace

TEST(snapshot, capture)
{
    auto instance = instantiate(work_wasm);
    auto state = prepare_export(instance, "work", {5});
    run(state, instance.store, 3);

    const auto snapshot = capture(state, instance.store);
    EXPECT_EQ(snapshot.format_version, SnapshotFormatVersion);
    EXPECT_EQ(snapshot.steps, 3);
    ASSERT_EQ(snapshot.modules.size(), 1);
    EXPECT_EQ(snapshot.modules[0].module, instance.module);
    EXPECT_EQ(snapshot.modules[0].fingerprint, fingerprint(work_wasm));

    // loop, local.get 1, local.get 0
    EXPECT_THAT(snapshot.stack, ElementsAre(Value{0}, Value{5}));
    ASSERT_EQ(snapshot.frames.size(), 1);
    const auto& frame = snapshot.frames[0];
    EXPECT_EQ(frame.func, instance.func_addr(1));
    EXPECT_EQ(frame.arity, 1);
    EXPECT_THAT(frame.locals, ElementsAre(Value{5}, Value{0}));
    ASSERT_EQ(frame.labels.size(), 2);
    EXPECT_EQ(frame.labels[0].kind, LabelKind::function_body);
    EXPECT_EQ(frame.labels[0].cursor, 1);
    EXPECT_EQ(frame.labels[1].kind, LabelKind::loop);
    EXPECT_EQ(frame.labels[1].arity, 0);
    EXPECT_EQ(frame.labels[1].height, 0);
    EXPECT_EQ(frame.labels[1].cursor, 2);

    ASSERT_TRUE(snapshot.entry.has_value());
    EXPECT_EQ(*snapshot.entry, instance.func_addr(1));
    EXPECT_FALSE(snapshot.pending.has_value());
    EXPECT_FALSE(snapshot.trap.has_value());
    EXPECT_FALSE(snapshot.results.has_value());
}

TEST(snapshot, resume_after_every_step)
{
    auto reference = instantiate(work_wasm);
    auto reference_state = prepare_export(reference, "work", {5});
    ASSERT_THAT(run(reference_state, reference.store), Result(20));
    const auto total_steps = reference_state.steps;
    ASSERT_GT(total_steps, 50);

    for (uint64_t k = 0; k <= total_steps; ++k)
    {
        auto source = instantiate(work_wasm);
        auto state = prepare_export(source, "work", {5});
        run(state, source.store, k);

        auto target = instantiate(work_wasm);
        auto restored = transfer(state, source.store, target.store);
        EXPECT_EQ(restored.steps, k);
        EXPECT_EQ(encode_snapshot(capture(restored, target.store)),
            encode_snapshot(capture(state, source.store)))
            << "step " << k;

        EXPECT_THAT(run(restored, target.store), Result(20)) << "step " << k;
        EXPECT_EQ(restored.steps, total_steps);
        EXPECT_EQ(target.global(0).value, Value{5});
        EXPECT_EQ(target.memory().data, reference.memory().data);
    }
}

TEST(snapshot, resume_awaiting_host)
{
    auto source = instantiate(work_wasm);
    auto state = prepare_export(source, "ask", {7});
    ASSERT_THAT(run(state, source.store), AwaitsHost("env", "tick"));
    const auto encoded = encode_snapshot(capture(state, source.store));

    auto target = instantiate(work_wasm);
    auto restored = restore(decode_snapshot(encoded), target.store);
    ASSERT_TRUE(restored.pending.has_value());
    EXPECT_EQ(restored.pending->func, target.func_addr(0));
    EXPECT_EQ(restored.pending->module, "env");
    EXPECT_EQ(restored.pending->name, "tick");
    EXPECT_THAT(restored.pending->args, ElementsAre(Value{7}));
    EXPECT_THAT(step(restored, target.store), AwaitsHost("env", "tick"));

    // Both copies continue independently.
    resume_with_results(restored, target.store, {Value{1}});
    EXPECT_THAT(run(restored, target.store), Result(101));
    resume_with_results(state, source.store, {Value{2}});
    EXPECT_THAT(run(state, source.store), Result(102));
}

TEST(snapshot, finished_execution)
{
    auto instance = instantiate(work_wasm);

    auto returned = prepare_export(instance, "work", {1});
    ASSERT_THAT(run(returned, instance.store), Result(2));
    auto restored = restore(decode_snapshot(encode_snapshot(capture(returned, instance.store))),
        instance.store);
    EXPECT_TRUE(restored.frames.empty());
    EXPECT_THAT(step(restored, instance.store), Result(2));
    EXPECT_EQ(restored.steps, returned.steps);

    auto trapped = prepare_export(instance, "ask", {1});
    ASSERT_THAT(run(trapped, instance.store), AwaitsHost("env", "tick"));
    resume_with_trap(trapped);
    auto restored_trap =
        restore(decode_snapshot(encode_snapshot(capture(trapped, instance.store))), instance.store);
    EXPECT_THAT(run(restored_trap, instance.store), Traps(TrapKind::host));
}

TEST(snapshot, restore_into_different_module)
{
    auto source = instantiate(work_wasm);
    auto state = prepare_export(source, "work", {5});
    run(state, source.store, 10);
    const auto snapshot = capture(state, source.store);

    auto other = instantiate(other_wasm);
    EXPECT_THROW_MESSAGE(restore(snapshot, other.store), snapshot_error,
        "module fingerprint mismatch for module instance 0");

    Store empty;
    EXPECT_THROW_MESSAGE(
        restore(snapshot, empty), snapshot_error, "unknown module instance 0");
}

TEST(snapshot, restore_inconsistent)
{
    auto instance = instantiate(work_wasm);
    auto state = prepare_export(instance, "work", {5});
    run(state, instance.store, 2);
    const auto snapshot = capture(state, instance.store);
    ASSERT_EQ(snapshot.frames.size(), 1);
    ASSERT_EQ(snapshot.frames[0].labels.size(), 2);
    ASSERT_EQ(snapshot.stack.size(), 1);

    const auto expect_rejected = [&](void (*modify)(Snapshot&), const char* message) {
        auto modified = snapshot;
        modify(modified);
        EXPECT_THROW_MESSAGE(restore(modified, instance.store), snapshot_error, message);
    };

    expect_rejected([](Snapshot& s) { s.format_version = 2; }, "unsupported snapshot version 2");
    expect_rejected([](Snapshot& s) { s.modules.clear(); },
        "frame refers to module instance without fingerprint");
    expect_rejected([](Snapshot& s) { s.frames[0].func = 100; }, "unknown function address 100");
    expect_rejected([](Snapshot& s) { s.frames[0].func = 0; },
        "frame function does not belong to the module instance");
    expect_rejected(
        [](Snapshot& s) { s.frames[0].arity = 0; }, "frame arity does not match the function type");
    expect_rejected([](Snapshot& s) { s.frames[0].locals.pop_back(); },
        "frame locals do not match the function");
    expect_rejected([](Snapshot& s) { s.frames[0].locals[1] = Value{uint64_t{1}}; },
        "frame local 1 type mismatch");
    expect_rejected([](Snapshot& s) { s.frames[0].labels.erase(s.frames[0].labels.begin()); },
        "frame must start with the function body label");
    expect_rejected([](Snapshot& s) { s.frames[0].labels[0].arity = 0; },
        "function body label arity does not match the function type");
    expect_rejected([](Snapshot& s) { s.frames[0].labels[1].kind = LabelKind::block; },
        "label nesting does not match the code");
    expect_rejected(
        [](Snapshot& s) { s.frames[0].labels[1].arity = 1; }, "label arity does not match the code");
    expect_rejected([](Snapshot& s) { s.frames[0].labels[1].cursor = 1000; },
        "label cursor out of the instruction sequence");
    expect_rejected([](Snapshot& s) { s.frames[0].labels[1].height = 2; },
        "label height inconsistent with the value stack");
    expect_rejected([](Snapshot& s) { s.entry = 100; }, "unknown entry function address 100");
    expect_rejected([](Snapshot& s) { s.pending = HostCall{1, "env", "tick", {}}; },
        "pending call does not refer to a host function");
    expect_rejected([](Snapshot& s) { s.frames.clear(); }, "running execution without frames");
    expect_rejected([](Snapshot& s) { s.results = std::vector<Value>{}; },
        "returned execution with active frames");

    // Function references must exist in the target Store.
    expect_rejected([](Snapshot& s) { s.stack[0] = Value::funcref(100); },
        "reference to unknown function 100 in value stack");
    expect_rejected([](Snapshot& s) { s.frames[0].locals[0] = Value::funcref(100); },
        "reference to unknown function 100 in frame 0 locals");
    expect_rejected(
        [](Snapshot& s) { s.pending = HostCall{0, "env", "tick", {Value::funcref(100)}}; },
        "reference to unknown function 100 in pending call arguments");
    expect_rejected([](Snapshot& s) { s.results = std::vector<Value>{Value::funcref(100)}; },
        "reference to unknown function 100 in results");
}

TEST(snapshot, encode_empty)
{
    const Snapshot snapshot;
    const auto encoded = encode_snapshot(snapshot);
    EXPECT_EQ(hex(encoded), "5354534e" "01" "00" "00" "00" "00" "00000000");

    const auto decoded = decode_snapshot(encoded);
    EXPECT_EQ(decoded.format_version, SnapshotFormatVersion);
    EXPECT_TRUE(decoded.frames.empty());
    EXPECT_FALSE(decoded.entry.has_value());
}

TEST(snapshot, encode_values)
{
    Snapshot snapshot;
    snapshot.stack = {Value{uint32_t{0xaabbccdd}}, Value{int64_t{-1}},
        Value::from_bits(ValType::f32, 0x7fa00001), Value::from_bits(ValType::f64, 1),
        Value::null(ValType::funcref), Value::funcref(3), Value::externref(300)};
    snapshot.results = std::vector<Value>{Value{1}};
    snapshot.steps = 128;

    const auto decoded = decode_snapshot(encode_snapshot(snapshot));
    EXPECT_EQ(decoded.stack, snapshot.stack);
    EXPECT_EQ(decoded.results, snapshot.results);
    EXPECT_EQ(decoded.steps, 128);
}

TEST(snapshot, encode_pending_host_call)
{
    Snapshot snapshot;
    snapshot.pending = HostCall{2, "env", "tick", {Value{7}}};

    const auto encoded = encode_snapshot(snapshot);
    // Names are stored as length-prefixed UTF-8 bytes.
    EXPECT_NE(hex(encoded).find("03656e76" "047469636b"), std::string::npos);

    const auto decoded = decode_snapshot(encoded);
    ASSERT_TRUE(decoded.pending.has_value());
    EXPECT_EQ(decoded.pending->func, 2);
    EXPECT_EQ(decoded.pending->module, "env");
    EXPECT_EQ(decoded.pending->name, "tick");
    EXPECT_THAT(decoded.pending->args, ElementsAre(Value{7}));
}

TEST(snapshot, decode_malformed)
{
    EXPECT_THROW_MESSAGE(
        decode_snapshot({}), snapshot_error, "malformed snapshot: unexpected EOF");
    EXPECT_THROW_MESSAGE(decode_snapshot("5354534901"_bytes), snapshot_error,
        "malformed snapshot: invalid magic");
    EXPECT_THROW_MESSAGE(decode_snapshot("5354534e02"_bytes), snapshot_error,
        "unsupported snapshot version 2");
    EXPECT_THROW_MESSAGE(decode_snapshot("5354534e010000000000000000ff"_bytes), snapshot_error,
        "malformed snapshot: unexpected bytes after the snapshot");
    EXPECT_THROW_MESSAGE(decode_snapshot("5354534e010000000000000002"_bytes), snapshot_error,
        "malformed snapshot: invalid flag 2");

    Snapshot snapshot;
    snapshot.stack = {Value::from_bits(static_cast<ValType>(0x10), 0)};
    EXPECT_THROW_MESSAGE(decode_snapshot(encode_snapshot(snapshot)), snapshot_error,
        "malformed snapshot: invalid value type 16");

    snapshot.stack.clear();
    snapshot.trap = static_cast<TrapKind>(50);
    EXPECT_THROW_MESSAGE(decode_snapshot(encode_snapshot(snapshot)), snapshot_error,
        "malformed snapshot: invalid trap kind");

    snapshot.trap.reset();
    snapshot.frames.push_back({0, 0, 0, {}, {{static_cast<LabelKind>(9), 0, 0, 0}}});
    EXPECT_THROW_MESSAGE(decode_snapshot(encode_snapshot(snapshot)), snapshot_error,
        "malformed snapshot: invalid label kind");
}

TEST(snapshot, decode_truncated)
{
    auto instance = instantiate(work_wasm);
    auto state = prepare_export(instance, "work", {5});
    run(state, instance.store, 20);
    const auto encoded = encode_snapshot(capture(state, instance.store));

    for (size_t size = 0; size < encoded.size(); ++size)
    {
        EXPECT_THROW(decode_snapshot(bytes_view{encoded}.substr(0, size)), snapshot_error)
            << size;
    }
    EXPECT_NO_THROW(decode_snapshot(encoded));
}
