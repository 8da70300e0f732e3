// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "stack.hpp"
#include "store.hpp"
#include "types.hpp"
#include "value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stasis
{
/// The kinds of traps.
enum class TrapKind : uint8_t
{
    unreachable,
    integer_divide_by_zero,
    integer_overflow,
    invalid_conversion_to_integer,
    memory_out_of_bounds,
    table_out_of_bounds,
    uninitialized_element,
    indirect_call_type_mismatch,
    call_stack_exhausted,
    /// The host completed a pending call with a trap.
    host,
};

const char* to_string(TrapKind kind) noexcept;

/// The kind of the control-flow scope a label represents.
enum class LabelKind : uint8_t
{
    function_body,
    block,
    loop,
    /// The then-branch of an if instruction.
    if_then,
    /// The else-branch of an if instruction.
    if_else,
};

/// A control-flow scope of an active function.
struct Label
{
    LabelKind kind = LabelKind::block;

    /// The number of values a branch to this label carries: results of the block,
    /// parameters of a loop.
    uint32_t arity = 0;

    /// The value stack height at the scope entry, excluding the block parameters.
    size_t height = 0;

    /// The position of the next instruction to execute in the governed sequence.
    /// Equals the sequence length when the scope is about to be exited.
    uint32_t cursor = 0;

    /// The governed instruction sequence. It is derived from the code and is recomputed
    /// when a state is restored from a snapshot.
    const std::vector<Instr>* instructions = nullptr;
};

/// The activation frame of a function invocation.
struct Frame
{
    FuncAddr func = 0;
    ModuleAddr module = 0;

    /// The number of function results.
    uint32_t arity = 0;

    /// Parameters followed by declared locals.
    std::vector<Value> locals;

    /// The label stack; the function body label is at the bottom.
    std::vector<Label> labels;
};

/// The call of a host function awaiting completion by the embedder.
struct HostCall
{
    FuncAddr func = 0;
    std::string module;
    std::string name;
    std::vector<Value> args;
};

/// The complete state of an execution. Together with the Store it is sufficient to continue the
/// execution. It holds no pointers except the derived Label::instructions.
struct ExecutionState
{
    ValueStack stack;
    std::vector<Frame> frames;

    /// The invoked function.
    std::optional<FuncAddr> entry;

    /// The host call the execution is suspended on.
    std::optional<HostCall> pending;

    /// Set once the execution trapped. A trapped state stays trapped.
    std::optional<TrapKind> trap;

    /// The results, set once the invoked function returned.
    std::optional<std::vector<Value>> results;

    /// The number of steps made so far.
    uint64_t steps = 0;
};
}  // namespace stasis
