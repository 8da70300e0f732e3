// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "execution_state.hpp"
#include "module.hpp"
#include "store.hpp"
#include "value.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace stasis
{
enum class StepStatus : uint8_t
{
    /// The execution can continue.
    running,
    /// The invoked function returned.
    returned,
    /// The execution trapped.
    trapped,
    /// The execution is suspended on a host function call.
    awaiting_host,
};

const char* to_string(StepStatus status) noexcept;

/// The result of a step or a run.
struct StepResult
{
    StepStatus status = StepStatus::running;

    /// The results of the invoked function. Valid if status is returned.
    std::vector<Value> values;

    /// Valid if status is trapped.
    std::optional<TrapKind> trap;

    /// The pending call. Valid if status is awaiting_host.
    std::optional<HostCall> host_call;
};

/// Returns the arity of the label a structured instruction enters: the number of results of
/// a block or an if branch, the number of parameters of a loop.
uint32_t get_label_arity(const Module& module, const BlockType& block_type, LabelKind kind) noexcept;

/// Creates the state of an invocation of the function with the given arguments.
///
/// A host function cannot be invoked directly.
/// @throws std::invalid_argument if the arguments do not match the function type.
ExecutionState prepare_invocation(const Store& store, FuncAddr func, std::vector<Value> args);

/// Executes a single instruction or a single exit from an instruction sequence.
///
/// Never recurses natively: a call pushes a frame and a structured instruction pushes a label.
/// Stepping a state that already finished returns the same result again.
StepResult step(ExecutionState& state, Store& store);

/// Steps the execution until it stops running or `max_steps` steps are made.
StepResult run(ExecutionState& state, Store& store,
    uint64_t max_steps = std::numeric_limits<uint64_t>::max());

/// Invokes the function and runs it until it returns, traps or awaits a host call.
StepResult invoke(Store& store, FuncAddr func, std::vector<Value> args);

/// Completes the pending host call with the results. Execution is continued with further step()
/// or run() calls.
/// @throws std::invalid_argument if the state is not awaiting a host call or the results do not
///         match the type of the host function.
void resume_with_results(ExecutionState& state, const Store& store, std::vector<Value> results);

/// Completes the pending host call with a trap.
/// @throws std::invalid_argument if the state is not awaiting a host call.
void resume_with_trap(ExecutionState& state);
}  // namespace stasis
