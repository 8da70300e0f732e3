// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execute.hpp"
#include "limits.hpp"
#include "numeric.hpp"
#include <algorithm>
#include <cstring>
#include <functional>
#include <stdexcept>

namespace stasis
{
namespace
{
template <typename DstT, typename SrcT>
inline constexpr DstT extend(SrcT in) noexcept
{
    if constexpr (std::is_same_v<SrcT, DstT>)
        return in;
    else if constexpr (std::is_signed_v<SrcT>)
    {
        using SignedDstT = std::make_signed_t<DstT>;
        return static_cast<DstT>(SignedDstT{in});
    }
    else
        return DstT{in};
}

template <typename DstT>
inline DstT shrink(Value value)
{
    if constexpr (std::is_floating_point_v<DstT>)
        return value.as<DstT>();
    else
        return static_cast<DstT>(value.bits());
}

/// Loads SrcT from memory at the address on the stack top, extends it to DstT and replaces
/// the address with it. Returns false if the access is out of bounds.
template <typename DstT, typename SrcT = DstT>
inline bool load_from_memory(const bytes& memory, ValueStack& stack, uint32_t offset)
{
    auto& top = stack.top();
    const auto address = top.as<uint32_t>();
    // Addressing is 32-bit, but we keep the value as 64-bit to detect overflows.
    if ((uint64_t{address} + offset + sizeof(SrcT)) > memory.size())
        return false;

    SrcT ret;
    std::memcpy(&ret, &memory[address + offset], sizeof(ret));
    top = Value{extend<DstT>(ret)};
    return true;
}

template <typename DstT>
inline bool store_into_memory(bytes& memory, ValueStack& stack, uint32_t offset)
{
    const auto value = shrink<DstT>(stack.pop());
    const auto address = stack.pop().as<uint32_t>();
    // Addressing is 32-bit, but we keep the value as 64-bit to detect overflows.
    if ((uint64_t{address} + offset + sizeof(DstT)) > memory.size())
        return false;

    std::memcpy(&memory[address + offset], &value, sizeof(value));
    return true;
}

template <typename T, typename Op>
inline void unary_op(ValueStack& stack, Op op)
{
    auto& top = stack.top();
    top = Value{op(top.as<T>())};  // Convert to Value, also from signed integer types.
}

template <typename T, typename Op>
inline void binary_op(ValueStack& stack, Op op)
{
    const auto rhs = stack.pop().as<T>();
    auto& top = stack.top();
    top = Value{op(top.as<T>(), rhs)};
}

template <typename T, typename Op>
inline void comparison_op(ValueStack& stack, Op op)
{
    const auto rhs = stack.pop().as<T>();
    auto& top = stack.top();
    top = Value{uint32_t{op(top.as<T>(), rhs)}};
}

template <typename SrcT, typename DstT>
inline void convert(ValueStack& stack)
{
    unary_op<SrcT>(stack, [](SrcT value) noexcept { return static_cast<DstT>(value); });
}

inline void reinterpret(ValueStack& stack, ValType type)
{
    auto& top = stack.top();
    top = Value::from_bits(type, top.bits());
}

/// Converts the top stack item by truncating a float value to an integer value.
/// Returns false if the value cannot be represented.
template <typename SrcT, typename DstT>
inline bool trunc(ValueStack& stack)
{
    auto& top = stack.top();
    const auto result = numeric::trunc<SrcT, DstT>(top.as<SrcT>());
    if (!result.has_value())
        return false;
    top = Value{*result};
    return true;
}

template <typename T>
inline std::optional<TrapKind> divide(ValueStack& stack)
{
    const auto rhs = stack[0].as<T>();
    if (rhs == 0)
        return TrapKind::integer_divide_by_zero;
    if constexpr (std::is_signed_v<T>)
    {
        if (numeric::div_overflows(stack[1].as<T>(), rhs))
            return TrapKind::integer_overflow;
    }
    binary_op<T>(stack, numeric::div<T>);
    return std::nullopt;
}

template <typename T>
inline std::optional<TrapKind> remainder(ValueStack& stack)
{
    if (stack[0].as<T>() == 0)
        return TrapKind::integer_divide_by_zero;
    binary_op<T>(stack, numeric::rem<T>);
    return std::nullopt;
}

/// Checks that [offset, offset + size) is within a container of the given size.
inline bool in_bounds(uint32_t offset, uint32_t size, size_t container_size) noexcept
{
    return uint64_t{offset} + size <= container_size;
}

/// The number of parameters and results of a block type.
struct BlockArity
{
    size_t inputs = 0;
    size_t outputs = 0;
};

BlockArity get_block_arity(const Module& module, const BlockType& block_type) noexcept
{
    switch (block_type.kind)
    {
    case BlockType::Kind::empty:
        return {0, 0};
    case BlockType::Kind::value:
        return {0, 1};
    case BlockType::Kind::type_index:
    {
        const auto& type = module.typesec[block_type.type_index];
        return {type.inputs.size(), type.outputs.size()};
    }
    }
    return {};
}

void enter_block(ExecutionState& state, Frame& frame, const Module& module, const Instr& instr,
    LabelKind kind, const std::vector<Instr>& instructions)
{
    Label label;
    label.kind = kind;
    label.arity = get_label_arity(module, instr.block_type, kind);
    label.height = state.stack.size() - get_block_arity(module, instr.block_type).inputs;
    label.cursor = 0;
    label.instructions = &instructions;
    frame.labels.push_back(label);
}

/// Branches to the label at the given depth: keeps the values the label carries, discards
/// the inner labels and moves the cursor to the loop start or the sequence end.
void branch(ExecutionState& state, Frame& frame, LabelIdx depth)
{
    if (depth >= frame.labels.size())
        throw invariant_error{"label stack underflow"};

    frame.labels.erase(frame.labels.end() - static_cast<ptrdiff_t>(depth), frame.labels.end());

    auto& target = frame.labels.back();
    state.stack.drop_below_top(target.height, target.arity);
    target.cursor = target.kind == LabelKind::loop ?
                        0 :
                        static_cast<uint32_t>(target.instructions->size());
}

/// Pushes the frame of a module function. The arguments are moved from the stack into locals.
void push_frame(ExecutionState& state, const FuncInstance& func, FuncAddr addr)
{
    Frame frame;
    frame.func = addr;
    frame.module = func.module;
    frame.arity = static_cast<uint32_t>(func.type.outputs.size());
    frame.locals = state.stack.pop_n(func.type.inputs.size());
    frame.locals.reserve(frame.locals.size() + func.code->locals.size());
    for (const auto type : func.code->locals)
        frame.locals.push_back(Value::zero(type));

    Label body;
    body.kind = LabelKind::function_body;
    body.arity = frame.arity;
    body.height = state.stack.size();
    body.instructions = &func.code->body;
    frame.labels.push_back(body);

    state.frames.emplace_back(std::move(frame));
}

StepResult trap(ExecutionState& state, TrapKind kind)
{
    state.trap = kind;
    return {StepStatus::trapped, {}, kind, std::nullopt};
}

StepResult running() noexcept
{
    return {};
}

StepResult awaiting(const ExecutionState& state)
{
    return {StepStatus::awaiting_host, {}, std::nullopt, state.pending};
}

StepResult call(ExecutionState& state, const Store& store, FuncAddr addr)
{
    const auto& callee = store.funcs.at(addr);
    if (callee.is_host())
    {
        auto args = state.stack.pop_n(callee.type.inputs.size());
        state.pending = HostCall{addr, callee.host_module, callee.host_name, std::move(args)};
        return awaiting(state);
    }

    if (state.frames.size() >= CallStackLimit)
        return trap(state, TrapKind::call_stack_exhausted);

    push_frame(state, callee, addr);
    return running();
}

/// Exits the innermost label whose sequence is exhausted. The values it produces are already
/// in place on the stack.
StepResult exit_label(ExecutionState& state)
{
    auto& frame = state.frames.back();
    if (frame.labels.back().kind != LabelKind::function_body)
    {
        frame.labels.pop_back();
        return running();
    }

    const auto& body = frame.labels.back();
    state.stack.drop_below_top(body.height, frame.arity);
    const auto arity = frame.arity;
    state.frames.pop_back();

    if (!state.frames.empty())
        return running();

    state.results = state.stack.pop_n(arity);
    return {StepStatus::returned, *state.results, std::nullopt, std::nullopt};
}

StepResult execute(ExecutionState& state, Store& store, const Instr& instr)
{
    auto& stack = state.stack;
    auto& frame = state.frames.back();
    const auto& instance = store.modules.at(frame.module);
    const auto& module = instance.module->module();

    const auto memory = [&]() -> MemoryInstance& { return store.mems.at(instance.mems.at(0)); };

    switch (instr.opcode)
    {
    case Opcode::unreachable:
        return trap(state, TrapKind::unreachable);
    case Opcode::nop:
        break;
    case Opcode::block:
        enter_block(state, frame, module, instr, LabelKind::block, instr.body);
        break;
    case Opcode::loop:
        enter_block(state, frame, module, instr, LabelKind::loop, instr.body);
        break;
    case Opcode::if_:
        if (stack.pop().as<uint32_t>() != 0)
            enter_block(state, frame, module, instr, LabelKind::if_then, instr.body);
        else
            enter_block(state, frame, module, instr, LabelKind::if_else, instr.else_body);
        break;
    case Opcode::br:
        branch(state, frame, instr.index);
        break;
    case Opcode::br_if:
        if (stack.pop().as<uint32_t>() != 0)
            branch(state, frame, instr.index);
        break;
    case Opcode::br_table:
    {
        const auto target_idx = stack.pop().as<uint32_t>();
        const auto label_idx =
            target_idx < instr.targets.size() ? instr.targets[target_idx] : instr.index;
        branch(state, frame, label_idx);
        break;
    }
    case Opcode::return_:
        branch(state, frame, static_cast<LabelIdx>(frame.labels.size() - 1));
        break;
    case Opcode::call:
        return call(state, store, instance.funcs.at(instr.index));
    case Opcode::call_indirect:
    {
        const auto& table = store.tables.at(instance.tables.at(instr.index2));
        const auto elem_idx = stack.pop().as<uint32_t>();
        if (elem_idx >= table.elements.size())
            return trap(state, TrapKind::table_out_of_bounds);

        const auto& elem = table.elements[elem_idx];
        if (elem.is_null())
            return trap(state, TrapKind::uninitialized_element);

        const auto callee_addr = elem.ref();
        // The dynamic signature check: the table content is only known at run time.
        if (store.funcs.at(callee_addr).type != module.typesec.at(instr.index))
            return trap(state, TrapKind::indirect_call_type_mismatch);

        return call(state, store, callee_addr);
    }

    case Opcode::drop:
        stack.pop();
        break;
    case Opcode::select:
    case Opcode::select_t:
    {
        const auto condition = stack.pop().as<uint32_t>();
        const auto val2 = stack.pop();
        if (condition == 0)
            stack.top() = val2;
        break;
    }

    case Opcode::local_get:
        stack.push(frame.locals.at(instr.index));
        break;
    case Opcode::local_set:
        frame.locals.at(instr.index) = stack.pop();
        break;
    case Opcode::local_tee:
        frame.locals.at(instr.index) = stack.top();
        break;
    case Opcode::global_get:
        stack.push(store.globals.at(instance.globals.at(instr.index)).value);
        break;
    case Opcode::global_set:
        store.globals.at(instance.globals.at(instr.index)).value = stack.pop();
        break;

    case Opcode::table_get:
    {
        const auto& table = store.tables.at(instance.tables.at(instr.index));
        const auto elem_idx = stack.top().as<uint32_t>();
        if (elem_idx >= table.elements.size())
            return trap(state, TrapKind::table_out_of_bounds);
        stack.top() = table.elements[elem_idx];
        break;
    }
    case Opcode::table_set:
    {
        auto& table = store.tables.at(instance.tables.at(instr.index));
        const auto value = stack.pop();
        const auto elem_idx = stack.pop().as<uint32_t>();
        if (elem_idx >= table.elements.size())
            return trap(state, TrapKind::table_out_of_bounds);
        table.elements[elem_idx] = value;
        break;
    }
    case Opcode::table_size:
        stack.push(
            static_cast<uint32_t>(store.tables.at(instance.tables.at(instr.index)).elements.size()));
        break;
    case Opcode::table_grow:
    {
        auto& table = store.tables.at(instance.tables.at(instr.index));
        const auto delta = stack.pop().as<uint32_t>();
        const auto init = stack.top();
        stack.top() = grow_table(table, delta, init);
        break;
    }
    case Opcode::table_fill:
    {
        auto& table = store.tables.at(instance.tables.at(instr.index));
        const auto count = stack.pop().as<uint32_t>();
        const auto value = stack.pop();
        const auto offset = stack.pop().as<uint32_t>();
        if (!in_bounds(offset, count, table.elements.size()))
            return trap(state, TrapKind::table_out_of_bounds);
        std::fill_n(table.elements.begin() + offset, count, value);
        break;
    }
    case Opcode::table_copy:
    {
        auto& dst_table = store.tables.at(instance.tables.at(instr.index));
        const auto& src_table = store.tables.at(instance.tables.at(instr.index2));
        const auto count = stack.pop().as<uint32_t>();
        const auto src = stack.pop().as<uint32_t>();
        const auto dst = stack.pop().as<uint32_t>();
        if (!in_bounds(src, count, src_table.elements.size()) ||
            !in_bounds(dst, count, dst_table.elements.size()))
            return trap(state, TrapKind::table_out_of_bounds);

        // The ranges may overlap when both are in the same table.
        const auto src_begin = src_table.elements.begin() + src;
        if (dst <= src)
            std::copy(src_begin, src_begin + count, dst_table.elements.begin() + dst);
        else
            std::copy_backward(
                src_begin, src_begin + count, dst_table.elements.begin() + dst + count);
        break;
    }
    case Opcode::table_init:
    {
        auto& table = store.tables.at(instance.tables.at(instr.index2));
        const auto& elem = store.elems.at(instance.elems.at(instr.index));
        const auto count = stack.pop().as<uint32_t>();
        const auto src = stack.pop().as<uint32_t>();
        const auto dst = stack.pop().as<uint32_t>();
        if (!in_bounds(src, count, elem.elements.size()) ||
            !in_bounds(dst, count, table.elements.size()))
            return trap(state, TrapKind::table_out_of_bounds);
        std::copy_n(elem.elements.begin() + src, count, table.elements.begin() + dst);
        break;
    }
    case Opcode::elem_drop:
        store.elems.at(instance.elems.at(instr.index)).elements.clear();
        break;

    case Opcode::i32_load:
        if (!load_from_memory<uint32_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load:
        if (!load_from_memory<uint64_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::f32_load:
        if (!load_from_memory<float>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::f64_load:
        if (!load_from_memory<double>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_load8_s:
        if (!load_from_memory<uint32_t, int8_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_load8_u:
        if (!load_from_memory<uint32_t, uint8_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_load16_s:
        if (!load_from_memory<uint32_t, int16_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_load16_u:
        if (!load_from_memory<uint32_t, uint16_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load8_s:
        if (!load_from_memory<uint64_t, int8_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load8_u:
        if (!load_from_memory<uint64_t, uint8_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load16_s:
        if (!load_from_memory<uint64_t, int16_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load16_u:
        if (!load_from_memory<uint64_t, uint16_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load32_s:
        if (!load_from_memory<uint64_t, int32_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_load32_u:
        if (!load_from_memory<uint64_t, uint32_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_store:
        if (!store_into_memory<uint32_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_store:
        if (!store_into_memory<uint64_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::f32_store:
        if (!store_into_memory<float>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::f64_store:
        if (!store_into_memory<double>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_store8:
    case Opcode::i64_store8:
        if (!store_into_memory<uint8_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i32_store16:
    case Opcode::i64_store16:
        if (!store_into_memory<uint16_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::i64_store32:
        if (!store_into_memory<uint32_t>(memory().data, stack, instr.offset))
            return trap(state, TrapKind::memory_out_of_bounds);
        break;
    case Opcode::memory_size:
        stack.push(memory().pages());
        break;
    case Opcode::memory_grow:
        stack.top() = grow_memory(memory(), stack.top().as<uint32_t>());
        break;
    case Opcode::memory_init:
    {
        auto& mem = memory().data;
        const auto& data = store.datas.at(instance.datas.at(instr.index)).data;
        const auto count = stack.pop().as<uint32_t>();
        const auto src = stack.pop().as<uint32_t>();
        const auto dst = stack.pop().as<uint32_t>();
        if (!in_bounds(src, count, data.size()) || !in_bounds(dst, count, mem.size()))
            return trap(state, TrapKind::memory_out_of_bounds);
        if (count != 0)
            std::memcpy(&mem[dst], &data[src], count);
        break;
    }
    case Opcode::data_drop:
        store.datas.at(instance.datas.at(instr.index)).data.clear();
        break;
    case Opcode::memory_copy:
    {
        auto& mem = memory().data;
        const auto count = stack.pop().as<uint32_t>();
        const auto src = stack.pop().as<uint32_t>();
        const auto dst = stack.pop().as<uint32_t>();
        if (!in_bounds(src, count, mem.size()) || !in_bounds(dst, count, mem.size()))
            return trap(state, TrapKind::memory_out_of_bounds);
        if (count != 0)
            std::memmove(&mem[dst], &mem[src], count);
        break;
    }
    case Opcode::memory_fill:
    {
        auto& mem = memory().data;
        const auto count = stack.pop().as<uint32_t>();
        const auto value = static_cast<uint8_t>(stack.pop().as<uint32_t>());
        const auto dst = stack.pop().as<uint32_t>();
        if (!in_bounds(dst, count, mem.size()))
            return trap(state, TrapKind::memory_out_of_bounds);
        if (count != 0)
            std::memset(&mem[dst], value, count);
        break;
    }

    case Opcode::i32_const:
    case Opcode::i64_const:
    case Opcode::f32_const:
    case Opcode::f64_const:
        stack.push(instr.value);
        break;

    case Opcode::ref_null:
        stack.push(Value::null(instr.type));
        break;
    case Opcode::ref_is_null:
        stack.top() = Value{uint32_t{stack.top().is_null()}};
        break;
    case Opcode::ref_func:
        stack.push(Value::funcref(instance.funcs.at(instr.index)));
        break;

    case Opcode::i32_eqz:
        unary_op<uint32_t>(stack, [](uint32_t a) noexcept { return uint32_t{a == 0}; });
        break;
    case Opcode::i32_eq:
        comparison_op<uint32_t>(stack, std::equal_to<>{});
        break;
    case Opcode::i32_ne:
        comparison_op<uint32_t>(stack, std::not_equal_to<>{});
        break;
    case Opcode::i32_lt_s:
        comparison_op<int32_t>(stack, std::less<>{});
        break;
    case Opcode::i32_lt_u:
        comparison_op<uint32_t>(stack, std::less<>{});
        break;
    case Opcode::i32_gt_s:
        comparison_op<int32_t>(stack, std::greater<>{});
        break;
    case Opcode::i32_gt_u:
        comparison_op<uint32_t>(stack, std::greater<>{});
        break;
    case Opcode::i32_le_s:
        comparison_op<int32_t>(stack, std::less_equal<>{});
        break;
    case Opcode::i32_le_u:
        comparison_op<uint32_t>(stack, std::less_equal<>{});
        break;
    case Opcode::i32_ge_s:
        comparison_op<int32_t>(stack, std::greater_equal<>{});
        break;
    case Opcode::i32_ge_u:
        comparison_op<uint32_t>(stack, std::greater_equal<>{});
        break;
    case Opcode::i64_eqz:
        unary_op<uint64_t>(stack, [](uint64_t a) noexcept { return uint32_t{a == 0}; });
        break;
    case Opcode::i64_eq:
        comparison_op<uint64_t>(stack, std::equal_to<>{});
        break;
    case Opcode::i64_ne:
        comparison_op<uint64_t>(stack, std::not_equal_to<>{});
        break;
    case Opcode::i64_lt_s:
        comparison_op<int64_t>(stack, std::less<>{});
        break;
    case Opcode::i64_lt_u:
        comparison_op<uint64_t>(stack, std::less<>{});
        break;
    case Opcode::i64_gt_s:
        comparison_op<int64_t>(stack, std::greater<>{});
        break;
    case Opcode::i64_gt_u:
        comparison_op<uint64_t>(stack, std::greater<>{});
        break;
    case Opcode::i64_le_s:
        comparison_op<int64_t>(stack, std::less_equal<>{});
        break;
    case Opcode::i64_le_u:
        comparison_op<uint64_t>(stack, std::less_equal<>{});
        break;
    case Opcode::i64_ge_s:
        comparison_op<int64_t>(stack, std::greater_equal<>{});
        break;
    case Opcode::i64_ge_u:
        comparison_op<uint64_t>(stack, std::greater_equal<>{});
        break;
    case Opcode::f32_eq:
        comparison_op<float>(stack, std::equal_to<>{});
        break;
    case Opcode::f32_ne:
        comparison_op<float>(stack, std::not_equal_to<>{});
        break;
    case Opcode::f32_lt:
        comparison_op<float>(stack, std::less<>{});
        break;
    case Opcode::f32_gt:
        comparison_op<float>(stack, std::greater<>{});
        break;
    case Opcode::f32_le:
        comparison_op<float>(stack, std::less_equal<>{});
        break;
    case Opcode::f32_ge:
        comparison_op<float>(stack, std::greater_equal<>{});
        break;
    case Opcode::f64_eq:
        comparison_op<double>(stack, std::equal_to<>{});
        break;
    case Opcode::f64_ne:
        comparison_op<double>(stack, std::not_equal_to<>{});
        break;
    case Opcode::f64_lt:
        comparison_op<double>(stack, std::less<>{});
        break;
    case Opcode::f64_gt:
        comparison_op<double>(stack, std::greater<>{});
        break;
    case Opcode::f64_le:
        comparison_op<double>(stack, std::less_equal<>{});
        break;
    case Opcode::f64_ge:
        comparison_op<double>(stack, std::greater_equal<>{});
        break;

    case Opcode::i32_clz:
        unary_op<uint32_t>(stack, numeric::clz<uint32_t>);
        break;
    case Opcode::i32_ctz:
        unary_op<uint32_t>(stack, numeric::ctz<uint32_t>);
        break;
    case Opcode::i32_popcnt:
        unary_op<uint32_t>(stack, numeric::popcnt<uint32_t>);
        break;
    case Opcode::i32_add:
        binary_op<uint32_t>(stack, numeric::add<uint32_t>);
        break;
    case Opcode::i32_sub:
        binary_op<uint32_t>(stack, numeric::sub<uint32_t>);
        break;
    case Opcode::i32_mul:
        binary_op<uint32_t>(stack, numeric::mul<uint32_t>);
        break;
    case Opcode::i32_div_s:
        if (const auto trap_kind = divide<int32_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i32_div_u:
        if (const auto trap_kind = divide<uint32_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i32_rem_s:
        if (const auto trap_kind = remainder<int32_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i32_rem_u:
        if (const auto trap_kind = remainder<uint32_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i32_and:
        binary_op<uint32_t>(stack, std::bit_and<uint32_t>{});
        break;
    case Opcode::i32_or:
        binary_op<uint32_t>(stack, std::bit_or<uint32_t>{});
        break;
    case Opcode::i32_xor:
        binary_op<uint32_t>(stack, std::bit_xor<uint32_t>{});
        break;
    case Opcode::i32_shl:
        binary_op<uint32_t>(stack, numeric::shift_left<uint32_t>);
        break;
    case Opcode::i32_shr_s:
        binary_op<int32_t>(stack, numeric::shift_right<int32_t>);
        break;
    case Opcode::i32_shr_u:
        binary_op<uint32_t>(stack, numeric::shift_right<uint32_t>);
        break;
    case Opcode::i32_rotl:
        binary_op<uint32_t>(stack, numeric::rotl<uint32_t>);
        break;
    case Opcode::i32_rotr:
        binary_op<uint32_t>(stack, numeric::rotr<uint32_t>);
        break;

    case Opcode::i64_clz:
        unary_op<uint64_t>(stack, numeric::clz<uint64_t>);
        break;
    case Opcode::i64_ctz:
        unary_op<uint64_t>(stack, numeric::ctz<uint64_t>);
        break;
    case Opcode::i64_popcnt:
        unary_op<uint64_t>(stack, numeric::popcnt<uint64_t>);
        break;
    case Opcode::i64_add:
        binary_op<uint64_t>(stack, numeric::add<uint64_t>);
        break;
    case Opcode::i64_sub:
        binary_op<uint64_t>(stack, numeric::sub<uint64_t>);
        break;
    case Opcode::i64_mul:
        binary_op<uint64_t>(stack, numeric::mul<uint64_t>);
        break;
    case Opcode::i64_div_s:
        if (const auto trap_kind = divide<int64_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i64_div_u:
        if (const auto trap_kind = divide<uint64_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i64_rem_s:
        if (const auto trap_kind = remainder<int64_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i64_rem_u:
        if (const auto trap_kind = remainder<uint64_t>(stack))
            return trap(state, *trap_kind);
        break;
    case Opcode::i64_and:
        binary_op<uint64_t>(stack, std::bit_and<uint64_t>{});
        break;
    case Opcode::i64_or:
        binary_op<uint64_t>(stack, std::bit_or<uint64_t>{});
        break;
    case Opcode::i64_xor:
        binary_op<uint64_t>(stack, std::bit_xor<uint64_t>{});
        break;
    case Opcode::i64_shl:
        binary_op<uint64_t>(stack, numeric::shift_left<uint64_t>);
        break;
    case Opcode::i64_shr_s:
        binary_op<int64_t>(stack, numeric::shift_right<int64_t>);
        break;
    case Opcode::i64_shr_u:
        binary_op<uint64_t>(stack, numeric::shift_right<uint64_t>);
        break;
    case Opcode::i64_rotl:
        binary_op<uint64_t>(stack, numeric::rotl<uint64_t>);
        break;
    case Opcode::i64_rotr:
        binary_op<uint64_t>(stack, numeric::rotr<uint64_t>);
        break;

    case Opcode::f32_abs:
        unary_op<float>(stack, [](float a) noexcept { return numeric::fabs(a); });
        break;
    case Opcode::f32_neg:
        unary_op<float>(stack, [](float a) noexcept { return numeric::fneg(a); });
        break;
    case Opcode::f32_ceil:
        unary_op<float>(stack, numeric::fceil<float>);
        break;
    case Opcode::f32_floor:
        unary_op<float>(stack, numeric::ffloor<float>);
        break;
    case Opcode::f32_trunc:
        unary_op<float>(stack, numeric::ftrunc<float>);
        break;
    case Opcode::f32_nearest:
        unary_op<float>(stack, numeric::fnearest<float>);
        break;
    case Opcode::f32_sqrt:
        unary_op<float>(stack, numeric::fsqrt<float>);
        break;
    case Opcode::f32_add:
        binary_op<float>(stack, std::plus<float>{});
        break;
    case Opcode::f32_sub:
        binary_op<float>(stack, std::minus<float>{});
        break;
    case Opcode::f32_mul:
        binary_op<float>(stack, std::multiplies<float>{});
        break;
    case Opcode::f32_div:
        binary_op<float>(stack, numeric::fdiv<float>);
        break;
    case Opcode::f32_min:
        binary_op<float>(stack, numeric::fmin<float>);
        break;
    case Opcode::f32_max:
        binary_op<float>(stack, numeric::fmax<float>);
        break;
    case Opcode::f32_copysign:
        binary_op<float>(stack, [](float a, float b) noexcept { return numeric::fcopysign(a, b); });
        break;

    case Opcode::f64_abs:
        unary_op<double>(stack, [](double a) noexcept { return numeric::fabs(a); });
        break;
    case Opcode::f64_neg:
        unary_op<double>(stack, [](double a) noexcept { return numeric::fneg(a); });
        break;
    case Opcode::f64_ceil:
        unary_op<double>(stack, numeric::fceil<double>);
        break;
    case Opcode::f64_floor:
        unary_op<double>(stack, numeric::ffloor<double>);
        break;
    case Opcode::f64_trunc:
        unary_op<double>(stack, numeric::ftrunc<double>);
        break;
    case Opcode::f64_nearest:
        unary_op<double>(stack, numeric::fnearest<double>);
        break;
    case Opcode::f64_sqrt:
        unary_op<double>(stack, numeric::fsqrt<double>);
        break;
    case Opcode::f64_add:
        binary_op<double>(stack, std::plus<double>{});
        break;
    case Opcode::f64_sub:
        binary_op<double>(stack, std::minus<double>{});
        break;
    case Opcode::f64_mul:
        binary_op<double>(stack, std::multiplies<double>{});
        break;
    case Opcode::f64_div:
        binary_op<double>(stack, numeric::fdiv<double>);
        break;
    case Opcode::f64_min:
        binary_op<double>(stack, numeric::fmin<double>);
        break;
    case Opcode::f64_max:
        binary_op<double>(stack, numeric::fmax<double>);
        break;
    case Opcode::f64_copysign:
        binary_op<double>(
            stack, [](double a, double b) noexcept { return numeric::fcopysign(a, b); });
        break;

    case Opcode::i32_wrap_i64:
        convert<uint64_t, uint32_t>(stack);
        break;
    case Opcode::i32_trunc_f32_s:
        if (!trunc<float, int32_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i32_trunc_f32_u:
        if (!trunc<float, uint32_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i32_trunc_f64_s:
        if (!trunc<double, int32_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i32_trunc_f64_u:
        if (!trunc<double, uint32_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i64_extend_i32_s:
        convert<int32_t, int64_t>(stack);
        break;
    case Opcode::i64_extend_i32_u:
        convert<uint32_t, uint64_t>(stack);
        break;
    case Opcode::i64_trunc_f32_s:
        if (!trunc<float, int64_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i64_trunc_f32_u:
        if (!trunc<float, uint64_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i64_trunc_f64_s:
        if (!trunc<double, int64_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::i64_trunc_f64_u:
        if (!trunc<double, uint64_t>(stack))
            return trap(state, TrapKind::invalid_conversion_to_integer);
        break;
    case Opcode::f32_convert_i32_s:
        convert<int32_t, float>(stack);
        break;
    case Opcode::f32_convert_i32_u:
        convert<uint32_t, float>(stack);
        break;
    case Opcode::f32_convert_i64_s:
        convert<int64_t, float>(stack);
        break;
    case Opcode::f32_convert_i64_u:
        convert<uint64_t, float>(stack);
        break;
    case Opcode::f32_demote_f64:
        unary_op<double>(stack, numeric::demote);
        break;
    case Opcode::f64_convert_i32_s:
        convert<int32_t, double>(stack);
        break;
    case Opcode::f64_convert_i32_u:
        convert<uint32_t, double>(stack);
        break;
    case Opcode::f64_convert_i64_s:
        convert<int64_t, double>(stack);
        break;
    case Opcode::f64_convert_i64_u:
        convert<uint64_t, double>(stack);
        break;
    case Opcode::f64_promote_f32:
        convert<float, double>(stack);
        break;
    case Opcode::i32_reinterpret_f32:
        reinterpret(stack, ValType::i32);
        break;
    case Opcode::i64_reinterpret_f64:
        reinterpret(stack, ValType::i64);
        break;
    case Opcode::f32_reinterpret_i32:
        reinterpret(stack, ValType::f32);
        break;
    case Opcode::f64_reinterpret_i64:
        reinterpret(stack, ValType::f64);
        break;

    case Opcode::i32_extend8_s:
        unary_op<uint32_t>(stack, numeric::extend_s<uint32_t, int8_t>);
        break;
    case Opcode::i32_extend16_s:
        unary_op<uint32_t>(stack, numeric::extend_s<uint32_t, int16_t>);
        break;
    case Opcode::i64_extend8_s:
        unary_op<uint64_t>(stack, numeric::extend_s<uint64_t, int8_t>);
        break;
    case Opcode::i64_extend16_s:
        unary_op<uint64_t>(stack, numeric::extend_s<uint64_t, int16_t>);
        break;
    case Opcode::i64_extend32_s:
        unary_op<uint64_t>(stack, numeric::extend_s<uint64_t, int32_t>);
        break;

    case Opcode::i32_trunc_sat_f32_s:
        unary_op<float>(stack, numeric::trunc_sat<float, int32_t>);
        break;
    case Opcode::i32_trunc_sat_f32_u:
        unary_op<float>(stack, numeric::trunc_sat<float, uint32_t>);
        break;
    case Opcode::i32_trunc_sat_f64_s:
        unary_op<double>(stack, numeric::trunc_sat<double, int32_t>);
        break;
    case Opcode::i32_trunc_sat_f64_u:
        unary_op<double>(stack, numeric::trunc_sat<double, uint32_t>);
        break;
    case Opcode::i64_trunc_sat_f32_s:
        unary_op<float>(stack, numeric::trunc_sat<float, int64_t>);
        break;
    case Opcode::i64_trunc_sat_f32_u:
        unary_op<float>(stack, numeric::trunc_sat<float, uint64_t>);
        break;
    case Opcode::i64_trunc_sat_f64_s:
        unary_op<double>(stack, numeric::trunc_sat<double, int64_t>);
        break;
    case Opcode::i64_trunc_sat_f64_u:
        unary_op<double>(stack, numeric::trunc_sat<double, uint64_t>);
        break;

    default:
        throw invariant_error{"instruction " +
                              std::to_string(static_cast<uint16_t>(instr.opcode)) +
                              " cannot be executed"};
    }

    return running();
}
}  // namespace

const char* to_string(TrapKind kind) noexcept
{
    switch (kind)
    {
    case TrapKind::unreachable:
        return "unreachable";
    case TrapKind::integer_divide_by_zero:
        return "integer divide by zero";
    case TrapKind::integer_overflow:
        return "integer overflow";
    case TrapKind::invalid_conversion_to_integer:
        return "invalid conversion to integer";
    case TrapKind::memory_out_of_bounds:
        return "out of bounds memory access";
    case TrapKind::table_out_of_bounds:
        return "out of bounds table access";
    case TrapKind::uninitialized_element:
        return "uninitialized element";
    case TrapKind::indirect_call_type_mismatch:
        return "indirect call type mismatch";
    case TrapKind::call_stack_exhausted:
        return "call stack exhausted";
    case TrapKind::host:
        return "host trap";
    }
    return "<unknown>";
}

const char* to_string(StepStatus status) noexcept
{
    switch (status)
    {
    case StepStatus::running:
        return "running";
    case StepStatus::returned:
        return "returned";
    case StepStatus::trapped:
        return "trapped";
    case StepStatus::awaiting_host:
        return "awaiting host";
    }
    return "<unknown>";
}

uint32_t get_label_arity(const Module& module, const BlockType& block_type, LabelKind kind) noexcept
{
    const auto arity = get_block_arity(module, block_type);
    return static_cast<uint32_t>(kind == LabelKind::loop ? arity.inputs : arity.outputs);
}

ExecutionState prepare_invocation(const Store& store, FuncAddr func, std::vector<Value> args)
{
    if (func >= store.funcs.size())
        throw std::invalid_argument{"unknown function address " + std::to_string(func)};

    const auto& callee = store.funcs[func];
    if (callee.is_host())
        throw std::invalid_argument{"host function cannot be invoked"};

    const auto& inputs = callee.type.inputs;
    if (args.size() != inputs.size())
    {
        throw std::invalid_argument{"function expects " + std::to_string(inputs.size()) +
                                    " arguments, " + std::to_string(args.size()) + " provided"};
    }
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type() != inputs[i])
        {
            throw std::invalid_argument{"argument " + std::to_string(i) + " type mismatch: expected " +
                                        to_string(inputs[i]) + ", got " + to_string(args[i].type())};
        }
    }

    ExecutionState state;
    for (const auto& arg : args)
        state.stack.push(arg);
    push_frame(state, callee, func);
    state.entry = func;
    return state;
}

StepResult step(ExecutionState& state, Store& store)
{
    if (state.trap.has_value())
        return {StepStatus::trapped, {}, state.trap, std::nullopt};
    if (state.pending.has_value())
        return awaiting(state);
    if (state.results.has_value())
        return {StepStatus::returned, *state.results, std::nullopt, std::nullopt};
    if (state.frames.empty())
        throw invariant_error{"execution state has no frames"};

    ++state.steps;

    auto& label = state.frames.back().labels.back();
    if (label.instructions == nullptr)
        throw invariant_error{"label has no instruction sequence"};

    if (label.cursor >= label.instructions->size())
        return exit_label(state);

    // The cursor moves past the instruction before it executes: a block instruction leaves
    // the enclosing cursor pointing after itself, and so does a call.
    const auto& instr = (*label.instructions)[label.cursor++];
    return execute(state, store, instr);
}

StepResult run(ExecutionState& state, Store& store, uint64_t max_steps)
{
    StepResult result;
    for (uint64_t i = 0; i < max_steps; ++i)
    {
        result = step(state, store);
        if (result.status != StepStatus::running)
            return result;
    }
    return result;
}

StepResult invoke(Store& store, FuncAddr func, std::vector<Value> args)
{
    auto state = prepare_invocation(store, func, std::move(args));
    return run(state, store);
}

void resume_with_results(ExecutionState& state, const Store& store, std::vector<Value> results)
{
    if (!state.pending.has_value())
        throw std::invalid_argument{"execution is not awaiting a host call"};

    const auto& outputs = get_function_type(store, state.pending->func).outputs;
    if (results.size() != outputs.size())
    {
        throw std::invalid_argument{"host function returns " + std::to_string(outputs.size()) +
                                    " results, " + std::to_string(results.size()) + " provided"};
    }
    for (size_t i = 0; i < results.size(); ++i)
    {
        if (results[i].type() != outputs[i])
            throw std::invalid_argument{"result " + std::to_string(i) + " type mismatch"};
    }

    for (const auto& result : results)
        state.stack.push(result);
    state.pending.reset();
}

void resume_with_trap(ExecutionState& state)
{
    if (!state.pending.has_value())
        throw std::invalid_argument{"execution is not awaiting a host call"};

    state.pending.reset();
    state.trap = TrapKind::host;
}
}  // namespace stasis
