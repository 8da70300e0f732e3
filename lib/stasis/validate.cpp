// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "validate.hpp"
#include "instructions.hpp"
#include "limits.hpp"
#include "stack.hpp"
#include <limits>
#include <string_view>
#include <unordered_set>

namespace stasis
{
namespace
{
enum class OperandStackType : uint8_t
{
    Unknown = 0,
    i32 = static_cast<uint8_t>(ValType::i32),
    i64 = static_cast<uint8_t>(ValType::i64),
    f32 = static_cast<uint8_t>(ValType::f32),
    f64 = static_cast<uint8_t>(ValType::f64),
    funcref = static_cast<uint8_t>(ValType::funcref),
    externref = static_cast<uint8_t>(ValType::externref),
};

inline OperandStackType from_valtype(ValType val_type) noexcept
{
    return static_cast<OperandStackType>(val_type);
}

inline bool type_matches(OperandStackType actual_type, OperandStackType expected_type) noexcept
{
    if (expected_type == OperandStackType::Unknown || actual_type == OperandStackType::Unknown)
        return true;

    return expected_type == actual_type;
}

inline bool is_reftype(OperandStackType type) noexcept
{
    return type == OperandStackType::funcref || type == OperandStackType::externref;
}

inline const char* to_string(OperandStackType type) noexcept
{
    return type == OperandStackType::Unknown ? "unknown" : to_string(static_cast<ValType>(type));
}

/// The control frame to keep information about labels and blocks as defined in
/// Wasm Validation Algorithm https://webassembly.github.io/spec/core/appendix/algorithm.html.
struct ControlFrame
{
    /// The instruction that created the label.
    Opcode instruction = Opcode::block;

    std::vector<ValType> inputs;
    std::vector<ValType> outputs;

    /// The operand stack height at the frame start (excluding its inputs).
    size_t parent_stack_height = 0;

    /// Whether the remainder of the block is unreachable (used to handle stack-polymorphic typing
    /// after branches).
    bool unreachable = false;
};

/// The module-wide data needed to validate code and constant expressions.
struct ModuleContext
{
    const Module& module;

    /// Functions that may be referenced by ref.func in function bodies.
    std::unordered_set<FuncIdx> declared_refs;
};

[[noreturn]] void fail(StasisErrorCode code, const std::string& message, size_t offset,
    std::optional<FuncIdx> func_idx = std::nullopt)
{
    throw validation_error{code, message, func_idx, offset};
}

void validate_limits(const Limits& limits, uint32_t upper_bound, const char* size_kind,
    size_t offset)
{
    if (limits.min > upper_bound || (limits.max.has_value() && *limits.max > upper_bound))
    {
        fail(STASIS_ERROR_INVALID,
            std::string{size_kind} + " size must be at most " + std::to_string(upper_bound),
            offset);
    }
    if (limits.max.has_value() && limits.min > *limits.max)
        fail(STASIS_ERROR_INVALID, "size minimum must not be greater than maximum", offset);
}

/// Validates the constant expression producing a value of the `expected_type`.
///
/// Allowed instructions: *.const, ref.null, ref.func and global.get of an immutable global with
/// index lower than `visible_global_count`.
void validate_constant_expression(const ConstantExpression& expr, const ModuleContext& ctx,
    ValType expected_type, size_t visible_global_count)
{
    const auto& module = ctx.module;
    std::vector<ValType> stack;

    for (const auto& instr : expr.instructions)
    {
        const auto offset = instr.location.offset;
        switch (instr.opcode)
        {
        case Opcode::i32_const:
        case Opcode::i64_const:
        case Opcode::f32_const:
        case Opcode::f64_const:
            stack.push_back(instr.value.type());
            break;

        case Opcode::ref_null:
            stack.push_back(instr.type);
            break;

        case Opcode::ref_func:
            if (instr.index >= module.get_function_count())
            {
                fail(STASIS_ERROR_UNKNOWN_INDEX,
                    "unknown function " + std::to_string(instr.index), offset);
            }
            stack.push_back(ValType::funcref);
            break;

        case Opcode::global_get:
        {
            if (instr.index >= visible_global_count)
            {
                fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown global " + std::to_string(instr.index),
                    offset);
            }
            const auto& global_type = module.get_global_type(instr.index);
            if (global_type.is_mutable)
            {
                fail(STASIS_ERROR_INVALID,
                    "constant expression required: global.get of a mutable global", offset);
            }
            stack.push_back(global_type.value_type);
            break;
        }

        default:
            fail(STASIS_ERROR_INVALID, "constant expression required", offset);
        }
    }

    if (stack.size() != 1 || stack.front() != expected_type)
    {
        fail(STASIS_ERROR_TYPE_MISMATCH,
            std::string{"type mismatch: constant expression must produce "} +
                to_string(expected_type),
            expr.location.offset);
    }
}

/// Types a single function body.
class FunctionValidator
{
    const ModuleContext& m_ctx;
    const Module& m_module;
    const FuncIdx m_func_idx;
    const FuncType& m_func_type;

    /// Parameters followed by declared locals.
    std::vector<ValType> m_locals;

    /// The stack of control frames allowing to distinguish between block/if/else and label
    /// instructions as defined in Wasm Validation Algorithm.
    Stack<ControlFrame> m_control_stack;

    Stack<OperandStackType> m_operand_stack;

    /// The offset of the instruction being validated, for error reporting.
    size_t m_offset = 0;

public:
    FunctionValidator(const ModuleContext& ctx, FuncIdx func_idx, const Func& func)
      : m_ctx{ctx},
        m_module{ctx.module},
        m_func_idx{func_idx},
        m_func_type{ctx.module.typesec[func.type]},
        m_offset{func.location.offset}
    {
        m_locals = m_func_type.inputs;
        m_locals.insert(m_locals.end(), func.locals.begin(), func.locals.end());
    }

    void validate_body(const std::vector<Instr>& body)
    {
        // The function's implicit block.
        push_control(Opcode::block, {}, m_func_type.outputs);
        validate_sequence(body);
        pop_control();
    }

private:
    [[noreturn]] void fail(StasisErrorCode code, const std::string& message) const
    {
        stasis::fail(code, message, m_offset, m_func_idx);
    }

    void push_operand(OperandStackType type) { m_operand_stack.push(type); }

    void push_operand(ValType type) { m_operand_stack.push(from_valtype(type)); }

    void push_operands(const std::vector<ValType>& types)
    {
        for (const auto type : types)
            push_operand(type);
    }

    OperandStackType pop_operand()
    {
        const auto& frame = m_control_stack.top();
        if (m_operand_stack.size() == frame.parent_stack_height)
        {
            // Stack is polymorphic after unreachable instruction.
            if (frame.unreachable)
                return OperandStackType::Unknown;
            fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: stack underflow");
        }
        return m_operand_stack.pop();
    }

    OperandStackType pop_operand(OperandStackType expected_type)
    {
        const auto actual_type = pop_operand();
        if (!type_matches(actual_type, expected_type))
        {
            fail(STASIS_ERROR_TYPE_MISMATCH, std::string{"type mismatch: expected "} +
                                                 to_string(expected_type) + ", got " +
                                                 to_string(actual_type));
        }
        return actual_type;
    }

    OperandStackType pop_operand(ValType expected_type)
    {
        return pop_operand(from_valtype(expected_type));
    }

    /// Pops the operands of the given types. Returns the actual types in the stack order.
    std::vector<OperandStackType> pop_operands(const std::vector<ValType>& expected_types)
    {
        std::vector<OperandStackType> actual_types(expected_types.size());
        for (size_t i = expected_types.size(); i > 0; --i)
            actual_types[i - 1] = pop_operand(expected_types[i - 1]);
        return actual_types;
    }

    void push_control(Opcode instruction, std::vector<ValType> inputs, std::vector<ValType> outputs)
    {
        const auto height = m_operand_stack.size();
        push_operands(inputs);
        m_control_stack.emplace(
            ControlFrame{instruction, std::move(inputs), std::move(outputs), height, false});
    }

    /// Checks the block results and removes the frame. Returns the block's output types.
    std::vector<ValType> pop_control()
    {
        const auto& frame = m_control_stack.top();
        pop_operands(frame.outputs);
        if (m_operand_stack.size() != frame.parent_stack_height)
            fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: too many values at the end of block");
        return m_control_stack.pop().outputs;
    }

    void mark_frame_unreachable() noexcept
    {
        auto& frame = m_control_stack.top();
        frame.unreachable = true;
        m_operand_stack.shrink(frame.parent_stack_height);
    }

    /// The types a branch to the label must provide: loop branches go to the loop start.
    const std::vector<ValType>& get_label_types(LabelIdx label_idx)
    {
        if (label_idx >= m_control_stack.size())
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown label " + std::to_string(label_idx));

        const auto& frame = m_control_stack[label_idx];
        return frame.instruction == Opcode::loop ? frame.inputs : frame.outputs;
    }

    FuncType get_block_type(const BlockType& block_type)
    {
        switch (block_type.kind)
        {
        case BlockType::Kind::empty:
            return {};
        case BlockType::Kind::value:
            return {{}, {block_type.value_type}};
        case BlockType::Kind::type_index:
            if (block_type.type_index >= m_module.typesec.size())
            {
                fail(STASIS_ERROR_UNKNOWN_INDEX,
                    "unknown type " + std::to_string(block_type.type_index));
            }
            return m_module.typesec[block_type.type_index];
        }
        return {};
    }

    ValType get_local_type(LocalIdx idx)
    {
        if (idx >= m_locals.size())
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown local " + std::to_string(idx));
        return m_locals[idx];
    }

    const GlobalType& get_global_type(GlobalIdx idx)
    {
        if (idx >= m_module.get_global_count())
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown global " + std::to_string(idx));
        return m_module.get_global_type(idx);
    }

    const Table& get_table(TableIdx idx)
    {
        if (idx >= m_module.get_table_count())
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown table " + std::to_string(idx));
        return m_module.get_table(idx);
    }

    const Element& get_element(ElemIdx idx)
    {
        if (idx >= m_module.elementsec.size())
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown elem segment " + std::to_string(idx));
        return m_module.elementsec[idx];
    }

    void check_memory()
    {
        if (m_module.get_memory_count() == 0)
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown memory 0");
    }

    void check_data(DataIdx idx)
    {
        if (!m_module.datacount.has_value())
            fail(STASIS_ERROR_INVALID, "data count section required");
        if (idx >= *m_module.datacount)
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown data segment " + std::to_string(idx));
    }

    void validate_sequence(const std::vector<Instr>& instructions)
    {
        for (const auto& instr : instructions)
            validate_instruction(instr);
    }

    void validate_instruction(const Instr& instr)
    {
        m_offset = instr.location.offset;

        switch (instr.opcode)
        {
        case Opcode::unreachable:
            mark_frame_unreachable();
            break;

        case Opcode::block:
        case Opcode::loop:
        {
            auto type = get_block_type(instr.block_type);
            pop_operands(type.inputs);
            push_control(instr.opcode, std::move(type.inputs), std::move(type.outputs));
            validate_sequence(instr.body);
            m_offset = instr.location.offset;
            push_operands(pop_control());
            break;
        }

        case Opcode::if_:
        {
            const auto type = get_block_type(instr.block_type);
            pop_operand(ValType::i32);
            pop_operands(type.inputs);

            push_control(Opcode::if_, type.inputs, type.outputs);
            validate_sequence(instr.body);
            m_offset = instr.location.offset;
            pop_control();

            // A missing else branch is validated as an empty one: it passes the inputs through.
            push_control(Opcode::else_, type.inputs, type.outputs);
            validate_sequence(instr.else_body);
            m_offset = instr.location.offset;
            push_operands(pop_control());
            break;
        }

        case Opcode::br:
            pop_operands(get_label_types(instr.index));
            mark_frame_unreachable();
            break;

        case Opcode::br_if:
        {
            pop_operand(ValType::i32);
            const auto label_types = get_label_types(instr.index);
            pop_operands(label_types);
            push_operands(label_types);
            break;
        }

        case Opcode::br_table:
        {
            pop_operand(ValType::i32);
            const auto default_types = get_label_types(instr.index);
            for (const auto label_idx : instr.targets)
            {
                const auto label_types = get_label_types(label_idx);
                if (label_types.size() != default_types.size())
                    fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: br_table arity mismatch");
                for (const auto actual_type : pop_operands(label_types))
                    push_operand(actual_type);
            }
            pop_operands(default_types);
            mark_frame_unreachable();
            break;
        }

        case Opcode::return_:
            pop_operands(m_func_type.outputs);
            mark_frame_unreachable();
            break;

        case Opcode::call:
        {
            if (instr.index >= m_module.get_function_count())
                fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown function " + std::to_string(instr.index));
            const auto& type = m_module.get_function_type(instr.index);
            pop_operands(type.inputs);
            push_operands(type.outputs);
            break;
        }

        case Opcode::call_indirect:
        {
            const auto& table = get_table(instr.index2);
            if (table.elem_type != ValType::funcref)
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: call_indirect requires funcref table");
            if (instr.index >= m_module.typesec.size())
                fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown type " + std::to_string(instr.index));
            const auto& type = m_module.typesec[instr.index];
            pop_operand(ValType::i32);
            pop_operands(type.inputs);
            push_operands(type.outputs);
            break;
        }

        case Opcode::drop:
            pop_operand();
            break;

        case Opcode::select:
        {
            pop_operand(ValType::i32);
            const auto type1 = pop_operand();
            const auto type2 = pop_operand();
            if (is_reftype(type1) || is_reftype(type2))
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: select requires numeric operands");
            if (!type_matches(type1, type2))
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: select operands differ");
            push_operand(type1 == OperandStackType::Unknown ? type2 : type1);
            break;
        }

        case Opcode::select_t:
            if (instr.index != 1)
                fail(STASIS_ERROR_INVALID, "invalid result arity of select");
            pop_operand(ValType::i32);
            pop_operand(instr.type);
            pop_operand(instr.type);
            push_operand(instr.type);
            break;

        case Opcode::local_get:
            push_operand(get_local_type(instr.index));
            break;

        case Opcode::local_set:
            pop_operand(get_local_type(instr.index));
            break;

        case Opcode::local_tee:
        {
            const auto type = get_local_type(instr.index);
            pop_operand(type);
            push_operand(type);
            break;
        }

        case Opcode::global_get:
            push_operand(get_global_type(instr.index).value_type);
            break;

        case Opcode::global_set:
        {
            const auto& type = get_global_type(instr.index);
            if (!type.is_mutable)
                fail(STASIS_ERROR_INVALID, "global is immutable " + std::to_string(instr.index));
            pop_operand(type.value_type);
            break;
        }

        case Opcode::table_get:
        {
            const auto elem_type = get_table(instr.index).elem_type;
            pop_operand(ValType::i32);
            push_operand(elem_type);
            break;
        }

        case Opcode::table_set:
        {
            const auto elem_type = get_table(instr.index).elem_type;
            pop_operand(elem_type);
            pop_operand(ValType::i32);
            break;
        }

        case Opcode::table_size:
            get_table(instr.index);
            push_operand(ValType::i32);
            break;

        case Opcode::table_grow:
        {
            const auto elem_type = get_table(instr.index).elem_type;
            pop_operand(ValType::i32);
            pop_operand(elem_type);
            push_operand(ValType::i32);
            break;
        }

        case Opcode::table_fill:
        {
            const auto elem_type = get_table(instr.index).elem_type;
            pop_operand(ValType::i32);
            pop_operand(elem_type);
            pop_operand(ValType::i32);
            break;
        }

        case Opcode::table_copy:
            if (get_table(instr.index).elem_type != get_table(instr.index2).elem_type)
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: table.copy element types differ");
            break;

        case Opcode::table_init:
            if (get_element(instr.index).type != get_table(instr.index2).elem_type)
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: table.init element types differ");
            break;

        case Opcode::elem_drop:
            get_element(instr.index);
            break;

        case Opcode::memory_size:
        case Opcode::memory_grow:
        case Opcode::memory_copy:
        case Opcode::memory_fill:
            check_memory();
            break;

        case Opcode::memory_init:
            check_memory();
            check_data(instr.index);
            break;

        case Opcode::data_drop:
            check_data(instr.index);
            break;

        case Opcode::ref_null:
            push_operand(instr.type);
            break;

        case Opcode::ref_is_null:
        {
            const auto type = pop_operand();
            if (type != OperandStackType::Unknown && !is_reftype(type))
                fail(STASIS_ERROR_TYPE_MISMATCH, "type mismatch: reference expected");
            push_operand(ValType::i32);
            break;
        }

        case Opcode::ref_func:
            if (instr.index >= m_module.get_function_count())
                fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown function " + std::to_string(instr.index));
            if (m_ctx.declared_refs.count(instr.index) == 0)
                fail(STASIS_ERROR_INVALID, "undeclared function reference");
            push_operand(ValType::funcref);
            break;

        default:
            if (const auto max_align = get_instruction_max_align(instr.opcode))
            {
                check_memory();
                if (instr.index > *max_align)
                    fail(STASIS_ERROR_INVALID, "alignment must not be larger than natural");
            }
            break;
        }

        if (const auto* type = get_instruction_type(instr.opcode); type != nullptr)
        {
            pop_operands(type->inputs);
            push_operands(type->outputs);
        }
    }
};

void collect_declared_refs(const ConstantExpression& expr, std::unordered_set<FuncIdx>& refs)
{
    for (const auto& instr : expr.instructions)
    {
        if (instr.opcode == Opcode::ref_func)
            refs.insert(instr.index);
    }
}

void validate_module(const Module& module)
{
    for (const auto& import : module.importsec)
    {
        if (import.kind == ExternalKind::Function &&
            import.function_type_index >= module.typesec.size())
        {
            fail(STASIS_ERROR_UNKNOWN_INDEX,
                "unknown type " + std::to_string(import.function_type_index),
                import.location.offset);
        }
        if (import.kind == ExternalKind::Table)
            validate_limits(import.table.limits, std::numeric_limits<uint32_t>::max(), "table",
                import.location.offset);
        if (import.kind == ExternalKind::Memory)
            validate_limits(import.memory.limits, MemoryPagesValidationLimit, "memory",
                import.location.offset);
    }

    for (const auto& func : module.funcsec)
    {
        if (func.type >= module.typesec.size())
        {
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown type " + std::to_string(func.type),
                func.location.offset);
        }
    }

    for (const auto& table : module.tablesec)
        validate_limits(table.limits, std::numeric_limits<uint32_t>::max(), "table", 0);

    if (module.get_memory_count() > 1)
        fail(STASIS_ERROR_INVALID, "multiple memories", 0);
    for (const auto& memory : module.memorysec)
        validate_limits(memory.limits, MemoryPagesValidationLimit, "memory", 0);

    ModuleContext ctx{module, {}};

    const auto imported_global_count = module.imported_global_types.size();
    for (size_t i = 0; i < module.globalsec.size(); ++i)
    {
        const auto& global = module.globalsec[i];
        validate_constant_expression(
            global.expression, ctx, global.type.value_type, imported_global_count + i);
        collect_declared_refs(global.expression, ctx.declared_refs);
    }

    const auto global_count = module.get_global_count();
    for (const auto& element : module.elementsec)
    {
        if (element.mode == SegmentMode::active)
        {
            if (element.table >= module.get_table_count())
            {
                fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown table " + std::to_string(element.table),
                    element.location.offset);
            }
            if (module.get_table(element.table).elem_type != element.type)
            {
                fail(STASIS_ERROR_TYPE_MISMATCH,
                    "type mismatch: element segment type differs from table type",
                    element.location.offset);
            }
            validate_constant_expression(element.offset, ctx, ValType::i32, global_count);
        }
        for (const auto& init : element.init)
        {
            validate_constant_expression(init, ctx, element.type, global_count);
            collect_declared_refs(init, ctx.declared_refs);
        }
    }

    for (const auto& data : module.datasec)
    {
        if (data.mode != SegmentMode::active)
            continue;
        if (data.memory >= module.get_memory_count())
        {
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown memory " + std::to_string(data.memory),
                data.location.offset);
        }
        validate_constant_expression(data.offset, ctx, ValType::i32, global_count);
    }

    const auto function_count = module.get_function_count();
    if (module.startfunc.has_value())
    {
        if (*module.startfunc >= function_count)
            fail(STASIS_ERROR_UNKNOWN_INDEX, "unknown function " + std::to_string(*module.startfunc), 0);

        const auto& type = module.get_function_type(*module.startfunc);
        if (!type.inputs.empty() || !type.outputs.empty())
            fail(STASIS_ERROR_INVALID, "start function must have type [] -> []", 0);
    }

    std::unordered_set<std::string_view> export_names;
    for (const auto& export_ : module.exportsec)
    {
        size_t index_space_size = 0;
        switch (export_.kind)
        {
        case ExternalKind::Function:
            index_space_size = function_count;
            break;
        case ExternalKind::Table:
            index_space_size = module.get_table_count();
            break;
        case ExternalKind::Memory:
            index_space_size = module.get_memory_count();
            break;
        case ExternalKind::Global:
            index_space_size = global_count;
            break;
        }
        if (export_.index >= index_space_size)
        {
            fail(STASIS_ERROR_UNKNOWN_INDEX,
                std::string{"unknown "} + to_string(export_.kind) + " " +
                    std::to_string(export_.index),
                export_.location.offset);
        }
        if (!export_names.emplace(export_.name).second)
            fail(STASIS_ERROR_INVALID, "duplicate export name " + export_.name,
                export_.location.offset);

        if (export_.kind == ExternalKind::Function)
            ctx.declared_refs.insert(export_.index);
    }

    const auto imported_function_count = static_cast<FuncIdx>(module.imported_function_types.size());
    for (size_t i = 0; i < module.funcsec.size(); ++i)
    {
        const auto& func = module.funcsec[i];
        FunctionValidator validator{ctx, imported_function_count + static_cast<FuncIdx>(i), func};
        validator.validate_body(func.body);
    }
}
}  // namespace

std::unique_ptr<const ValidatedModule> validate(std::unique_ptr<const Module> module)
{
    if (module == nullptr)
        throw std::invalid_argument{"module must not be null"};

    validate_module(*module);
    return std::unique_ptr<const ValidatedModule>{new ValidatedModule{std::move(module)}};
}
}  // namespace stasis
