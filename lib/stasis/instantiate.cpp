// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instantiate.hpp"
#include "execute.hpp"
#include <algorithm>
#include <cstring>

namespace stasis
{
namespace
{
void match_limits(uint32_t external_size, const std::optional<uint32_t>& external_max,
    const Limits& module_limits)
{
    if (external_size < module_limits.min)
        throw instantiate_error{"provided import's min is below import's min defined in module"};

    if (!module_limits.max.has_value())
        return;

    if (external_max.has_value() && *external_max <= *module_limits.max)
        return;

    throw instantiate_error{"provided import's max is above import's max defined in module"};
}

void match_import(const Store& store, const Module& module, const Import& import,
    const ExternVal& external, size_t import_idx)
{
    const auto prefix = "import " + std::to_string(import_idx) + " (" + import.module + "." +
                        import.name + ")";

    if (external.kind != import.kind)
    {
        throw instantiate_error{prefix + " requires " + to_string(import.kind) + ", " +
                                to_string(external.kind) + " provided"};
    }

    switch (import.kind)
    {
    case ExternalKind::Function:
        if (external.addr >= store.funcs.size())
            throw instantiate_error{prefix + " has unknown function address"};
        if (store.funcs[external.addr].type != module.typesec[import.function_type_index])
            throw instantiate_error{prefix + " function type doesn't match"};
        break;

    case ExternalKind::Table:
    {
        if (external.addr >= store.tables.size())
            throw instantiate_error{prefix + " has unknown table address"};
        const auto& table = store.tables[external.addr];
        if (table.elem_type != import.table.elem_type)
            throw instantiate_error{prefix + " table element type doesn't match"};
        match_limits(
            static_cast<uint32_t>(table.elements.size()), table.max, import.table.limits);
        break;
    }

    case ExternalKind::Memory:
    {
        if (external.addr >= store.mems.size())
            throw instantiate_error{prefix + " has unknown memory address"};
        const auto& memory = store.mems[external.addr];
        match_limits(memory.pages(), memory.max, import.memory.limits);
        break;
    }

    case ExternalKind::Global:
        if (external.addr >= store.globals.size())
            throw instantiate_error{prefix + " has unknown global address"};
        if (!(store.globals[external.addr].type == import.global))
            throw instantiate_error{prefix + " global type doesn't match"};
        break;
    }
}

/// Evaluates a validated constant expression in the context of the (partially built) instance.
Value eval_constant_expression(
    const ConstantExpression& expr, const Store& store, const ModuleInstance& instance)
{
    std::vector<Value> stack;
    for (const auto& instr : expr.instructions)
    {
        switch (instr.opcode)
        {
        case Opcode::i32_const:
        case Opcode::i64_const:
        case Opcode::f32_const:
        case Opcode::f64_const:
            stack.push_back(instr.value);
            break;
        case Opcode::ref_null:
            stack.push_back(Value::null(instr.type));
            break;
        case Opcode::ref_func:
            stack.push_back(Value::funcref(instance.funcs.at(instr.index)));
            break;
        case Opcode::global_get:
            stack.push_back(store.globals.at(instance.globals.at(instr.index)).value);
            break;
        default:
            throw invariant_error{"constant expression contains non-constant instruction"};
        }
    }

    if (stack.size() != 1)
        throw invariant_error{"constant expression must produce a single value"};
    return stack.back();
}

uint32_t export_address(const ModuleInstance& instance, const Export& export_)
{
    switch (export_.kind)
    {
    case ExternalKind::Function:
        return instance.funcs.at(export_.index);
    case ExternalKind::Table:
        return instance.tables.at(export_.index);
    case ExternalKind::Memory:
        return instance.mems.at(export_.index);
    case ExternalKind::Global:
        return instance.globals.at(export_.index);
    }
    return 0;
}

void apply_element_segments(Store& store, ModuleAddr module_addr)
{
    const auto& instance = store.modules[module_addr];
    const auto& module = instance.module->module();
    for (size_t i = 0; i < module.elementsec.size(); ++i)
    {
        const auto& element = module.elementsec[i];
        auto& elem_instance = store.elems[instance.elems[i]];
        if (element.mode == SegmentMode::active)
        {
            const auto offset =
                eval_constant_expression(element.offset, store, instance).as<uint32_t>();
            auto& table = store.tables[instance.tables[element.table]];
            const auto size = elem_instance.elements.size();
            if (uint64_t{offset} + size > table.elements.size())
                throw instantiate_error{"element segment is out of table bounds"};

            std::copy(elem_instance.elements.begin(), elem_instance.elements.end(),
                table.elements.begin() + offset);
        }

        // Active and declarative segments are dropped once applied.
        if (element.mode != SegmentMode::passive)
            elem_instance.elements.clear();
    }
}

void apply_data_segments(Store& store, ModuleAddr module_addr)
{
    const auto& instance = store.modules[module_addr];
    const auto& module = instance.module->module();
    for (size_t i = 0; i < module.datasec.size(); ++i)
    {
        const auto& data = module.datasec[i];
        if (data.mode != SegmentMode::active)
            continue;

        const auto offset = eval_constant_expression(data.offset, store, instance).as<uint32_t>();
        auto& memory = store.mems[instance.mems[data.memory]].data;
        if (uint64_t{offset} + data.init.size() > memory.size())
            throw instantiate_error{"data segment is out of memory bounds"};

        // NOTE: these segments can overlap
        if (!data.init.empty())
            std::memcpy(&memory[offset], data.init.data(), data.init.size());

        store.datas[instance.datas[i]].data.clear();
    }
}
}  // namespace

ModuleAddr instantiate(Store& store, std::shared_ptr<const ValidatedModule> validated_module,
    const std::vector<ExternVal>& imports, uint32_t memory_pages_limit)
{
    if (validated_module == nullptr)
        throw std::invalid_argument{"module must not be null"};

    const auto& module = validated_module->module();

    if (imports.size() != module.importsec.size())
    {
        throw instantiate_error{"module requires " + std::to_string(module.importsec.size()) +
                                " imports, " + std::to_string(imports.size()) + " provided"};
    }
    for (size_t i = 0; i < imports.size(); ++i)
        match_import(store, module, module.importsec[i], imports[i], i);

    const auto module_addr = static_cast<ModuleAddr>(store.modules.size());

    ModuleInstance instance;
    instance.module = validated_module;

    // Imports take the first indices of their index spaces.
    for (const auto& external : imports)
    {
        switch (external.kind)
        {
        case ExternalKind::Function:
            instance.funcs.push_back(external.addr);
            break;
        case ExternalKind::Table:
            instance.tables.push_back(external.addr);
            break;
        case ExternalKind::Memory:
            instance.mems.push_back(external.addr);
            break;
        case ExternalKind::Global:
            instance.globals.push_back(external.addr);
            break;
        }
    }

    for (const auto& func : module.funcsec)
    {
        FuncInstance func_instance;
        func_instance.type = module.typesec[func.type];
        func_instance.module = module_addr;
        func_instance.code = &func;
        store.funcs.emplace_back(std::move(func_instance));
        instance.funcs.push_back(static_cast<FuncAddr>(store.funcs.size() - 1));
    }

    // Global initializers may refer to imported and previously defined globals.
    for (const auto& global : module.globalsec)
    {
        const auto value = eval_constant_expression(global.expression, store, instance);
        instance.globals.push_back(allocate_global(store, global.type, value));
    }

    for (const auto& table : module.tablesec)
        instance.tables.push_back(allocate_table(store, table));

    for (const auto& memory : module.memorysec)
        instance.mems.push_back(allocate_memory(store, memory.limits, memory_pages_limit));

    for (const auto& element : module.elementsec)
    {
        ElemInstance elem_instance;
        elem_instance.type = element.type;
        elem_instance.elements.reserve(element.init.size());
        for (const auto& init : element.init)
            elem_instance.elements.push_back(eval_constant_expression(init, store, instance));
        store.elems.emplace_back(std::move(elem_instance));
        instance.elems.push_back(static_cast<ElemAddr>(store.elems.size() - 1));
    }

    for (const auto& data : module.datasec)
    {
        store.datas.push_back(DataInstance{data.init});
        instance.datas.push_back(static_cast<DataAddr>(store.datas.size() - 1));
    }

    for (const auto& export_ : module.exportsec)
    {
        instance.exports.push_back(
            ExportInstance{export_.name, ExternVal{export_.kind, export_address(instance, export_)}});
    }

    store.modules.emplace_back(std::move(instance));

    apply_element_segments(store, module_addr);
    apply_data_segments(store, module_addr);

    if (module.startfunc.has_value())
    {
        const auto start_addr = store.modules[module_addr].funcs[*module.startfunc];
        if (store.funcs[start_addr].is_host())
            throw instantiate_error{"start function cannot be a host function"};

        auto state = prepare_invocation(store, start_addr, {});
        const auto result = run(state, store);
        if (result.status == StepStatus::trapped)
        {
            throw instantiate_error{
                std::string{"start function failed to execute: "} + to_string(*result.trap)};
        }
        if (result.status == StepStatus::awaiting_host)
        {
            throw instantiate_error{"start function called host function " +
                                    result.host_call->module + "." + result.host_call->name +
                                    " during instantiation"};
        }
    }

    return module_addr;
}

std::vector<ExternVal> resolve_imports(
    Store& store, const Module& module, const std::vector<ImportedExtern>& provided)
{
    std::vector<ExternVal> externals;
    externals.reserve(module.importsec.size());
    for (const auto& import : module.importsec)
    {
        const auto it = std::find_if(provided.begin(), provided.end(), [&import](const auto& ext) {
            return import.module == ext.module && import.name == ext.name;
        });

        if (it != provided.end())
        {
            externals.push_back(it->value);
            continue;
        }

        if (import.kind != ExternalKind::Function)
        {
            throw instantiate_error{std::string{"imported "} + to_string(import.kind) + " " +
                                    import.module + "." + import.name + " is required"};
        }

        const auto& type = module.typesec.at(import.function_type_index);
        externals.push_back(ExternVal{ExternalKind::Function,
            allocate_host_function(store, type, import.module, import.name)});
    }
    return externals;
}

std::optional<ExternVal> find_export(const Store& store, ModuleAddr module, std::string_view name)
{
    const auto& exports = store.modules.at(module).exports;
    const auto it = std::find_if(exports.begin(), exports.end(),
        [name](const auto& export_) { return export_.name == name; });

    return (it != exports.end() ? std::make_optional(it->value) : std::nullopt);
}

std::optional<FuncAddr> find_exported_function(
    const Store& store, ModuleAddr module, std::string_view name)
{
    const auto external = find_export(store, module, name);
    if (!external.has_value() || external->kind != ExternalKind::Function)
        return std::nullopt;
    return external->addr;
}
}  // namespace stasis
