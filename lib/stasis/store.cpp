// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "store.hpp"
#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

namespace stasis
{
namespace
{
template <typename T>
T& get_instance(std::vector<T>& instances, uint32_t addr, const char* kind)
{
    if (addr >= instances.size())
        throw std::out_of_range{std::string{"unknown "} + kind + " address " + std::to_string(addr)};
    return instances[addr];
}

template <typename T>
const T& get_instance(const std::vector<T>& instances, uint32_t addr, const char* kind)
{
    if (addr >= instances.size())
        throw std::out_of_range{std::string{"unknown "} + kind + " address " + std::to_string(addr)};
    return instances[addr];
}

template <typename T>
uint32_t append(std::vector<T>& instances, T instance)
{
    instances.emplace_back(std::move(instance));
    return static_cast<uint32_t>(instances.size() - 1);
}

/// Checks that [offset, offset + size) is within [0, bound) without overflow.
inline bool in_bounds(uint64_t offset, uint64_t size, uint64_t bound) noexcept
{
    return offset + size <= bound;
}
}  // namespace

FuncAddr allocate_host_function(
    Store& store, FuncType type, std::string module_name, std::string name)
{
    FuncInstance func;
    func.type = std::move(type);
    func.host_module = std::move(module_name);
    func.host_name = std::move(name);
    return append(store.funcs, std::move(func));
}

TableAddr allocate_table(Store& store, const Table& type)
{
    if (type.limits.max.has_value() && type.limits.min > *type.limits.max)
        throw instantiate_error{"table minimum must not be greater than maximum"};
    if (type.limits.min > TableElementsLimit)
    {
        throw instantiate_error{
            "cannot exceed hard table limit of " + std::to_string(TableElementsLimit) + " elements"};
    }

    TableInstance table;
    table.elem_type = type.elem_type;
    table.max = type.limits.max;
    table.elements.assign(type.limits.min, Value::null(type.elem_type));
    return append(store.tables, std::move(table));
}

MemAddr allocate_memory(Store& store, const Limits& limits, uint32_t pages_limit)
{
    if (pages_limit > MaxMemoryPagesLimit)
    {
        throw instantiate_error{"hard memory limit cannot exceed " +
                                std::to_string(uint64_t{MaxMemoryPagesLimit} * PageSize) + " bytes"};
    }

    if (limits.min > pages_limit || (limits.max.has_value() && *limits.max > pages_limit))
    {
        throw instantiate_error{"cannot exceed hard memory limit of " +
                                std::to_string(uint64_t{pages_limit} * PageSize) + " bytes"};
    }

    MemoryInstance memory;
    memory.max = limits.max;
    memory.pages_limit = pages_limit;
    // NOTE: fill it with zeroes
    memory.data.assign(memory_pages_to_bytes(limits.min), 0);
    return append(store.mems, std::move(memory));
}

GlobalAddr allocate_global(Store& store, const GlobalType& type, Value value)
{
    if (value.type() != type.value_type)
        throw std::invalid_argument{"global value type does not match the global type"};
    return append(store.globals, GlobalInstance{type, value});
}

const FuncType& get_function_type(const Store& store, FuncAddr addr)
{
    return get_instance(store.funcs, addr, "function").type;
}

std::optional<Value> read_table(const Store& store, TableAddr addr, uint32_t index)
{
    const auto& table = get_instance(store.tables, addr, "table");
    if (index >= table.elements.size())
        return std::nullopt;
    return table.elements[index];
}

bool write_table(Store& store, TableAddr addr, uint32_t index, Value value)
{
    auto& table = get_instance(store.tables, addr, "table");
    if (value.type() != table.elem_type)
        throw std::invalid_argument{"table element type mismatch"};
    if (index >= table.elements.size())
        return false;
    table.elements[index] = value;
    return true;
}

uint32_t table_size(const Store& store, TableAddr addr)
{
    return static_cast<uint32_t>(get_instance(store.tables, addr, "table").elements.size());
}

uint32_t grow_table(TableInstance& table, uint32_t delta, Value init) noexcept
{
    const auto cur_size = static_cast<uint32_t>(table.elements.size());
    const auto new_size = uint64_t{cur_size} + delta;
    const uint64_t limit = table.max.has_value() ? std::min(*table.max, TableElementsLimit) :
                                                   TableElementsLimit;
    if (new_size > limit)
        return static_cast<uint32_t>(-1);

    try
    {
        table.elements.resize(static_cast<size_t>(new_size), init);
        return cur_size;
    }
    catch (const std::bad_alloc&)
    {
        return static_cast<uint32_t>(-1);
    }
    catch (const std::length_error&)
    {
        return static_cast<uint32_t>(-1);
    }
}

std::optional<bytes> read_memory(const Store& store, MemAddr addr, uint32_t offset, uint32_t size)
{
    const auto& memory = get_instance(store.mems, addr, "memory");
    if (!in_bounds(offset, size, memory.data.size()))
        return std::nullopt;
    return bytes(&memory.data[offset], size);
}

bool write_memory(Store& store, MemAddr addr, uint32_t offset, bytes_view data)
{
    auto& memory = get_instance(store.mems, addr, "memory");
    if (!in_bounds(offset, data.size(), memory.data.size()))
        return false;
    if (!data.empty())
        std::memcpy(&memory.data[offset], data.data(), data.size());
    return true;
}

uint32_t memory_size(const Store& store, MemAddr addr)
{
    return get_instance(store.mems, addr, "memory").pages();
}

uint32_t grow_memory(MemoryInstance& memory, uint32_t delta_pages) noexcept
{
    const auto cur_pages = memory.pages();
    const auto new_pages = uint64_t{cur_pages} + delta_pages;
    const uint64_t limit =
        memory.max.has_value() ? std::min(*memory.max, memory.pages_limit) : memory.pages_limit;
    if (new_pages > limit)
        return static_cast<uint32_t>(-1);

    try
    {
        memory.data.resize(static_cast<size_t>(new_pages * PageSize));
        return cur_pages;
    }
    catch (const std::bad_alloc&)
    {
        return static_cast<uint32_t>(-1);
    }
    catch (const std::length_error&)
    {
        return static_cast<uint32_t>(-1);
    }
}

Value read_global(const Store& store, GlobalAddr addr)
{
    return get_instance(store.globals, addr, "global").value;
}

void write_global(Store& store, GlobalAddr addr, Value value)
{
    auto& global = get_instance(store.globals, addr, "global");
    if (!global.type.is_mutable)
        throw std::invalid_argument{"global is immutable"};
    if (value.type() != global.type.value_type)
        throw std::invalid_argument{"global value type mismatch"};
    global.value = value;
}
}  // namespace stasis
