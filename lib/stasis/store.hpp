// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include "limits.hpp"
#include "types.hpp"
#include "validate.hpp"
#include "value.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stasis
{
using ModuleAddr = uint32_t;
using TableAddr = uint32_t;
using MemAddr = uint32_t;
using GlobalAddr = uint32_t;
using ElemAddr = uint32_t;
using DataAddr = uint32_t;

/// The function instance: either a function defined by a module instance or a host function.
struct FuncInstance
{
    FuncType type;

    /// The module instance the function belongs to. Meaningless for host functions.
    ModuleAddr module = 0;

    /// The code of a module function, nullptr for a host function.
    /// Points into the module kept alive by the owning ModuleInstance.
    const Func* code = nullptr;

    /// The import names a host function was allocated for.
    std::string host_module;
    std::string host_name;

    bool is_host() const noexcept { return code == nullptr; }
};

struct TableInstance
{
    ValType elem_type = ValType::funcref;

    /// The maximum declared by the table type, if any.
    std::optional<uint32_t> max;

    std::vector<Value> elements;
};

struct MemoryInstance
{
    /// The maximum declared by the memory type, if any.
    std::optional<uint32_t> max;

    /// Hard limit for memory growth in pages, independent of the declared maximum.
    uint32_t pages_limit = DefaultMemoryPagesLimit;

    bytes data;

    uint32_t pages() const noexcept { return static_cast<uint32_t>(data.size() / PageSize); }
};

struct GlobalInstance
{
    GlobalType type;
    Value value;
};

/// Element segment instance. Empty after elem.drop.
struct ElemInstance
{
    ValType type = ValType::funcref;
    std::vector<Value> elements;
};

/// Data segment instance. Empty after data.drop.
struct DataInstance
{
    bytes data;
};

/// The exported entity: its kind and Store address.
struct ExternVal
{
    ExternalKind kind = ExternalKind::Function;
    uint32_t addr = 0;
};

struct ExportInstance
{
    std::string name;
    ExternVal value;
};

/// The module instance: index spaces of the module resolved to Store addresses.
/// Imported items come first in every index space.
struct ModuleInstance
{
    std::shared_ptr<const ValidatedModule> module;

    std::vector<FuncAddr> funcs;
    std::vector<TableAddr> tables;
    std::vector<MemAddr> mems;
    std::vector<GlobalAddr> globals;
    std::vector<ElemAddr> elems;
    std::vector<DataAddr> datas;
    std::vector<ExportInstance> exports;
};

/// The Store: all runtime instances, addressed by their positions in the append-only vectors.
struct Store
{
    std::vector<FuncInstance> funcs;
    std::vector<TableInstance> tables;
    std::vector<MemoryInstance> mems;
    std::vector<GlobalInstance> globals;
    std::vector<ElemInstance> elems;
    std::vector<DataInstance> datas;
    std::vector<ModuleInstance> modules;
};

/// Allocates a host function instance. Calls of it suspend execution with a pending host call.
FuncAddr allocate_host_function(
    Store& store, FuncType type, std::string module_name, std::string name);

/// Allocates a table filled with null references.
/// Throws instantiate_error if the limits are invalid.
TableAddr allocate_table(Store& store, const Table& type);

/// Allocates a zero-filled memory.
/// Throws instantiate_error if the limits exceed the hard `pages_limit`.
MemAddr allocate_memory(
    Store& store, const Limits& limits, uint32_t pages_limit = DefaultMemoryPagesLimit);

/// Allocates a global with the given value. Throws std::invalid_argument on value type mismatch.
GlobalAddr allocate_global(Store& store, const GlobalType& type, Value value);

/// Returns the type of the function. Throws std::out_of_range for unknown address.
const FuncType& get_function_type(const Store& store, FuncAddr addr);

/// Reads a table element. Returns std::nullopt if the index is out of the table bounds.
std::optional<Value> read_table(const Store& store, TableAddr addr, uint32_t index);

/// Writes a table element. Returns false if the index is out of the table bounds.
/// Throws std::invalid_argument if the value type is not the table element type.
bool write_table(Store& store, TableAddr addr, uint32_t index, Value value);

uint32_t table_size(const Store& store, TableAddr addr);

/// Grows the table by `delta` elements initialized to `init`.
/// Returns the previous size or -1 if the table cannot grow.
uint32_t grow_table(TableInstance& table, uint32_t delta, Value init) noexcept;

/// Reads `size` bytes of the memory at `offset`. Returns std::nullopt if out of bounds.
std::optional<bytes> read_memory(const Store& store, MemAddr addr, uint32_t offset, uint32_t size);

/// Writes bytes into the memory at `offset`. Returns false if out of bounds.
bool write_memory(Store& store, MemAddr addr, uint32_t offset, bytes_view data);

/// Returns the memory size in pages.
uint32_t memory_size(const Store& store, MemAddr addr);

/// Grows the memory by `delta_pages`. Returns the previous size in pages or -1 if the memory
/// cannot grow.
uint32_t grow_memory(MemoryInstance& memory, uint32_t delta_pages) noexcept;

Value read_global(const Store& store, GlobalAddr addr);

/// Writes a mutable global. Throws std::invalid_argument for an immutable global or
/// a value of another type.
void write_global(Store& store, GlobalAddr addr, Value value);
}  // namespace stasis
