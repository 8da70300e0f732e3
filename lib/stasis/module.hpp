// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "types.hpp"
#include <cassert>
#include <optional>
#include <vector>

namespace stasis
{
/// The decoded module. Not validated: indices kept in it may be out of their index spaces.
struct Module
{
    // https://webassembly.github.io/spec/core/binary/modules.html#type-section
    std::vector<FuncType> typesec;
    // https://webassembly.github.io/spec/core/binary/modules.html#import-section
    std::vector<Import> importsec;
    // https://webassembly.github.io/spec/core/binary/modules.html#function-section
    // paired with https://webassembly.github.io/spec/core/binary/modules.html#code-section
    std::vector<Func> funcsec;
    // https://webassembly.github.io/spec/core/binary/modules.html#table-section
    std::vector<Table> tablesec;
    // https://webassembly.github.io/spec/core/binary/modules.html#memory-section
    std::vector<Memory> memorysec;
    // https://webassembly.github.io/spec/core/binary/modules.html#global-section
    std::vector<Global> globalsec;
    // https://webassembly.github.io/spec/core/binary/modules.html#export-section
    std::vector<Export> exportsec;
    // https://webassembly.github.io/spec/core/binary/modules.html#start-section
    std::optional<FuncIdx> startfunc;
    // https://webassembly.github.io/spec/core/binary/modules.html#element-section
    std::vector<Element> elementsec;
    // https://webassembly.github.io/spec/core/binary/modules.html#data-count-section
    std::optional<uint32_t> datacount;
    // https://webassembly.github.io/spec/core/binary/modules.html#data-section
    std::vector<Data> datasec;
    // https://webassembly.github.io/spec/core/binary/modules.html#custom-section
    std::vector<CustomSection> customsec;

    // Type indices of functions defined in import section
    std::vector<TypeIdx> imported_function_types;
    // Types of tables defined in import section
    std::vector<Table> imported_table_types;
    // Types of memories defined in import section
    std::vector<Memory> imported_memory_types;
    // Types of globals defined in import section
    std::vector<GlobalType> imported_global_types;

    /// The hash of the module binary, identifies the code snapshots refer to.
    uint64_t fingerprint = 0;

    size_t get_function_count() const noexcept
    {
        return imported_function_types.size() + funcsec.size();
    }

    size_t get_table_count() const noexcept
    {
        return imported_table_types.size() + tablesec.size();
    }

    size_t get_memory_count() const noexcept
    {
        return imported_memory_types.size() + memorysec.size();
    }

    size_t get_global_count() const noexcept
    {
        return imported_global_types.size() + globalsec.size();
    }

    TypeIdx get_function_type_index(FuncIdx idx) const noexcept
    {
        assert(idx < get_function_count());
        return idx < imported_function_types.size() ?
                   imported_function_types[idx] :
                   funcsec[idx - imported_function_types.size()].type;
    }

    /// Requires the module to be validated.
    const FuncType& get_function_type(FuncIdx idx) const noexcept
    {
        const auto type_idx = get_function_type_index(idx);
        assert(type_idx < typesec.size());
        return typesec[type_idx];
    }

    /// Returns the code of a function defined by the module, nullptr for imported functions.
    const Func* get_function(FuncIdx idx) const noexcept
    {
        assert(idx < get_function_count());
        return idx < imported_function_types.size() ?
                   nullptr :
                   &funcsec[idx - imported_function_types.size()];
    }

    const Table& get_table(TableIdx idx) const noexcept
    {
        assert(idx < get_table_count());
        return idx < imported_table_types.size() ? imported_table_types[idx] :
                                                   tablesec[idx - imported_table_types.size()];
    }

    const Memory& get_memory(MemIdx idx) const noexcept
    {
        assert(idx < get_memory_count());
        return idx < imported_memory_types.size() ? imported_memory_types[idx] :
                                                    memorysec[idx - imported_memory_types.size()];
    }

    const GlobalType& get_global_type(GlobalIdx idx) const noexcept
    {
        assert(idx < get_global_count());
        return idx < imported_global_types.size() ?
                   imported_global_types[idx] :
                   globalsec[idx - imported_global_types.size()].type;
    }
};
}  // namespace stasis
