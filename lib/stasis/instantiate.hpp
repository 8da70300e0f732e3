// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "exceptions.hpp"
#include "limits.hpp"
#include "module.hpp"
#include "store.hpp"
#include "validate.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stasis
{
/// Instantiates a validated module into the Store.
///
/// Imports are matched in the module's import order. Module items are allocated after them,
/// active element and data segments are applied in order and the start function is run.
///
/// @param  store               The Store to allocate the instances in.
/// @param  module              The validated module. The instance shares its ownership.
/// @param  imports             The externs provided for the module imports, in import order.
/// @param  memory_pages_limit  Hard limit for memory growth in pages.
/// @return                     The address of the new module instance.
/// @throws instantiate_error   On import mismatch, a segment out of bounds or a start function
///                             trap. Store modifications made before the failure stay.
ModuleAddr instantiate(Store& store, std::shared_ptr<const ValidatedModule> module,
    const std::vector<ExternVal>& imports = {},
    uint32_t memory_pages_limit = DefaultMemoryPagesLimit);

/// The extern provided for an import, identified by module and import name.
struct ImportedExtern
{
    std::string module;
    std::string name;
    ExternVal value;
};

/// Creates the list of externs ready to be passed to instantiate().
///
/// @a provided may be in any order. Function imports missing in it are resolved to newly
/// allocated host functions: calling them suspends the execution with a pending host call.
/// @throws instantiate_error if a table, memory or global import is not provided.
std::vector<ExternVal> resolve_imports(
    Store& store, const Module& module, const std::vector<ImportedExtern>& provided);

/// Find export by name.
std::optional<ExternVal> find_export(const Store& store, ModuleAddr module, std::string_view name);

/// Find exported function by name.
std::optional<FuncAddr> find_exported_function(
    const Store& store, ModuleAddr module, std::string_view name);
}  // namespace stasis
