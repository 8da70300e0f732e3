// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace stasis
{
/// The page size as defined by the WebAssembly specification.
constexpr uint32_t PageSize = 65536;

/// Convert memory size in pages to size in bytes.
inline constexpr uint64_t memory_pages_to_bytes(uint32_t pages) noexcept
{
    return uint64_t{pages} * PageSize;
}

/// The maximum number of pages a memory type may declare. A module declaring more is invalid.
constexpr uint32_t MemoryPagesValidationLimit = (4 * 1024 * 1024 * 1024ULL) / PageSize;
static_assert(MemoryPagesValidationLimit == 65536);

/// The maximum memory page limit that can be allocated.
/// For 32-bit build environment only max size_t value can be allocated (4 GB - 1 byte).
constexpr auto MaxMemoryBytesLimit =
    std::min<uint64_t>(4 * 1024 * 1024 * 1024ULL, std::numeric_limits<size_t>::max());
constexpr uint32_t MaxMemoryPagesLimit = MaxMemoryBytesLimit / PageSize;

/// The default hard limit of the memory size (256MB) as number of pages.
constexpr uint32_t DefaultMemoryPagesLimit = (256 * 1024 * 1024ULL) / PageSize;
static_assert(DefaultMemoryPagesLimit == 4096);

/// The hard limit of the number of elements in a table. Growing a table above it fails.
constexpr uint32_t TableElementsLimit = 10'000'000;

/// The limit of the size of the call stack, i.e. how many frames may be stacked up
/// in a single execution state. Calling a function with CallStackLimit frames active traps.
constexpr uint32_t CallStackLimit = 2048;

/// The limit of declared local variables (excluding parameters) of a single function.
constexpr uint32_t MaxLocalsPerFunction = 50000;
}  // namespace stasis
