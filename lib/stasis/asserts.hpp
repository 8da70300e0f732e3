// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cassert>

#ifndef __has_builtin
#define __has_builtin(name) 0
#endif

namespace stasis
{
/// A helper for assert(unreachable()). Always returns false. Also flushes coverage data.
bool unreachable() noexcept;
}  // namespace stasis

/// Marks a code path excluded by validation.
#ifndef NDEBUG
#define STASIS_UNREACHABLE() assert(stasis::unreachable())
#elif __has_builtin(__builtin_unreachable)
#define STASIS_UNREACHABLE() __builtin_unreachable()
#else
#define STASIS_UNREACHABLE() (void)0
#endif
