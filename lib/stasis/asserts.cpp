// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "asserts.hpp"

#ifdef GCOV
extern "C" void __gcov_dump();
#endif

namespace stasis
{
bool unreachable() noexcept
{
#ifdef GCOV
    __gcov_dump();
#endif
    return false;  // LCOV_EXCL_LINE
}
}  // namespace stasis
