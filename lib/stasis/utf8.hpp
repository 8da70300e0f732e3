// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace stasis
{
/// Checks that [pos, end) is a well-formed UTF-8 byte sequence as defined by the Unicode Standard,
/// Table 3-7 (no overlong encodings, no surrogates, no code points above U+10FFFF).
bool utf8_validate(const uint8_t* pos, const uint8_t* end) noexcept;
}  // namespace stasis
