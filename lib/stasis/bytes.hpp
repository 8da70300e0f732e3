// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stasis
{
using bytes = std::basic_string<uint8_t>;
using bytes_view = std::basic_string_view<uint8_t>;
}  // namespace stasis
