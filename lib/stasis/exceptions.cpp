// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "exceptions.hpp"

namespace stasis
{
exception::~exception() noexcept = default;
parser_error::~parser_error() noexcept = default;
validation_error::~validation_error() noexcept = default;
instantiate_error::~instantiate_error() noexcept = default;
snapshot_error::~snapshot_error() noexcept = default;
invariant_error::~invariant_error() noexcept = default;
}  // namespace stasis
