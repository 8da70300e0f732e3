// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "module.hpp"
#include <memory>

namespace stasis
{
/// The module which passed validation and is safe to instantiate.
///
/// Instances are created only by validate().
class ValidatedModule
{
    std::unique_ptr<const Module> m_module;

    explicit ValidatedModule(std::unique_ptr<const Module> module) noexcept
      : m_module{std::move(module)}
    {}

    friend std::unique_ptr<const ValidatedModule> validate(std::unique_ptr<const Module> module);

public:
    const Module& module() const noexcept { return *m_module; }

    const Module* operator->() const noexcept { return m_module.get(); }
};

/// Validates the decoded module.
///
/// Checks index bounds, types every function body with the operand stack algorithm of
/// https://webassembly.github.io/spec/core/appendix/algorithm.html and checks constant
/// expressions.
///
/// @throws validation_error with the code STASIS_ERROR_TYPE_MISMATCH,
///         STASIS_ERROR_UNKNOWN_INDEX or STASIS_ERROR_INVALID.
std::unique_ptr<const ValidatedModule> validate(std::unique_ptr<const Module> module);
}  // namespace stasis
