// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace stasis
{
/// The stack signature of an instruction.
struct InstructionType
{
    std::vector<ValType> inputs;
    std::vector<ValType> outputs;
};

/// Returns the signature of an instruction whose operand types do not depend on its immediates
/// or on the module (numeric, conversion, memory access and bulk memory instructions).
/// Returns nullptr for all other instructions.
const InstructionType* get_instruction_type(Opcode opcode) noexcept;

/// Returns the max alignment value of a memory load or store instruction - the largest
/// acceptable alignment value satisfying `2 ** max_align <= memory_width` where memory_width is
/// the number of bytes the instruction operates on.
/// Returns std::nullopt for instructions not accessing memory through a memarg.
std::optional<uint8_t> get_instruction_max_align(Opcode opcode) noexcept;

}  // namespace stasis
