// Stasis: A resumable WebAssembly interpreter
// Copyright 2021-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

/// Stasis error codes.
/// @file
#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/// The kind of error reported by the decoder, the validator, instantiation or the snapshot codec.
/// Traps are not errors and have no code here.
typedef enum StasisErrorCode
{
    STASIS_SUCCESS = 0,
    /// The binary does not parse as a well-formed module.
    STASIS_ERROR_MALFORMED,
    /// Validation: operand stack types do not match an instruction or block signature.
    STASIS_ERROR_TYPE_MISMATCH,
    /// Validation: a local, global, type, function, table, memory, element or data index is out of
    /// its index space.
    STASIS_ERROR_UNKNOWN_INDEX,
    /// Validation: any other static rule is violated.
    STASIS_ERROR_INVALID,
    /// Instantiation failed: unresolved or mismatched import, out of bounds segment, start function
    /// failure.
    STASIS_ERROR_LINK,
    /// A snapshot or store image is malformed or does not match the store it is restored into.
    STASIS_ERROR_SNAPSHOT,
    /// An engine-internal invariant is broken. This indicates a defect, not a user error.
    STASIS_ERROR_INVARIANT,
    STASIS_ERROR_OTHER
} StasisErrorCode;

#ifdef __cplusplus
}
#endif
