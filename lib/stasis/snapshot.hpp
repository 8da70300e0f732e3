// Stasis: A resumable WebAssembly interpreter
// Copyright 2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include "execution_state.hpp"
#include "store.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace stasis
{
/// The version of the snapshot and store image layouts. Bumped on any layout change.
constexpr uint32_t SnapshotFormatVersion = 1;

/// The identity of a module instance the snapshot refers to.
struct ModuleFingerprint
{
    ModuleAddr module = 0;
    uint64_t fingerprint = 0;
};

struct LabelSnapshot
{
    LabelKind kind = LabelKind::block;
    uint32_t arity = 0;
    uint64_t height = 0;
    uint32_t cursor = 0;
};

struct FrameSnapshot
{
    FuncAddr func = 0;
    ModuleAddr module = 0;
    uint32_t arity = 0;
    std::vector<Value> locals;
    std::vector<LabelSnapshot> labels;
};

/// The pointer-free image of an ExecutionState.
struct Snapshot
{
    uint32_t format_version = SnapshotFormatVersion;

    /// Fingerprints of all module instances referenced by frames.
    std::vector<ModuleFingerprint> modules;

    std::vector<Value> stack;
    std::vector<FrameSnapshot> frames;
    std::optional<FuncAddr> entry;
    std::optional<HostCall> pending;
    std::optional<TrapKind> trap;
    std::optional<std::vector<Value>> results;
    uint64_t steps = 0;
};

/// Captures the execution state.
Snapshot capture(const ExecutionState& state, const Store& store);

/// Rebuilds the execution state from the snapshot against the Store.
///
/// The Store must contain the same module instances (checked by fingerprints) at the same
/// addresses as the Store the snapshot was captured from.
/// @throws snapshot_error if the snapshot does not fit the Store or is inconsistent.
ExecutionState restore(const Snapshot& snapshot, const Store& store);

/// Serializes the snapshot into the binary form.
bytes encode_snapshot(const Snapshot& snapshot);

/// Deserializes the snapshot. Throws snapshot_error for malformed input.
Snapshot decode_snapshot(bytes_view input);


/// The mutable contents of a Store.
///
/// A process can rebuild a Store by instantiating the same modules in the same order and then
/// overwrite it with the image.
struct StoreImage
{
    uint32_t format_version = SnapshotFormatVersion;
    std::vector<ModuleFingerprint> modules;
    uint32_t function_count = 0;
    std::vector<bytes> memories;
    std::vector<std::vector<Value>> tables;
    std::vector<Value> globals;

    /// Whether the element/data segment instances are dropped.
    std::vector<bool> dropped_elems;
    std::vector<bool> dropped_datas;
};

StoreImage capture_store(const Store& store);

/// Overwrites the mutable contents of the Store with the image.
/// @throws snapshot_error if the image does not match the Store shape or its modules.
void restore_store(const StoreImage& image, Store& store);

bytes encode_store_image(const StoreImage& image);

/// Deserializes the store image. Throws snapshot_error for malformed input.
StoreImage decode_store_image(bytes_view input);
}  // namespace stasis
