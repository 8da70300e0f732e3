// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stasis/stasis_errors.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace stasis
{
struct exception : std::runtime_error
{
    StasisErrorCode code = STASIS_ERROR_OTHER;

    exception(StasisErrorCode _code, const char* message) noexcept
      : std::runtime_error(message), code(_code)
    {}
    exception(StasisErrorCode _code, const std::string& message) noexcept
      : std::runtime_error(message.c_str()), code(_code)
    {}
    exception(const exception& other) noexcept : std::runtime_error(other), code(other.code) {}
    exception& operator=(const exception& other) noexcept = default;
    ~exception() noexcept override;
};

/// The binary is malformed.
///
/// The error is thrown with the input position where decoding failed. The decoder entry point
/// translates it into the offset relative to the beginning of the module binary.
struct parser_error : exception
{
    /// The offset of the failure in the module binary.
    size_t offset = 0;

    parser_error(const uint8_t* _position, const char* message) noexcept
      : exception(STASIS_ERROR_MALFORMED, message), m_position(_position)
    {}
    parser_error(const uint8_t* _position, const std::string& message) noexcept
      : exception(STASIS_ERROR_MALFORMED, message), m_position(_position)
    {}
    parser_error(const parser_error& other) noexcept = default;
    parser_error& operator=(const parser_error& other) noexcept = default;
    ~parser_error() noexcept override;

    /// Computes the offset of the failure relative to the given input beginning.
    void resolve_offset(const uint8_t* input_begin) noexcept
    {
        if (m_position != nullptr && m_position >= input_begin)
            offset = static_cast<size_t>(m_position - input_begin);
        m_position = nullptr;
    }

private:
    const uint8_t* m_position = nullptr;
};

/// The module is well-formed but invalid.
struct validation_error : exception
{
    /// Index of the function (in the function index space) in which the error was found.
    std::optional<uint32_t> func_idx;

    /// The offset of the offending instruction or module item in the module binary.
    size_t offset = 0;

    validation_error(StasisErrorCode _code, const std::string& message,
        std::optional<uint32_t> _func_idx = std::nullopt, size_t _offset = 0) noexcept
      : exception(_code, message), func_idx(_func_idx), offset(_offset)
    {}
    validation_error(const validation_error& other) noexcept = default;
    validation_error& operator=(const validation_error& other) noexcept = default;
    ~validation_error() noexcept override;
};

struct instantiate_error : exception
{
    explicit instantiate_error(const std::string& message) noexcept
      : exception(STASIS_ERROR_LINK, message)
    {}
    ~instantiate_error() noexcept override;
};

struct snapshot_error : exception
{
    explicit snapshot_error(const std::string& message) noexcept
      : exception(STASIS_ERROR_SNAPSHOT, message)
    {}
    ~snapshot_error() noexcept override;
};

/// An engine-internal invariant does not hold, e.g. the value stack underflows or a value has
/// a type other than the instruction expects. This is never caused by a validated module and
/// is distinct from a trap.
struct invariant_error : exception
{
    explicit invariant_error(const std::string& message) noexcept
      : exception(STASIS_ERROR_INVARIANT, message)
    {}
    ~invariant_error() noexcept override;
};

}  // namespace stasis
