// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cxx20/bit.hpp"
#include "exceptions.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace stasis
{
// https://webassembly.github.io/spec/core/binary/types.html#binary-valtype
enum class ValType : uint8_t
{
    i32 = 0x7f,
    i64 = 0x7e,
    f32 = 0x7d,
    f64 = 0x7c,
    funcref = 0x70,
    externref = 0x6f,
};

inline constexpr bool is_reftype(ValType type) noexcept
{
    return type == ValType::funcref || type == ValType::externref;
}

inline constexpr bool is_numtype(ValType type) noexcept
{
    return !is_reftype(type);
}

inline const char* to_string(ValType type) noexcept
{
    switch (type)
    {
    case ValType::i32:
        return "i32";
    case ValType::i64:
        return "i64";
    case ValType::f32:
        return "f32";
    case ValType::f64:
        return "f64";
    case ValType::funcref:
        return "funcref";
    case ValType::externref:
        return "externref";
    }
    return "<unknown>";
}

/// The address of a function instance in the Store.
using FuncAddr = uint32_t;

/// The opaque host reference carried by externref values.
using ExternAddr = uint32_t;

/// A WebAssembly value tagged with its type.
///
/// Floating-point values are kept as their bit patterns, so copying a value (e.g. into a snapshot)
/// preserves NaN payloads. References keep the address of the referenced entity, or the null
/// sentinel.
class Value
{
    /// The bit pattern of a null reference.
    static constexpr uint64_t NullRefBits = std::numeric_limits<uint64_t>::max();

    ValType m_type = ValType::i32;
    uint64_t m_bits = 0;

    constexpr Value(ValType type, uint64_t bits) noexcept : m_type{type}, m_bits{bits} {}

    [[noreturn]] void throw_type_mismatch(ValType expected) const
    {
        throw invariant_error{std::string{"value type mismatch: expected "} + to_string(expected) +
                              ", got " + to_string(m_type)};
    }

    void check_type(ValType expected) const
    {
        if (m_type != expected)
            throw_type_mismatch(expected);
    }

public:
    /// Constructs i32 zero.
    constexpr Value() noexcept = default;

    /// Converting constructors from integer types.
    ///
    /// 32-bit integers are i32 values, 64-bit integers are i64 values. Because uint64_t is defined
    /// differently in different implementations constructors for unsigned long and
    /// unsigned long long are provided independently.
    constexpr Value(unsigned int v) noexcept : m_type{ValType::i32}, m_bits{v} {}
    constexpr Value(unsigned long v) noexcept
      : m_type{sizeof(v) == sizeof(uint32_t) ? ValType::i32 : ValType::i64}, m_bits{v}
    {}
    constexpr Value(unsigned long long v) noexcept : m_type{ValType::i64}, m_bits{v} {}
    constexpr Value(int64_t v) noexcept : m_type{ValType::i64}, m_bits{static_cast<uint64_t>(v)}
    {}
    constexpr Value(int32_t v) noexcept : m_type{ValType::i32}, m_bits{static_cast<uint32_t>(v)}
    {}

    Value(float v) noexcept : m_type{ValType::f32}, m_bits{bit_cast<uint32_t>(v)} {}
    Value(double v) noexcept : m_type{ValType::f64}, m_bits{bit_cast<uint64_t>(v)} {}

    /// Converting constructor from any other type (including bool and smaller integer types) is
    /// deleted.
    template <typename T>
    constexpr Value(T) = delete;

    /// Creates the value of the given type from its raw bit pattern.
    /// For f32 and i32 only the low 32 bits are used.
    static constexpr Value from_bits(ValType type, uint64_t bits) noexcept
    {
        if (type == ValType::i32 || type == ValType::f32)
            bits &= 0xffffffff;
        return Value{type, bits};
    }

    /// The default value of the type: zero of a numeric type or null reference.
    static constexpr Value zero(ValType type) noexcept
    {
        return is_reftype(type) ? Value{type, NullRefBits} : Value{type, 0};
    }

    static constexpr Value null(ValType reftype) noexcept { return Value{reftype, NullRefBits}; }

    static constexpr Value funcref(FuncAddr addr) noexcept
    {
        return Value{ValType::funcref, addr};
    }

    static constexpr Value externref(ExternAddr addr) noexcept
    {
        return Value{ValType::externref, addr};
    }

    constexpr ValType type() const noexcept { return m_type; }

    /// The raw bit pattern of the value.
    constexpr uint64_t bits() const noexcept { return m_bits; }

    bool is_null() const
    {
        if (!is_reftype(m_type))
            throw invariant_error{std::string{"reference expected, got "} + to_string(m_type)};
        return m_bits == NullRefBits;
    }

    /// Returns the address kept by a non-null reference.
    uint32_t ref() const
    {
        if (is_null())
            throw invariant_error{"null reference dereferenced"};
        return static_cast<uint32_t>(m_bits);
    }

    /// Get the value as the given type. Throws invariant_error if the value has another type.
    /// Only required specializations are provided.
    template <typename T>
    T as() const;

    friend constexpr bool operator==(const Value& a, const Value& b) noexcept
    {
        return a.m_type == b.m_type && a.m_bits == b.m_bits;
    }

    friend constexpr bool operator!=(const Value& a, const Value& b) noexcept { return !(a == b); }
};

template <>
inline uint32_t Value::as<uint32_t>() const
{
    check_type(ValType::i32);
    return static_cast<uint32_t>(m_bits);
}

template <>
inline int32_t Value::as<int32_t>() const
{
    return static_cast<int32_t>(as<uint32_t>());
}

template <>
inline uint64_t Value::as<uint64_t>() const
{
    check_type(ValType::i64);
    return m_bits;
}

template <>
inline int64_t Value::as<int64_t>() const
{
    return static_cast<int64_t>(as<uint64_t>());
}

template <>
inline float Value::as<float>() const
{
    check_type(ValType::f32);
    return bit_cast<float>(static_cast<uint32_t>(m_bits));
}

template <>
inline double Value::as<double>() const
{
    check_type(ValType::f64);
    return bit_cast<double>(m_bits);
}
}  // namespace stasis
