// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cxx20/bit.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

/// Numeric operators of WebAssembly working on plain C++ values.
/// Integer operands are unsigned types unless the operator is sign-aware, so wrapping arithmetic
/// is well defined.
namespace stasis::numeric
{
constexpr uint32_t F32AbsMask = 0x7fffffff;
constexpr uint32_t F32SignMask = ~F32AbsMask;
constexpr uint64_t F64AbsMask = 0x7fffffffffffffff;
constexpr uint64_t F64SignMask = ~F64AbsMask;

/// Exclusive boundaries of the range of SrcT values for which truncation to DstT is defined.
/// The theoretical range (INT_MIN - 1, INT_MAX + 1) is adjusted to the nearest values
/// representable in SrcT.
template <typename SrcT, typename DstT>
struct trunc_boundaries;

template <>
struct trunc_boundaries<float, int32_t>
{
    /// -2147483649 is not representable in float, the next lower float is used.
    static constexpr float lower = -2147483904.0f;
    static constexpr float upper = 2147483648.0f;
};

template <>
struct trunc_boundaries<float, uint32_t>
{
    static constexpr float lower = -1.0f;
    static constexpr float upper = 4294967296.0f;
};

template <>
struct trunc_boundaries<double, int32_t>
{
    static constexpr double lower = -2147483649.0;
    static constexpr double upper = 2147483648.0;
};

template <>
struct trunc_boundaries<double, uint32_t>
{
    static constexpr double lower = -1.0;
    static constexpr double upper = 4294967296.0;
};

template <>
struct trunc_boundaries<float, int64_t>
{
    /// -9223372036854775809 is not representable in float, the next lower float is used.
    static constexpr float lower = -9223373136366403584.0f;
    static constexpr float upper = 9223372036854775808.0f;
};

template <>
struct trunc_boundaries<float, uint64_t>
{
    static constexpr float lower = -1.0f;
    static constexpr float upper = 18446744073709551616.0f;
};

template <>
struct trunc_boundaries<double, int64_t>
{
    /// -9223372036854775809 is not representable in double, the next lower double is used.
    static constexpr double lower = -9223372036854777856.0;
    static constexpr double upper = 9223372036854775808.0;
};

template <>
struct trunc_boundaries<double, uint64_t>
{
    static constexpr double lower = -1.0;
    static constexpr double upper = 18446744073709551616.0;
};

template <typename T>
inline constexpr T add(T a, T b) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    return a + b;
}

template <typename T>
inline constexpr T sub(T a, T b) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    return a - b;
}

template <typename T>
inline constexpr T mul(T a, T b) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    // Promote to unsigned int to avoid signed overflow of uint16_t-like promotions.
    using PromotedT = std::conditional_t<(sizeof(T) < sizeof(unsigned)), unsigned, T>;
    return static_cast<T>(PromotedT{a} * PromotedT{b});
}

/// Division. The caller must exclude division by zero and signed overflow.
template <typename T>
inline constexpr T div(T a, T b) noexcept
{
    return a / b;
}

/// Remainder. The caller must exclude division by zero.
/// The INT_MIN % -1 case is defined as 0.
template <typename T>
inline constexpr T rem(T a, T b) noexcept
{
    if constexpr (std::is_signed_v<T>)
    {
        if (b == -1)
            return 0;
    }
    return a % b;
}

/// Returns true if the signed division a / b overflows.
template <typename T>
inline constexpr bool div_overflows(T a, T b) noexcept
{
    static_assert(std::is_signed_v<T>);
    return a == std::numeric_limits<T>::min() && b == -1;
}

template <typename T>
inline constexpr T shift_left(T lhs, T rhs) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    constexpr T num_bits{sizeof(T) * 8};
    return static_cast<T>(lhs << (rhs & (num_bits - 1)));
}

/// Shift right: arithmetic for signed T, logical for unsigned T.
template <typename T>
inline constexpr T shift_right(T lhs, T rhs) noexcept
{
    static_assert(std::is_integral_v<T>);
    constexpr T num_bits{sizeof(T) * 8};
    return lhs >> (rhs & (num_bits - 1));
}

template <typename T>
inline constexpr T rotl(T lhs, T rhs) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    constexpr T num_bits{sizeof(T) * 8};
    const auto k = rhs & (num_bits - 1);
    if (k == 0)
        return lhs;
    return (lhs << k) | (lhs >> (num_bits - k));
}

template <typename T>
inline constexpr T rotr(T lhs, T rhs) noexcept
{
    static_assert(std::is_unsigned_v<T>);
    constexpr T num_bits{sizeof(T) * 8};
    const auto k = rhs & (num_bits - 1);
    if (k == 0)
        return lhs;
    return (lhs >> k) | (lhs << (num_bits - k));
}

template <typename T>
inline constexpr T clz(T value) noexcept
{
    return static_cast<T>(countl_zero(value));
}

template <typename T>
inline constexpr T ctz(T value) noexcept
{
    return static_cast<T>(countr_zero(value));
}

template <typename T>
inline constexpr T popcnt(T value) noexcept
{
    return static_cast<T>(popcount(value));
}

/// Sign-extends the low N bits of the value (the *.extendN_s operators).
template <typename T, typename NarrowT>
inline constexpr T extend_s(T value) noexcept
{
    static_assert(std::is_unsigned_v<T> && std::is_signed_v<NarrowT>);
    using SignedT = std::make_signed_t<T>;
    return static_cast<T>(SignedT{static_cast<NarrowT>(value)});
}

inline float fabs(float value) noexcept
{
    return bit_cast<float>(bit_cast<uint32_t>(value) & F32AbsMask);
}

inline double fabs(double value) noexcept
{
    return bit_cast<double>(bit_cast<uint64_t>(value) & F64AbsMask);
}

inline float fneg(float value) noexcept
{
    return bit_cast<float>(bit_cast<uint32_t>(value) ^ F32SignMask);
}

inline double fneg(double value) noexcept
{
    return bit_cast<double>(bit_cast<uint64_t>(value) ^ F64SignMask);
}

inline float fcopysign(float a, float b) noexcept
{
    return bit_cast<float>(
        (bit_cast<uint32_t>(a) & F32AbsMask) | (bit_cast<uint32_t>(b) & F32SignMask));
}

inline double fcopysign(double a, double b) noexcept
{
    return bit_cast<double>(
        (bit_cast<uint64_t>(a) & F64AbsMask) | (bit_cast<uint64_t>(b) & F64SignMask));
}

// The rounding operators return the positive canonical NaN for any NaN input.

template <typename T>
inline T fceil(T value) noexcept
{
    if (std::isnan(value))
        return std::numeric_limits<T>::quiet_NaN();
    return std::ceil(value);
}

template <typename T>
inline T ffloor(T value) noexcept
{
    if (std::isnan(value))
        return std::numeric_limits<T>::quiet_NaN();

    // std::floor() may produce -0 for +0 input under FE_DOWNWARD rounding in GCC.
    // The result sign always matches the input sign.
    return std::copysign(std::floor(value), value);
}

template <typename T>
inline T ftrunc(T value) noexcept
{
    if (std::isnan(value))
        return std::numeric_limits<T>::quiet_NaN();
    return std::trunc(value);
}

/// Rounds to the nearest integer, ties to even.
template <typename T>
inline T fnearest(T value) noexcept
{
    static_assert(std::is_floating_point_v<T>);
    if (std::isnan(value))
        return std::numeric_limits<T>::quiet_NaN();

    const auto t = std::trunc(value);
    const auto diff = std::abs(value - t);
    const bool t_is_odd = std::fmod(t, T{2}) != T{0};
    if (diff > T{0.5} || (diff == T{0.5} && t_is_odd))
        return t + std::copysign(T{1}, value);
    return t;
}

template <typename T>
inline T fsqrt(T value) noexcept
{
    if (std::isnan(value))
        return std::numeric_limits<T>::quiet_NaN();
    return std::sqrt(value);
}

template <typename T>
__attribute__((no_sanitize("float-divide-by-zero"))) inline constexpr T fdiv(T a, T b) noexcept
{
    static_assert(std::numeric_limits<T>::is_iec559);
    return a / b;  // Division by 0 is defined for IEEE 754 types.
}

template <typename T>
inline T fmin(T a, T b) noexcept
{
    if (std::isnan(a) || std::isnan(b))
        return std::numeric_limits<T>::quiet_NaN();

    if (a == 0 && b == 0)
        return std::signbit(a) ? a : b;

    return b < a ? b : a;
}

template <typename T>
inline T fmax(T a, T b) noexcept
{
    if (std::isnan(a) || std::isnan(b))
        return std::numeric_limits<T>::quiet_NaN();

    if (a == 0 && b == 0)
        return std::signbit(a) ? b : a;

    return a < b ? b : a;
}

__attribute__((no_sanitize("float-cast-overflow"))) inline constexpr float demote(
    double value) noexcept
{
    // Finite f64 values out of the f32 range become infinities.
    return static_cast<float>(value);
}

/// Truncates the floating-point value to an integer.
/// Returns std::nullopt when the result is not representable (including NaN).
template <typename SrcT, typename DstT>
inline std::optional<DstT> trunc(SrcT value) noexcept
{
    static_assert(std::is_floating_point_v<SrcT> && std::is_integral_v<DstT>);
    using boundaries = trunc_boundaries<SrcT, DstT>;

    if (value > boundaries::lower && value < boundaries::upper)
        return static_cast<DstT>(value);
    return std::nullopt;
}

/// Saturating truncation: NaN becomes 0, out of range values are clamped.
template <typename SrcT, typename DstT>
inline DstT trunc_sat(SrcT value) noexcept
{
    if (std::isnan(value))
        return 0;
    if (const auto result = trunc<SrcT, DstT>(value); result.has_value())
        return *result;
    return value < 0 ? std::numeric_limits<DstT>::min() : std::numeric_limits<DstT>::max();
}
}  // namespace stasis::numeric
