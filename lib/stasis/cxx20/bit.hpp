// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <type_traits>

#if __has_include(<version>)
#include <version>
#endif

namespace stasis
{
/// The non-constexpr implementation of C++20's std::bit_cast.
template <class To, class From>
[[nodiscard]] inline
    typename std::enable_if_t<sizeof(To) == sizeof(From) && std::is_trivially_copyable_v<From> &&
                                  std::is_trivially_copyable_v<To>,
        To>
    bit_cast(const From& src) noexcept
{
    static_assert(std::is_trivially_constructible_v<To>);

    To dst;
    __builtin_memcpy(&dst, &src, sizeof(To));
    return dst;
}
}  // namespace stasis

#ifdef __cpp_lib_bitops

#include <bit>

namespace stasis
{
using std::countl_zero;
using std::countr_zero;
using std::popcount;
}  // namespace stasis

#else

namespace stasis
{
inline constexpr int popcount(uint32_t x) noexcept
{
    return __builtin_popcount(x);
}

inline constexpr int popcount(uint64_t x) noexcept
{
    return __builtin_popcountll(x);
}

// The builtins are undefined for 0, C++20 defines the result as the bit width.
inline constexpr int countl_zero(uint32_t x) noexcept
{
    return x == 0 ? 32 : __builtin_clz(x);
}

inline constexpr int countl_zero(uint64_t x) noexcept
{
    return x == 0 ? 64 : __builtin_clzll(x);
}

inline constexpr int countr_zero(uint32_t x) noexcept
{
    return x == 0 ? 32 : __builtin_ctz(x);
}

inline constexpr int countr_zero(uint64_t x) noexcept
{
    return x == 0 ? 64 : __builtin_ctzll(x);
}
}  // namespace stasis

#endif
