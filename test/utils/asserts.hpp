// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "execute.hpp"
#include "value.hpp"
#include <gmock/gmock.h>
#include <test/utils/floating_point_utils.hpp>
#include <iosfwd>
#include <type_traits>

MATCHER(Traps, "")  // NOLINT(readability-redundant-string-init)
{
    return arg.status == stasis::StepStatus::trapped;
}

MATCHER_P(Traps, kind, "")  // NOLINT(readability-redundant-string-init)
{
    return arg.status == stasis::StepStatus::trapped && arg.trap == kind;
}

MATCHER(Result, "empty result")
{
    return arg.status == stasis::StepStatus::returned && arg.values.empty();
}

MATCHER_P(Result, value, "")  // NOLINT(readability-redundant-string-init)
{
    using namespace stasis;

    if (arg.status != StepStatus::returned || arg.values.size() != 1)
        return false;

    const auto& result = arg.values[0];
    if constexpr (std::is_same_v<value_type, Value>)
    {
        return result == value;
    }
    else if constexpr (std::is_same_v<value_type, float>)
    {
        return result.type() == ValType::f32 && test::FP{result.template as<float>()} == test::FP{value};
    }
    else if constexpr (std::is_same_v<value_type, double>)
    {
        return result.type() == ValType::f64 && test::FP{result.template as<double>()} == test::FP{value};
    }
    else if constexpr (std::is_integral_v<value_type> && sizeof(value_type) == sizeof(uint64_t))
    {
        return result.type() == ValType::i64 && result.bits() == static_cast<uint64_t>(value);
    }
    else if constexpr (std::is_integral_v<value_type> && sizeof(value_type) == sizeof(uint32_t))
    {
        if (result.type() == ValType::i32)
            return result.bits() == static_cast<uint32_t>(value);
        // Here allow convenient zero-extension of the expected value u32 -> u64.
        if (result.type() == ValType::i64 && value >= 0)
            return result.bits() == static_cast<uint32_t>(value);
        return false;
    }
    else
    {
        if (result_listener->IsInterested())
            *result_listener << "expected value has non-wasm type";
        return false;
    }
}

/// The execution is suspended on a call of the host function with the given import names.
MATCHER_P2(AwaitsHost, module, name, "")  // NOLINT(readability-redundant-string-init)
{
    return arg.status == stasis::StepStatus::awaiting_host && arg.host_call.has_value() &&
           arg.host_call->module == module && arg.host_call->name == name;
}

#define EXPECT_THROW_MESSAGE(stmt, ex_type, expected)                                        \
    try                                                                                      \
    {                                                                                        \
        stmt;                                                                                \
        ADD_FAILURE() << "Exception of type " #ex_type " is expected, but none was thrown."; \
    }                                                                                        \
    catch (const ex_type& exception)                                                         \
    {                                                                                        \
        EXPECT_STREQ(exception.what(), expected);                                            \
    }                                                                                        \
    catch (const std::exception& exception)                                                  \
    {                                                                                        \
        ADD_FAILURE() << "Unexpected exception type thrown: " << exception.what() << ".";    \
    }                                                                                        \
    catch (...)                                                                              \
    {                                                                                        \
        ADD_FAILURE() << "Unexpected exception type thrown.";                                \
    }                                                                                        \
    (void)0

namespace stasis
{
std::ostream& operator<<(std::ostream& os, const Value& value);

std::ostream& operator<<(std::ostream& os, const StepResult& result);
}  // namespace stasis
