// Stasis: A resumable WebAssembly interpreter
// Copyright 2020-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "utf8.hpp"

namespace stasis
{
namespace
{
/// The valid range of the second byte and the number of continuation bytes for a lead byte.
/// Only the second byte may have a range narrower than 80..BF.
struct LeadByteRule
{
    int continuation_count;
    uint8_t second_min;
    uint8_t second_max;
};

constexpr bool get_rule(uint8_t lead, LeadByteRule& rule) noexcept
{
    if (lead >= 0xC2 && lead <= 0xDF)
        rule = {1, 0x80, 0xBF};
    else if (lead == 0xE0)
        rule = {2, 0xA0, 0xBF};
    else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
        rule = {2, 0x80, 0xBF};
    else if (lead == 0xED)
        rule = {2, 0x80, 0x9F};
    else if (lead == 0xF0)
        rule = {3, 0x90, 0xBF};
    else if (lead >= 0xF1 && lead <= 0xF3)
        rule = {3, 0x80, 0xBF};
    else if (lead == 0xF4)
        rule = {3, 0x80, 0x8F};
    else
        return false;
    return true;
}

constexpr bool is_continuation(uint8_t byte) noexcept
{
    return byte >= 0x80 && byte <= 0xBF;
}
}  // namespace

bool utf8_validate(const uint8_t* pos, const uint8_t* end) noexcept
{
    while (pos < end)
    {
        const auto lead = *pos++;
        if (lead < 0x80)
            continue;

        LeadByteRule rule{};
        if (!get_rule(lead, rule))
            return false;

        if (end - pos < rule.continuation_count)
            return false;

        if (*pos < rule.second_min || *pos > rule.second_max)
            return false;
        ++pos;

        for (int i = 1; i < rule.continuation_count; ++i)
        {
            if (!is_continuation(*pos++))
                return false;
        }
    }
    return true;
}
}  // namespace stasis
