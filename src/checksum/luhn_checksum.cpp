// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "checksum/luhn_checksum.hpp"
#include "utils.hpp"

namespace luhn {

namespace {

// Returns the weighted sum and whether any digit was found, the rightmost
// digit is doubled when double_rightmost is set.
std::pair<uint32_t, bool> weighted_sum(std::string_view str, bool double_rightmost) noexcept
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    uint32_t sum = 0;
    bool should_double = double_rightmost;
    bool digits_seen = false;
    for (std::size_t i = str.size(); i > 0; --i) {
        const auto c = str[i - 1];
        if (!isdigit(c)) {
            continue;
        }

        digits_seen = true;
        const auto d = digit_value(c);
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }

    return {sum, digits_seen};
}

} // namespace

uint8_t luhn_checksum::check_digit(std::string_view payload) const noexcept
{
    const auto sum = weighted_sum(payload, true).first;
    return static_cast<uint8_t>((10U - (sum % 10U)) % 10U);
}

bool luhn_checksum::verify(std::string_view str) const noexcept
{
    auto [sum, digits_seen] = weighted_sum(str, false);
    return digits_seen && (sum % 10U == 0U);
}

} // namespace luhn
