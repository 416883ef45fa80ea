// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "digit_string.hpp"
#include "error.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "random.hpp"
#include "random_source.hpp"
#include "utils.hpp"

namespace luhn {

namespace detail {

result<std::size_t> parse_random_length(std::string_view length_spec)
{
    if (auto err = check_digit_string(length_spec); err.has_value()) {
        return std::move(*err);
    }

    auto [res, value] = from_string<uint64_t>(length_spec);
    if (!res) {
        LUHN_DEBUG("Failed to parse random length of {} digits", length_spec.size());
        return error{error_code::parse_error, "failed to parse length"};
    }

    if (value > random_limits::max_length) {
        LUHN_DEBUG("Random length {} above maximum", value);
        return error{error_code::invalid_length,
            fmt::format("string must be less than {} characters", random_limits::max_length)};
    }

    if (value < random_limits::min_length) {
        LUHN_DEBUG("Random length {} below minimum", value);
        return error{error_code::invalid_length,
            fmt::format("string must be greater than {}", random_limits::min_length - 1)};
    }

    return static_cast<std::size_t>(value);
}

} // namespace detail

result<std::string> random(std::string_view length_spec)
{
    return random(length_spec, random_source::engine());
}

} // namespace luhn
