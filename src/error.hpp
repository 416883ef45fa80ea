// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace luhn {

enum class error_code : uint8_t {
    empty_string,
    contains_spaces,
    negative_number,
    floating_point,
    non_numeric,
    invalid_length,
    parse_error,
};

std::string_view to_string(error_code code);

struct error {
    error_code code;
    std::string message;
};

// Either the outcome of an operation or the reason it could not be produced.
template <typename T> using result = std::variant<T, error>;

template <typename T> bool is_error(const result<T> &res) noexcept
{
    return std::holds_alternative<error>(res);
}

} // namespace luhn
