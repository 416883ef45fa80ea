// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "digit_string.hpp"
#include "error.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace luhn {

namespace {

error reject(error_code code, std::string_view message)
{
    LUHN_DEBUG("Rejecting input: {}", to_string(code));
    return {code, std::string{message}};
}

} // namespace

std::optional<error> check_digit_string(std::string_view str)
{
    if (str.empty()) {
        return reject(error_code::empty_string, "string cannot be empty");
    }

    if (str.find(' ') != std::string_view::npos) {
        return reject(error_code::contains_spaces, "string cannot contain spaces");
    }

    if (str.find('-') != std::string_view::npos) {
        return reject(error_code::negative_number, "negative numbers are not allowed");
    }

    if (str.find('.') != std::string_view::npos) {
        return reject(error_code::floating_point, "floating point numbers are not allowed");
    }

    if (!std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); })) {
        return reject(error_code::non_numeric, "string must be convertible to a number");
    }

    return std::nullopt;
}

} // namespace luhn
