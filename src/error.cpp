// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include "error.hpp"

namespace luhn {

std::string_view to_string(error_code code)
{
    switch (code) {
    case error_code::empty_string:
        return "empty_string";
    case error_code::contains_spaces:
        return "contains_spaces";
    case error_code::negative_number:
        return "negative_number";
    case error_code::floating_point:
        return "floating_point";
    case error_code::non_numeric:
        return "non_numeric";
    case error_code::invalid_length:
        return "invalid_length";
    case error_code::parse_error:
        return "parse_error";
    }

    return "unknown";
}

} // namespace luhn
