// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>

#include "checksum/luhn_checksum.hpp"
#include "digit_string.hpp"
#include "error.hpp"
#include "generate.hpp"
#include "utils.hpp"

namespace luhn {

result<std::string> generate(std::string_view digits, const generate_options &options)
{
    if (auto err = check_digit_string(digits); err.has_value()) {
        return std::move(*err);
    }

    const char check_digit = digit_char(luhn_checksum{}.check_digit(digits));
    if (options.checksum_only) {
        return std::string(1, check_digit);
    }

    std::string output;
    output.reserve(digits.size() + 1);
    output.append(digits);
    output.push_back(check_digit);
    return output;
}

} // namespace luhn
