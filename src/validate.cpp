// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "digit_string.hpp"
#include "error.hpp"
#include "generate.hpp"
#include "log.hpp"
#include "validate.hpp"

namespace luhn {

result<bool> validate(std::string_view candidate)
{
    if (auto err = check_digit_string(candidate); err.has_value()) {
        return std::move(*err);
    }

    if (candidate.size() == 1) {
        LUHN_DEBUG("Rejecting single character candidate");
        return error{error_code::invalid_length, "string must be longer than 1 character"};
    }

    auto expected = generate(candidate.substr(0, candidate.size() - 1));
    if (auto *err = std::get_if<error>(&expected); err != nullptr) {
        return std::move(*err);
    }

    return std::get<std::string>(expected) == candidate;
}

} // namespace luhn
