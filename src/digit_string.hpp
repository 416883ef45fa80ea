// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

#include "error.hpp"

namespace luhn {

// Returns the first violated constraint, checked in this order: empty, space,
// minus sign, decimal point, any other non-digit.
std::optional<error> check_digit_string(std::string_view str);

} // namespace luhn
