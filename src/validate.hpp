// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "error.hpp"

namespace luhn {

// The last character of candidate is treated as the check digit of the rest,
// a single character is rejected with error_code::invalid_length.
result<bool> validate(std::string_view candidate);

} // namespace luhn
