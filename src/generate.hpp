// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "error.hpp"

namespace luhn {

struct generate_options {
    // Produce only the check digit instead of digits followed by it
    bool checksum_only{false};
};

result<std::string> generate(std::string_view digits, const generate_options &options = {});

} // namespace luhn
