// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>

#include "luhn.h"

namespace luhn {

struct random_limits {
    static constexpr std::size_t min_length{LUHN_MIN_RANDOM_LENGTH};
    static constexpr std::size_t max_length{LUHN_MAX_RANDOM_LENGTH};
};

} // namespace luhn
