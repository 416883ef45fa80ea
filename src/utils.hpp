// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

namespace luhn {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline uint8_t digit_value(char c) { return static_cast<uint8_t>(c - '0'); }
inline char digit_char(unsigned value) { return static_cast<char>('0' + value); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <typename T> std::pair<bool, T> from_string(std::string_view str);

} // namespace luhn
