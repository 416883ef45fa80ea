// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace luhn {

// Characters other than decimal digits are skipped by both operations, callers
// are expected to provide a well-formed digit string.
class luhn_checksum {
public:
    luhn_checksum() = default;
    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) = default;
    luhn_checksum &operator=(luhn_checksum &&) = default;
    ~luhn_checksum() = default;

    // Digit which, appended to payload, yields a sequence passing verify
    [[nodiscard]] uint8_t check_digit(std::string_view payload) const noexcept;

    // Whether str, including its trailing check digit, sums to 0 mod 10
    [[nodiscard]] bool verify(std::string_view str) const noexcept;
};

} // namespace luhn
