// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <exception>

namespace luhn {

// A freshly generated identifier did not pass validation
class checksum_mismatch : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override
    {
        return "generated identifier failed validation";
    }
};

} // namespace luhn
