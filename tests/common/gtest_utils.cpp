// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <ostream>

#include "common/gtest_utils.hpp"

namespace luhn {

void PrintTo(error_code code, ::std::ostream *os) { *os << to_string(code); }

void PrintTo(const error &err, ::std::ostream *os)
{
    *os << "{code: " << to_string(err.code) << ", message: '" << err.message << "'}";
}

} // namespace luhn
