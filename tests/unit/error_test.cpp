// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <exception>
#include <string>

#include "error.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace luhn;

namespace {

TEST(TestError, ErrorCodeToString)
{
    EXPECT_STR(to_string(error_code::empty_string), "empty_string");
    EXPECT_STR(to_string(error_code::contains_spaces), "contains_spaces");
    EXPECT_STR(to_string(error_code::negative_number), "negative_number");
    EXPECT_STR(to_string(error_code::floating_point), "floating_point");
    EXPECT_STR(to_string(error_code::non_numeric), "non_numeric");
    EXPECT_STR(to_string(error_code::invalid_length), "invalid_length");
    EXPECT_STR(to_string(error_code::parse_error), "parse_error");
}

TEST(TestError, Result)
{
    result<std::string> value{std::string{"18"}};
    EXPECT_FALSE(is_error(value));

    result<std::string> failure{error{error_code::empty_string, "string cannot be empty"}};
    EXPECT_TRUE(is_error(failure));

    result<bool> flag{false};
    EXPECT_FALSE(is_error(flag));
    EXPECT_FALSE(std::get<bool>(flag));
}

TEST(TestError, ChecksumMismatch)
{
    try {
        throw checksum_mismatch();
    } catch (const std::exception &e) {
        EXPECT_STR(e.what(), "generated identifier failed validation");
    }
}

} // namespace
