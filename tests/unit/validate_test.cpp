// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "generate.hpp"
#include "validate.hpp"

#include "common/gtest_utils.hpp"

using namespace luhn;

namespace {

TEST(TestValidate, ErrorCases)
{
    EXPECT_LUHN_ERROR(validate(""), error_code::empty_string);
    EXPECT_LUHN_ERROR(validate("1"), error_code::invalid_length);
    EXPECT_LUHN_ERROR(validate("1a"), error_code::non_numeric);
    EXPECT_LUHN_ERROR(validate(" 1230 "), error_code::contains_spaces);
    EXPECT_LUHN_ERROR(validate("-1230"), error_code::negative_number);
    EXPECT_LUHN_ERROR(validate("123.40"), error_code::floating_point);
}

TEST(TestValidate, SingleCharacter)
{
    for (char c = '0'; c <= '9'; ++c) {
        auto res = validate(std::string(1, c));
        ASSERT_LUHN_ERROR(res, error_code::invalid_length);
        EXPECT_STR(std::get<error>(res).message, "string must be longer than 1 character");
    }

    // Malformed input is reported before the length
    EXPECT_LUHN_ERROR(validate("a"), error_code::non_numeric);
    EXPECT_LUHN_ERROR(validate(" "), error_code::contains_spaces);
}

TEST(TestValidate, InvalidChecksums)
{
    EXPECT_LUHN_VALUE(validate("10"), false);
    EXPECT_LUHN_VALUE(validate("120"), false);
    EXPECT_LUHN_VALUE(validate("1231"), false);
    EXPECT_LUHN_VALUE(validate("79927398714"), false);
    EXPECT_LUHN_VALUE(validate("5427625793410839"), false);
}

TEST(TestValidate, ValidChecksums)
{
    EXPECT_LUHN_VALUE(validate("18"), true);
    EXPECT_LUHN_VALUE(validate("125"), true);
    EXPECT_LUHN_VALUE(validate("1230"), true);
    EXPECT_LUHN_VALUE(validate("79927398713"), true);
    EXPECT_LUHN_VALUE(validate("5425233430109903"), true);
    EXPECT_LUHN_VALUE(validate("350009218041876"), true);
}

TEST(TestValidate, LeadingZeros)
{
    EXPECT_LUHN_VALUE(validate("00"), true);
    EXPECT_LUHN_VALUE(validate("001230"), true);
    EXPECT_LUHN_VALUE(validate("0001231"), false);
}

TEST(TestValidate, SingleWrongDigitDetected)
{
    const std::string valid = "79927398713";
    for (std::size_t i = 0; i < valid.size(); ++i) {
        for (char c = '0'; c <= '9'; ++c) {
            if (c == valid[i]) {
                continue;
            }
            auto candidate = valid;
            candidate[i] = c;
            EXPECT_LUHN_VALUE(validate(candidate), false) << candidate;
        }
    }
}

TEST(TestValidate, AcceptsGeneratedIdentifiers)
{
    for (unsigned i = 0; i < 5000; i += 3) {
        auto generated = generate(std::to_string(i));
        auto value = test::value_or_fail(generated);
        EXPECT_LUHN_VALUE(validate(value), true) << value;
    }
}

} // namespace
