// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstring>
#include <string>

#include "luhn.h"

#include "common/gtest_utils.hpp"

namespace {

TEST(TestRandomInterface, MaximumLength)
{
    std::array<char, LUHN_MAX_RANDOM_LENGTH + 1> buffer{};
    size_t length = buffer.size();

    ASSERT_EQ(luhn_random("100", 3, buffer.data(), &length), LUHN_OK);
    EXPECT_EQ(length, LUHN_MAX_RANDOM_LENGTH);
    EXPECT_EQ(std::strlen(buffer.data()), LUHN_MAX_RANDOM_LENGTH);

    bool valid = false;
    ASSERT_EQ(luhn_validate(buffer.data(), length, &valid), LUHN_OK);
    EXPECT_TRUE(valid);
}

TEST(TestRandomInterface, MinimumLength)
{
    std::array<char, LUHN_MIN_RANDOM_LENGTH> buffer{};
    size_t length = buffer.size();

    ASSERT_EQ(luhn_random("2", 1, buffer.data(), &length), LUHN_OK);
    EXPECT_EQ(length, LUHN_MIN_RANDOM_LENGTH);

    bool valid = false;
    ASSERT_EQ(luhn_validate(buffer.data(), length, &valid), LUHN_OK);
    EXPECT_TRUE(valid);
}

TEST(TestRandomInterface, BufferTooSmall)
{
    std::array<char, 8> buffer{};
    size_t length = buffer.size();

    EXPECT_EQ(luhn_random("16", 2, buffer.data(), &length), LUHN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(length, 16);
}

TEST(TestRandomInterface, InvalidLength)
{
    std::array<char, 8> buffer{};
    size_t length = buffer.size();

    EXPECT_EQ(luhn_random("1", 1, buffer.data(), &length), LUHN_ERR_INVALID_LENGTH);
    EXPECT_EQ(luhn_random("101", 3, buffer.data(), &length), LUHN_ERR_INVALID_LENGTH);
    EXPECT_EQ(luhn_random("99999999999999999999999", 23, buffer.data(), &length),
        LUHN_ERR_PARSE);
    EXPECT_EQ(luhn_random("1a", 2, buffer.data(), &length), LUHN_ERR_NON_NUMERIC);
    EXPECT_EQ(luhn_random(nullptr, 0, buffer.data(), &length), LUHN_ERR_EMPTY_STRING);
}

TEST(TestRandomInterface, InvalidArguments)
{
    std::array<char, 8> buffer{};
    size_t length = buffer.size();

    EXPECT_EQ(luhn_random(nullptr, 1, buffer.data(), &length), LUHN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhn_random("4", 1, nullptr, &length), LUHN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhn_random("4", 1, buffer.data(), nullptr), LUHN_ERR_INVALID_ARGUMENT);
}

} // namespace
