// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "../../common/utils.hpp"
#include "checksum/luhn_checksum.hpp"
#include "generate.hpp"
#include "limits.hpp"
#include "random.hpp"
#include "random_source.hpp"
#include "utils.hpp"
#include "validate.hpp"

using namespace luhn_fuzz;

namespace {

bool is_digit_string(std::string_view str)
{
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](char c) { return luhn::isdigit(c); });
}

void fuzz_generate(std::string_view input, bool checksum_only)
{
    luhn::luhn_checksum checksum;
    auto res = luhn::generate(input, {checksum_only});
    if (luhn::is_error(res)) {
        if (is_digit_string(input)) {
            __builtin_trap();
        }
        return;
    }

    const auto &value = std::get<std::string>(res);
    if (!is_digit_string(input)) {
        __builtin_trap();
    }

    if (checksum_only) {
        if (value.size() != 1 || value[0] - '0' != checksum.check_digit(input)) {
            __builtin_trap();
        }
        return;
    }

    if (value.size() != input.size() + 1 || value.compare(0, input.size(), input) != 0 ||
        !checksum.verify(value)) {
        __builtin_trap();
    }
}

void fuzz_validate(std::string_view input)
{
    luhn::luhn_checksum checksum;
    auto res = luhn::validate(input);
    if (luhn::is_error(res)) {
        if (is_digit_string(input) && input.size() > 1) {
            __builtin_trap();
        }
        return;
    }

    if (std::get<bool>(res) != checksum.verify(input)) {
        __builtin_trap();
    }
}

void fuzz_random(std::string_view input, uint64_t seed)
{
    luhn::luhn_checksum checksum;
    luhn::random_source::engine_type engine{seed};
    auto res = luhn::random(input, engine);
    if (luhn::is_error(res)) {
        return;
    }

    const auto &value = std::get<std::string>(res);
    if (value.size() < luhn::random_limits::min_length ||
        value.size() > luhn::random_limits::max_length || !is_digit_string(value) ||
        !checksum.verify(value)) {
        __builtin_trap();
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    InputSplitter splitter(data, size);
    auto selector = splitter.get<uint8_t>();
    auto seed = splitter.get<uint64_t>();
    auto input = splitter.get_remaining();

    switch (selector % 4) {
    case 0:
        fuzz_generate(input, false);
        break;
    case 1:
        fuzz_generate(input, true);
        break;
    case 2:
        fuzz_validate(input);
        break;
    default:
        fuzz_random(input, seed);
        break;
    }

    return 0;
}
