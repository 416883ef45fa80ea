// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "error.hpp"
#include "exception.hpp"
#include "generate.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "validate.hpp"

namespace luhn {

namespace detail {

// Validates and parses the requested length of a random identifier, which must
// lie within random_limits.
result<std::size_t> parse_random_length(std::string_view length_spec);

} // namespace detail

// Produces a digit string of the requested length whose last digit is the Luhn
// check digit of the preceding ones. Every payload position, including the
// first one, is drawn uniformly from 0-9. Throws checksum_mismatch if the
// result does not validate.
template <typename Engine>
result<std::string> random(std::string_view length_spec, Engine &engine)
{
    auto length = detail::parse_random_length(length_spec);
    if (auto *err = std::get_if<error>(&length); err != nullptr) {
        return std::move(*err);
    }

    const auto n = std::get<std::size_t>(length);
    std::uniform_int_distribution<unsigned> digit_dist{0, 9};
    std::string payload(n - 1, '0');

    for (auto &c : payload) {
        c = digit_char(digit_dist(engine));
    }

    auto generated = generate(payload);
    if (is_error(generated)) {
        return generated;
    }

    auto valid = validate(std::get<std::string>(generated));
    if (auto *err = std::get_if<error>(&valid); err != nullptr) {
        return std::move(*err);
    }

    if (!std::get<bool>(valid)) {
        LUHN_ERROR("Random identifier of length {} failed validation", n);
        throw checksum_mismatch();
    }

    LUHN_TRACE("Generated random identifier of length {}", n);
    return generated;
}

result<std::string> random(std::string_view length_spec);

} // namespace luhn
