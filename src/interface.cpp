// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <variant>

#include "error.hpp"
#include "generate.hpp"
#include "log.hpp"
#include "luhn.h"
#include "random.hpp"
#include "validate.hpp"
#include "version.hpp"

namespace {

LUHN_RET_CODE to_ret_code(luhn::error_code code)
{
    switch (code) {
    case luhn::error_code::empty_string:
        return LUHN_ERR_EMPTY_STRING;
    case luhn::error_code::contains_spaces:
        return LUHN_ERR_CONTAINS_SPACES;
    case luhn::error_code::negative_number:
        return LUHN_ERR_NEGATIVE_NUMBER;
    case luhn::error_code::floating_point:
        return LUHN_ERR_FLOATING_POINT;
    case luhn::error_code::non_numeric:
        return LUHN_ERR_NON_NUMERIC;
    case luhn::error_code::invalid_length:
        return LUHN_ERR_INVALID_LENGTH;
    case luhn::error_code::parse_error:
        return LUHN_ERR_PARSE;
    }

    return LUHN_ERR_INTERNAL;
}

std::string_view to_string_view(const char *str, size_t length)
{
    if (length == 0) {
        return {};
    }
    return {str, length};
}

// The length of value is always reported, even if the buffer is too small
LUHN_RET_CODE copy_string(std::string_view value, char *output, size_t *output_length)
{
    const auto capacity = *output_length;
    *output_length = value.size();
    if (capacity < value.size()) {
        LUHN_DEBUG("Output buffer too small: {} < {}", capacity, value.size());
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    std::memcpy(output, value.data(), value.size());
    if (capacity > value.size()) {
        output[value.size()] = '\0';
    }
    return LUHN_OK;
}

LUHN_RET_CODE copy_output(
    const luhn::result<std::string> &res, char *output, size_t *output_length)
{
    if (const auto *err = std::get_if<luhn::error>(&res); err != nullptr) {
        return to_ret_code(err->code);
    }
    return copy_string(std::get<std::string>(res), output, output_length);
}

} // namespace

extern "C" {

LUHN_RET_CODE luhn_generate(const char *digits, size_t length,
    const luhn_generate_options *options, char *output, size_t *output_length)
{
    if ((digits == nullptr && length > 0) || output == nullptr || output_length == nullptr) {
        LUHN_WARN("Tried to generate a check digit with invalid arguments");
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    try {
        luhn::generate_options opts;
        if (options != nullptr) {
            opts.checksum_only = options->checksum_only;
        }

        auto res = luhn::generate(to_string_view(digits, length), opts);
        return copy_output(res, output, output_length);
    } catch (const std::exception &e) {
        LUHN_ERROR("{}", e.what());
    } catch (...) {
        LUHN_ERROR("unknown exception");
    }

    return LUHN_ERR_INTERNAL;
}

LUHN_RET_CODE luhn_validate(const char *candidate, size_t length, bool *valid)
{
    if ((candidate == nullptr && length > 0) || valid == nullptr) {
        LUHN_WARN("Tried to validate a candidate with invalid arguments");
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = luhn::validate(to_string_view(candidate, length));
        if (const auto *err = std::get_if<luhn::error>(&res); err != nullptr) {
            return to_ret_code(err->code);
        }

        *valid = std::get<bool>(res);
        return LUHN_OK;
    } catch (const std::exception &e) {
        LUHN_ERROR("{}", e.what());
    } catch (...) {
        LUHN_ERROR("unknown exception");
    }

    return LUHN_ERR_INTERNAL;
}

LUHN_RET_CODE luhn_random(
    const char *length_spec, size_t length, char *output, size_t *output_length)
{
    if ((length_spec == nullptr && length > 0) || output == nullptr || output_length == nullptr) {
        LUHN_WARN("Tried to generate a random identifier with invalid arguments");
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = luhn::random(to_string_view(length_spec, length));
        return copy_output(res, output, output_length);
    } catch (const std::exception &e) {
        LUHN_ERROR("{}", e.what());
    } catch (...) {
        LUHN_ERROR("unknown exception");
    }

    return LUHN_ERR_INTERNAL;
}

const char *luhn_strerror(LUHN_RET_CODE code)
{
    switch (code) {
    case LUHN_OK:
        return "success";
    case LUHN_ERR_EMPTY_STRING:
        return "string cannot be empty";
    case LUHN_ERR_CONTAINS_SPACES:
        return "string cannot contain spaces";
    case LUHN_ERR_NEGATIVE_NUMBER:
        return "negative numbers are not allowed";
    case LUHN_ERR_FLOATING_POINT:
        return "floating point numbers are not allowed";
    case LUHN_ERR_NON_NUMERIC:
        return "string must be convertible to a number";
    case LUHN_ERR_INVALID_LENGTH:
        return "invalid length";
    case LUHN_ERR_PARSE:
        return "failed to parse length";
    case LUHN_ERR_INVALID_ARGUMENT:
        return "invalid argument";
    case LUHN_ERR_INTERNAL:
        break;
    }

    return "internal error";
}

const char *luhn_get_version() { return LUHN_VERSION; }

bool luhn_set_log_cb(luhn_log_cb cb, LUHN_LOG_LEVEL min_level)
{
    auto level = static_cast<luhn::log_level>(min_level);
    luhn::logger::init(cb, level);
    LUHN_INFO("Sending log messages to binding, min level {}", luhn::log_level_to_str(level));
    return true;
}
}
