// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef LUHN_H
#define LUHN_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#define LUHN_MIN_RANDOM_LENGTH 2
#define LUHN_MAX_RANDOM_LENGTH 100

/**
 * @enum LUHN_RET_CODE
 *
 * Codes returned by the luhn_* functions, one per failure kind.
 **/
typedef enum
{
    LUHN_ERR_INTERNAL          = -9,
    LUHN_ERR_INVALID_ARGUMENT  = -8,
    LUHN_ERR_PARSE             = -7,
    LUHN_ERR_INVALID_LENGTH    = -6,
    LUHN_ERR_NON_NUMERIC       = -5,
    LUHN_ERR_FLOATING_POINT    = -4,
    LUHN_ERR_NEGATIVE_NUMBER   = -3,
    LUHN_ERR_CONTAINS_SPACES   = -2,
    LUHN_ERR_EMPTY_STRING      = -1,
    LUHN_OK                    = 0,
} LUHN_RET_CODE;

/**
 * @enum LUHN_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    LUHN_LOG_TRACE,
    LUHN_LOG_DEBUG,
    LUHN_LOG_INFO,
    LUHN_LOG_WARN,
    LUHN_LOG_ERROR,
    LUHN_LOG_OFF,
} LUHN_LOG_LEVEL;

typedef struct _luhn_generate_options luhn_generate_options;

/**
 * @struct luhn_generate_options
 *
 * Options to be provided to luhn_generate
 **/
struct _luhn_generate_options
{
    /** Produce only the check digit rather than the input followed by it */
    bool checksum_only;
};

/**
 * @typedef luhn_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The size of the logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*luhn_log_cb)(
    LUHN_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * luhn_generate
 *
 * Computes the Luhn check digit of a digit string.
 *
 * @param digits Digit string, not NUL-terminated. (nullable if length is 0)
 * @param length Length of digits.
 * @param options Generation options, NULL selects the defaults. (nullable)
 * @param output Caller-owned buffer receiving the result. (nonnull)
 * @param output_length On input the capacity of output, on output the length
 *                      of the result. When room remains a NUL terminator is
 *                      appended. (nonnull)
 *
 * @return LUHN_OK on success, LUHN_ERR_INVALID_ARGUMENT if a required pointer
 *         is null or output is too small (output_length then holds the required
 *         size), otherwise the code of the first malformation found in digits.
 **/
LUHN_RET_CODE luhn_generate(const char *digits, size_t length,
    const luhn_generate_options *options, char *output, size_t *output_length);

/**
 * luhn_validate
 *
 * Checks whether the trailing digit of candidate is its Luhn check digit.
 *
 * @param candidate Digit string including its check digit. (nullable if length is 0)
 * @param length Length of candidate.
 * @param valid Receives the outcome of the check. (nonnull)
 *
 * @return LUHN_OK if valid holds the outcome, LUHN_ERR_INVALID_LENGTH if the
 *         candidate is a single digit, otherwise the error describing why the
 *         candidate could not be checked.
 *
 * @note luhn_strerror gives a generic message per code; the detailed reason is
 *       only available through the C++ API (luhn::error::message).
 **/
LUHN_RET_CODE luhn_validate(const char *candidate, size_t length, bool *valid);

/**
 * luhn_random
 *
 * Produces a random digit string satisfying the Luhn check.
 *
 * @param length_spec Decimal digit string holding the requested length, within
 *                    [LUHN_MIN_RANDOM_LENGTH, LUHN_MAX_RANDOM_LENGTH].
 * @param length Length of length_spec.
 * @param output Caller-owned buffer receiving the result. (nonnull)
 * @param output_length Capacity in, result length out. (nonnull)
 *
 * @return LUHN_OK on success or the relevant error code. LUHN_ERR_INVALID_LENGTH
 *         covers lengths both above and below the limits.
 *
 * @note luhn_strerror gives a generic message per code; which limit was
 *       exceeded is only available through the C++ API (luhn::error::message).
 **/
LUHN_RET_CODE luhn_random(
    const char *length_spec, size_t length, char *output, size_t *output_length);

/**
 * luhn_strerror
 *
 * Returns a static, NUL-terminated description of a return code.
 **/
const char *luhn_strerror(LUHN_RET_CODE code);

/**
 * luhn_get_version
 *
 * Return the version of the library
 *
 * @return version of the library
 **/
const char *luhn_get_version();

/**
 * luhn_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 **/
bool luhn_set_log_cb(luhn_log_cb cb, LUHN_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif

#endif /*LUHN_H */
