// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef SEDOL_H
#define SEDOL_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum SEDOL_RET_CODE
 *
 * Codes returned by sedol_validate and sedol_calc_check_digit.
 **/
typedef enum
{
    SEDOL_ERR_INTERNAL         = -2,
    SEDOL_ERR_INVALID_ARGUMENT = -1,
    SEDOL_OK                   = 0,
    // An input character is not one of 0-9 or B-Z without vowels
    SEDOL_INVALID_CHARACTER    = 1,
    // The input is not exactly 7 characters long
    SEDOL_INVALID_LENGTH       = 2,
    // The first character is a digit but the rest are not all digits
    SEDOL_INVALID_OLD_FORMAT   = 3,
    // The trailing character doesn't match the computed check digit
    SEDOL_INVALID_CHECK_DIGIT  = 4,
} SEDOL_RET_CODE;

/**
 * @enum SEDOL_LOG_LEVEL
 *
 * Internal library log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    SEDOL_LOG_TRACE,
    SEDOL_LOG_DEBUG,
    SEDOL_LOG_INFO,
    SEDOL_LOG_WARN,
    SEDOL_LOG_ERROR,
    SEDOL_LOG_OFF,
} SEDOL_LOG_LEVEL;

typedef struct _sedol_error sedol_error;

/**
 * @struct sedol_error
 *
 * Validation failure details. Only the fields relevant to the code are set,
 * the rest are zero.
 **/
struct _sedol_error
{
    /** Failure reason, SEDOL_OK if the input was valid **/
    SEDOL_RET_CODE code;
    /** Offending character as a Unicode codepoint, set for SEDOL_INVALID_CHARACTER.
     *  Bytes which aren't valid UTF-8 are reported as U+FFFD. **/
    uint32_t character;
    /** Check digit found in the input, set for SEDOL_INVALID_CHECK_DIGIT **/
    char got_check_digit;
    /** Check digit computed from the input, set for SEDOL_INVALID_CHECK_DIGIT **/
    char calc_check_digit;
};

/**
 * @typedef sedol_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The filename of the emitter. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message, NUL-terminated.
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*sedol_log_cb)(
    SEDOL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * sedol_validate
 *
 * Validate a SEDOL. The checks are performed in the following order and the
 * first failing one is reported:
 *   1. only digits 0-9 and letters B-Z (excluding vowels) are present
 *   2. the length of the string is 7
 *   3. all characters are digits if the first char is a digit
 *   4. the trailing check digit matches the computed one
 *
 * @param str The candidate, not required to be NUL-terminated. (nullable if length is 0)
 * @param length Length of the candidate.
 * @param error Failure details, written on every non-negative return. (nullable)
 *
 * @return SEDOL_OK if valid, the failure reason otherwise, or a negative code on
 *         invalid arguments.
 **/
SEDOL_RET_CODE sedol_validate(const char *str, uint32_t length, sedol_error *error);

/**
 * sedol_clean
 *
 * Remove every character which isn't an ASCII letter or digit. Case is preserved.
 *
 * @param str The input string. (nullable if length is 0)
 * @param length Length of the input string.
 * @param output Buffer to write the cleaned string to, not NUL-terminated.
 * @param output_length Capacity of output on input, length of the cleaned string
 *                      on output. On failure due to insufficient capacity it
 *                      contains the required size. (nonnull)
 *
 * @return whether the string was written to the output buffer.
 **/
bool sedol_clean(const char *str, uint32_t length, char *output, uint32_t *output_length);

/**
 * sedol_calc_check_digit
 *
 * Compute the check digit of a SEDOL using its first six characters. Any
 * further characters are ignored.
 *
 * @param str The candidate, at least six characters from the SEDOL alphabet. (nonnull)
 * @param length Length of the candidate.
 * @param check_digit Output for the computed digit, '0' to '9'. (nonnull)
 *
 * @return SEDOL_OK on success, SEDOL_ERR_INVALID_ARGUMENT if the candidate is
 *         too short or contains a character outside the alphabet.
 **/
SEDOL_RET_CODE sedol_calc_check_digit(const char *str, uint32_t length, char *check_digit);

/**
 * sedol_error_to_string
 *
 * Render a validation failure as a human-readable message, e.g.
 * "invalid check digit 6, expected 7".
 *
 * @param error The failure to render. (nonnull)
 * @param buffer Output buffer, NUL-terminated if size > 0. (nullable if size is 0)
 * @param size Size of the output buffer, including space for the NUL terminator.
 *
 * @return the length of the full message, excluding the NUL terminator. If the
 *         return value is >= size the message was truncated.
 **/
uint32_t sedol_error_to_string(const sedol_error *error, char *buffer, uint32_t size);

/**
 * sedol_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *sedol_get_version();

/**
 * sedol_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool sedol_set_log_cb(sedol_log_cb cb, SEDOL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*SEDOL_H */
