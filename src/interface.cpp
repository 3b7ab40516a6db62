// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "checksum/sedol_checksum.hpp"
#include "cleaner.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "sedol.h"
#include "validation_error.hpp"
#include "validator.hpp"
#include "version.hpp"

using namespace sedol;

// Error code compatibility
static_assert(static_cast<int>(validation_error_code::invalid_character) == SEDOL_INVALID_CHARACTER);
static_assert(static_cast<int>(validation_error_code::invalid_length) == SEDOL_INVALID_LENGTH);
static_assert(
    static_cast<int>(validation_error_code::invalid_old_format) == SEDOL_INVALID_OLD_FORMAT);
static_assert(
    static_cast<int>(validation_error_code::invalid_check_digit) == SEDOL_INVALID_CHECK_DIGIT);

namespace {

sedol_error to_sedol_error(const validation_error &error)
{
    sedol_error output{};
    output.code = static_cast<SEDOL_RET_CODE>(error_code(error));
    std::visit(
        [&output](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, invalid_character>) {
                output.character = e.character;
            } else if constexpr (std::is_same_v<T, invalid_check_digit>) {
                output.got_check_digit = e.got;
                output.calc_check_digit = e.calc;
            }
        },
        error);
    return output;
}

validation_error from_sedol_error(const sedol_error &error)
{
    switch (error.code) {
    case SEDOL_INVALID_CHARACTER:
        return invalid_character{static_cast<char32_t>(error.character)};
    case SEDOL_INVALID_LENGTH:
        return invalid_length{};
    case SEDOL_INVALID_OLD_FORMAT:
        return invalid_old_format{};
    case SEDOL_INVALID_CHECK_DIGIT:
        return invalid_check_digit{error.got_check_digit, error.calc_check_digit};
    case SEDOL_OK:
    case SEDOL_ERR_INVALID_ARGUMENT:
    case SEDOL_ERR_INTERNAL:
        break;
    }

    throw sedol::exception(
        "unknown validation error code " + std::to_string(static_cast<int>(error.code)));
}

} // namespace

extern "C" {

SEDOL_RET_CODE sedol_validate(const char *str, uint32_t length, sedol_error *error)
{
    if (str == nullptr && length > 0) {
        SEDOL_WARN("Tried to validate a null string of length {}", length);
        return SEDOL_ERR_INVALID_ARGUMENT;
    }

    try {
        auto result = sedol::validate(length > 0 ? std::string_view{str, length} : std::string_view{});
        if (result) {
            if (error != nullptr) {
                *error = sedol_error{};
            }
            return SEDOL_OK;
        }

        auto output = to_sedol_error(result.error());
        if (error != nullptr) {
            *error = output;
        }
        return output.code;
    } catch (const std::exception &e) {
        SEDOL_ERROR("{}", e.what());
    }

    return SEDOL_ERR_INTERNAL;
}

bool sedol_clean(const char *str, uint32_t length, char *output, uint32_t *output_length)
{
    if ((str == nullptr && length > 0) || output_length == nullptr) {
        return false;
    }

    try {
        auto cleaned = sedol::clean(length > 0 ? std::string_view{str, length} : std::string_view{});
        const auto required = static_cast<uint32_t>(cleaned.size());
        if (required > *output_length || (output == nullptr && required > 0)) {
            *output_length = required;
            return false;
        }

        std::copy(cleaned.begin(), cleaned.end(), output);
        *output_length = required;
        return true;
    } catch (const std::exception &e) {
        SEDOL_ERROR("{}", e.what());
    }

    return false;
}

SEDOL_RET_CODE sedol_calc_check_digit(const char *str, uint32_t length, char *check_digit)
{
    if (str == nullptr || check_digit == nullptr) {
        return SEDOL_ERR_INVALID_ARGUMENT;
    }

    try {
        *check_digit = sedol::calc_check_digit({str, length});
        return SEDOL_OK;
    } catch (const sedol::exception &e) {
        SEDOL_ERROR("{}", e.what());
        return SEDOL_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        SEDOL_ERROR("{}", e.what());
    }

    return SEDOL_ERR_INTERNAL;
}

uint32_t sedol_error_to_string(const sedol_error *error, char *buffer, uint32_t size)
{
    if (error == nullptr) {
        return 0;
    }

    try {
        auto message = sedol::to_string(from_sedol_error(*error));
        if (buffer != nullptr && size > 0) {
            auto copied = std::min<std::size_t>(message.size(), size - 1);
            std::memcpy(buffer, message.data(), copied);
            buffer[copied] = '\0';
        }
        return static_cast<uint32_t>(message.size());
    } catch (const std::exception &e) {
        SEDOL_ERROR("{}", e.what());
    }

    if (buffer != nullptr && size > 0) {
        buffer[0] = '\0';
    }
    return 0;
}

const char *sedol_get_version() { return sedol::current_version; }

bool sedol_set_log_cb(sedol_log_cb cb, SEDOL_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    sedol::logger::init(cb, level);
    SEDOL_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}
