// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

namespace sedol {

// Only digits 0-9 and letters B-Z (excluding vowels) are allowed. Non-ASCII
// input is reported as the decoded codepoint, U+FFFD if it isn't valid UTF-8.
struct invalid_character {
    char32_t character;

    bool operator==(const invalid_character &other) const = default;
};

// Length must be 7
struct invalid_length {
    bool operator==(const invalid_length &other) const = default;
};

// First char is a digit but the rest of the string is not ASCII digits, old
// format SEDOLs contain only digits.
struct invalid_old_format {
    bool operator==(const invalid_old_format &other) const = default;
};

struct invalid_check_digit {
    // Check digit provided in the input
    char got;
    // Check digit computed from the first six characters
    char calc;

    bool operator==(const invalid_check_digit &other) const = default;
};

using validation_error =
    std::variant<invalid_character, invalid_length, invalid_old_format, invalid_check_digit>;

// Values match SEDOL_RET_CODE
enum class validation_error_code : int8_t {
    invalid_character = 1,
    invalid_length = 2,
    invalid_old_format = 3,
    invalid_check_digit = 4,
};

validation_error_code error_code(const validation_error &error);

std::string to_string(const validation_error &error);

std::ostream &operator<<(std::ostream &os, const validation_error &error);

} // namespace sedol

template <> struct fmt::formatter<sedol::validation_error> : fmt::formatter<std::string_view> {
    // Use the parse method from the base class formatter
    template <typename FormatContext>
    auto format(const sedol::validation_error &error, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(sedol::to_string(error), ctx);
    }
};
