// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "utf8.hpp"
#include "validation_error.hpp"

namespace sedol {

validation_error_code error_code(const validation_error &error)
{
    return std::visit(
        [](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, invalid_character>) {
                return validation_error_code::invalid_character;
            } else if constexpr (std::is_same_v<T, invalid_length>) {
                return validation_error_code::invalid_length;
            } else if constexpr (std::is_same_v<T, invalid_old_format>) {
                return validation_error_code::invalid_old_format;
            } else {
                return validation_error_code::invalid_check_digit;
            }
        },
        error);
}

std::string to_string(const validation_error &error)
{
    return std::visit(
        [](const auto &e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, invalid_character>) {
                return "invalid character " + utf8::to_string(e.character);
            } else if constexpr (std::is_same_v<T, invalid_length>) {
                return "invalid length, expected 7";
            } else if constexpr (std::is_same_v<T, invalid_old_format>) {
                return "invalid format, expected all digits when first char is digit";
            } else {
                return fmt::format("invalid check digit {}, expected {}", e.got, e.calc);
            }
        },
        error);
}

std::ostream &operator<<(std::ostream &os, const validation_error &error)
{
    return os << to_string(error);
}

} // namespace sedol
