// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "alphabet.hpp"
#include "checksum/sedol_checksum.hpp"
#include "log.hpp"
#include "utf8.hpp"
#include "utils.hpp"
#include "validation_error.hpp"
#include "validator.hpp"

namespace sedol {

namespace {

constexpr std::size_t sedol_length = sedol_checksum::prefix_length + 1;

// Character starting at byte position, decoded as UTF-8 when outside ASCII
char32_t character_at(std::string_view input, std::size_t position)
{
    uint64_t next = position;
    auto codepoint = utf8::fetch_next_codepoint(input.data(), next, input.size());
    if (codepoint == utf8::invalid || codepoint == utf8::eof) {
        return utf8::replacement_character;
    }
    return codepoint;
}

validation_result reject(std::string_view input, validation_error error)
{
    SEDOL_DEBUG("Rejected '{}': {}", input, error);
    return validation_result::failure(error);
}

} // namespace

validation_result validate(std::string_view input)
{
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!is_alphabet_symbol(input[i])) {
            return reject(input, invalid_character{character_at(input, i)});
        }
    }

    if (input.size() != sedol_length) {
        return reject(input, invalid_length{});
    }

    if (isdigit(input.front()) && !all_digits(input)) {
        return reject(input, invalid_old_format{});
    }

    const char got = input.back();
    const char calc = calc_check_digit(input);
    if (got != calc) {
        return reject(input, invalid_check_digit{got, calc});
    }

    SEDOL_TRACE("Accepted '{}'", input);
    return validation_result::success(std::string{input});
}

} // namespace sedol
