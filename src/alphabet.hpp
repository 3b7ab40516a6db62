// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace sedol {

// Digits followed by the consonants, vowels are never part of a SEDOL.
inline constexpr std::string_view alphabet = "0123456789BCDFGHJKLMNPQRSTVWXYZ";

namespace detail {

inline constexpr uint8_t npos = std::numeric_limits<uint8_t>::max();

// Digits are worth their face value and letters keep their place in the full
// Latin alphabet, starting at 10 (B is 11, Z is 35), so excluded vowels leave
// gaps in the value range.
constexpr std::array<uint8_t, 256> make_value_table()
{
    std::array<uint8_t, 256> table{};
    for (auto &entry : table) { entry = npos; }

    for (auto c : alphabet) {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        auto value = c <= '9' ? c - '0' : c - 'A' + 10;
        table[static_cast<uint8_t>(c)] = static_cast<uint8_t>(value);
    }
    return table;
}

inline constexpr std::array<uint8_t, 256> value_table = make_value_table();

} // namespace detail

// Value of the symbol in the check digit computation, if part of the alphabet
constexpr std::optional<unsigned> symbol_value(char c) noexcept
{
    const auto value = detail::value_table[static_cast<uint8_t>(c)];
    if (value == detail::npos) {
        return std::nullopt;
    }
    return value;
}

constexpr bool is_alphabet_symbol(char c) noexcept { return symbol_value(c).has_value(); }

static_assert(alphabet.size() == 31);
static_assert(symbol_value('0') == 0U && symbol_value('9') == 9U);
static_assert(symbol_value('B') == 11U && symbol_value('Z') == 35U);
static_assert(!is_alphabet_symbol('A') && !is_alphabet_symbol('E') && !is_alphabet_symbol('I') &&
              !is_alphabet_symbol('O') && !is_alphabet_symbol('U'));

} // namespace sedol
