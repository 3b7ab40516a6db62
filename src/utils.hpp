// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <algorithm>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace sedol {

// Locale-independent ASCII classification
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

inline bool all_digits(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); });
}

} // namespace sedol
