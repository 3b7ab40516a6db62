// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sedol {

class sedol_checksum {
public:
    static constexpr std::array<uint8_t, 6> weights = {1, 3, 1, 7, 3, 9};
    static constexpr std::size_t prefix_length = weights.size();

    // Computes the check digit from the first six characters of the candidate,
    // any subsequent characters are ignored.
    //
    // Throws invalid_candidate if the candidate has fewer than six characters
    // and invalid_symbol if any of the first six isn't part of the alphabet.
    [[nodiscard]] static char compute(std::string_view candidate);

    // Whether the seventh character matches the check digit computed from the
    // first six. Never throws, malformed candidates are reported as invalid.
    [[nodiscard]] static bool validate(std::string_view candidate) noexcept;
};

inline char calc_check_digit(std::string_view candidate)
{
    return sedol_checksum::compute(candidate);
}

} // namespace sedol
