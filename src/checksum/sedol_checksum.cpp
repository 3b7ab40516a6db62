// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "alphabet.hpp"
#include "checksum/sedol_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace sedol {

char sedol_checksum::compute(std::string_view candidate)
{
    if (candidate.size() < prefix_length) {
        SEDOL_ERROR("Candidate '{}' is shorter than {} characters", candidate, prefix_length);
        throw invalid_candidate(
            fmt::format("expected at least {} characters, got {}", prefix_length, candidate.size()));
    }

    unsigned sum = 0;
    for (std::size_t i = 0; i < prefix_length; ++i) {
        const auto c = candidate[i];
        auto value = symbol_value(c);
        if (!value.has_value()) {
            SEDOL_ERROR("Candidate '{}' contains invalid symbol at position {}", candidate, i);
            throw invalid_symbol(c, i);
        }
        sum += weights[i] * value.value();
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return static_cast<char>('0' + (10 - (sum % 10)) % 10);
}

bool sedol_checksum::validate(std::string_view candidate) noexcept
{
    if (candidate.size() != prefix_length + 1) {
        return false;
    }

    for (std::size_t i = 0; i < prefix_length; ++i) {
        if (!is_alphabet_symbol(candidate[i])) {
            return false;
        }
    }

    return compute(candidate) == candidate.back();
}

} // namespace sedol
