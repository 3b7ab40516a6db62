// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "cleaner.hpp"
#include "utils.hpp"

namespace sedol {

std::string clean(std::string_view input)
{
    std::string output;
    output.reserve(input.size());
    for (auto c : input) {
        if (sedol::isalnum(c)) {
            output.push_back(c);
        }
    }
    return output;
}

} // namespace sedol
