// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <string>
#include <variant>

#include "../../common/utils.hpp"
#include "alphabet.hpp"
#include "checksum/sedol_checksum.hpp"
#include "cleaner.hpp"
#include "validation_error.hpp"
#include "validator.hpp"

using namespace sedol_fuzz;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto input = bytes_to_string_view(data, size);

    auto cleaned = sedol::clean(input);
    check(sedol::clean(cleaned) == cleaned);

    for (auto candidate : {input, std::string_view{cleaned}}) {
        auto result = sedol::validate(candidate);
        check(result == sedol::validate(candidate));

        if (result) {
            check(result.value() == candidate);
            check(sedol::sedol_checksum::validate(candidate));
        } else if (std::holds_alternative<sedol::invalid_check_digit>(result.error())) {
            check(!sedol::sedol_checksum::validate(candidate));
        }

        bool prefix_in_alphabet = candidate.size() >= sedol::sedol_checksum::prefix_length;
        for (std::size_t i = 0; prefix_in_alphabet && i < sedol::sedol_checksum::prefix_length; ++i) {
            prefix_in_alphabet = sedol::is_alphabet_symbol(candidate[i]);
        }

        if (prefix_in_alphabet) {
            auto digit = sedol::calc_check_digit(candidate);
            check(digit >= '0' && digit <= '9');
        }
    }

    return 0;
}
