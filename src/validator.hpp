// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "validation_error.hpp"

namespace sedol {

// Holds either the validated SEDOL or the reason it was rejected
class validation_result {
public:
    validation_result(const validation_result &) = default;
    validation_result(validation_result &&) noexcept = default;
    validation_result &operator=(const validation_result &) = default;
    validation_result &operator=(validation_result &&) noexcept = default;
    ~validation_result() = default;

    static validation_result success(std::string value)
    {
        return validation_result{storage_type{std::in_place_index<0>, std::move(value)}};
    }

    static validation_result failure(validation_error error)
    {
        return validation_result{storage_type{std::in_place_index<1>, error}};
    }

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    // Throws std::bad_variant_access when called on the wrong alternative
    [[nodiscard]] const std::string &value() const { return std::get<0>(storage_); }
    [[nodiscard]] const validation_error &error() const { return std::get<1>(storage_); }

    bool operator==(const validation_result &other) const = default;

protected:
    using storage_type = std::variant<std::string, validation_error>;

    explicit validation_result(storage_type storage) : storage_(std::move(storage)) {}

    storage_type storage_;
};

// Check if the SEDOL is valid. The checks are performed in the following
// order and the first one failing is reported:
//   1. only digits 0-9 and letters B-Z (excluding vowels) are present
//   2. the length of the string is 7
//   3. all characters are digits if the first char is a digit
//   4. the computed check digit matches the last character
//
// On success the result contains the input, unmodified.
validation_result validate(std::string_view input);

} // namespace sedol
