// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace sedol {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    const std::string what_;
};

// Character outside of the SEDOL alphabet given to the check digit calculator
class invalid_symbol : public exception {
public:
    invalid_symbol(char symbol, std::size_t position)
        : exception(fmt::format("invalid symbol '{}' at position {}", symbol, position)),
          symbol_(symbol), position_(position)
    {}

    [[nodiscard]] char symbol() const noexcept { return symbol_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

protected:
    char symbol_;
    std::size_t position_;
};

class invalid_candidate : public exception {
public:
    using exception::exception;
};

} // namespace sedol
