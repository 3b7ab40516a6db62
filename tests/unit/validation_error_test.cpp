// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <sstream>

#include <fmt/format.h>

#include "validation_error.hpp"
#include "validator.hpp"

#include "common/gtest_utils.hpp"

using namespace sedol;

namespace {

TEST(TestValidationError, ToString)
{
    EXPECT_EQ(to_string(invalid_character{'!'}), "invalid character !");
    EXPECT_EQ(to_string(invalid_length{}), "invalid length, expected 7");
    EXPECT_EQ(to_string(invalid_old_format{}),
        "invalid format, expected all digits when first char is digit");
    EXPECT_EQ(to_string(invalid_check_digit{'6', '7'}), "invalid check digit 6, expected 7");
}

TEST(TestValidationError, FromValidation)
{
    EXPECT_EQ(to_string(validate("BD9MZZ6").error()), "invalid check digit 6, expected 7");
    EXPECT_EQ(to_string(validate("0D9MZZ6").error()),
        "invalid format, expected all digits when first char is digit");
    EXPECT_EQ(to_string(validate("0D9MZZ").error()), "invalid length, expected 7");
    EXPECT_EQ(to_string(validate("!D9MZZ").error()), "invalid character !");
}

TEST(TestValidationError, Format)
{
    const validation_error error = invalid_check_digit{'7', '8'};
    EXPECT_EQ(fmt::format("{}", error), "invalid check digit 7, expected 8");
    EXPECT_EQ(fmt::format("[{:>30}]", validation_error{invalid_character{'A'}}),
        "[           invalid character A]");
}

TEST(TestValidationError, Stream)
{
    std::stringstream ss;
    ss << validation_error{invalid_length{}};
    EXPECT_EQ(ss.str(), "invalid length, expected 7");
}

TEST(TestValidationError, Equality)
{
    EXPECT_EQ(validation_error{invalid_character{'A'}}, validation_error{invalid_character{'A'}});
    EXPECT_NE(validation_error{invalid_character{'A'}}, validation_error{invalid_character{'E'}});
    EXPECT_NE(validation_error{invalid_length{}}, validation_error{invalid_old_format{}});
    EXPECT_EQ((validation_error{invalid_check_digit{'6', '7'}}),
        (validation_error{invalid_check_digit{'6', '7'}}));
    EXPECT_NE((validation_error{invalid_check_digit{'6', '7'}}),
        (validation_error{invalid_check_digit{'7', '6'}}));
}

TEST(TestValidationError, Code)
{
    EXPECT_EQ(error_code(invalid_character{'A'}), validation_error_code::invalid_character);
    EXPECT_EQ(error_code(invalid_length{}), validation_error_code::invalid_length);
    EXPECT_EQ(error_code(invalid_old_format{}), validation_error_code::invalid_old_format);
    EXPECT_EQ(error_code(invalid_check_digit{'1', '2'}), validation_error_code::invalid_check_digit);
}

} // namespace
