// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <tuple>

#include "alphabet.hpp"
#include "checksum/sedol_checksum.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace sedol;

namespace {

TEST(TestSedolChecksum, Compute)
{
    EXPECT_EQ(calc_check_digit("BD9MZZ"), '7');
    EXPECT_EQ(calc_check_digit("B15KXQ"), '8');
    EXPECT_EQ(calc_check_digit("595413"), '5');
    EXPECT_EQ(calc_check_digit("000000"), '0');
    EXPECT_EQ(calc_check_digit("710889"), '9');
    EXPECT_EQ(calc_check_digit("B0YBKJ"), '7');
    EXPECT_EQ(calc_check_digit("406566"), '3');
    EXPECT_EQ(calc_check_digit("B0YBLH"), '2');
    EXPECT_EQ(calc_check_digit("228276"), '5');
    EXPECT_EQ(calc_check_digit("B0YBKL"), '9');
    EXPECT_EQ(calc_check_digit("557910"), '7');
    EXPECT_EQ(calc_check_digit("B0YBKR"), '5');
    EXPECT_EQ(calc_check_digit("585284"), '2');
    EXPECT_EQ(calc_check_digit("B0YBKT"), '7');
    EXPECT_EQ(calc_check_digit("B00030"), '0');
}

TEST(TestSedolChecksum, IgnoresTrailingCharacters)
{
    EXPECT_EQ(calc_check_digit("BD9MZZ7"), '7');
    EXPECT_EQ(calc_check_digit("BD9MZZ6"), '7');
    EXPECT_EQ(calc_check_digit("BD9MZZ-anything"), '7');
}

TEST(TestSedolChecksum, InvalidSymbol)
{
    EXPECT_THROW(std::ignore = calc_check_digit("AD9MZZ"), invalid_symbol);
    EXPECT_THROW(std::ignore = calc_check_digit("bd9mzz"), invalid_symbol);
    EXPECT_THROW(std::ignore = calc_check_digit("BD9MZ "), invalid_symbol);

    try {
        std::ignore = calc_check_digit("BD9EZZ");
        FAIL() << "expected invalid_symbol";
    } catch (const invalid_symbol &e) {
        EXPECT_EQ(e.symbol(), 'E');
        EXPECT_EQ(e.position(), 3U);
        EXPECT_STR(e.what(), "invalid symbol 'E' at position 3");
    }
}

TEST(TestSedolChecksum, ShortCandidate)
{
    EXPECT_THROW(std::ignore = calc_check_digit(""), invalid_candidate);
    EXPECT_THROW(std::ignore = calc_check_digit("BD9MZ"), invalid_candidate);
    EXPECT_THROW(std::ignore = calc_check_digit("BD9MZ"), sedol::exception);
}

TEST(TestSedolChecksum, CheckDigitRange)
{
    // Vary every position across the whole alphabet
    std::string candidate = "B00000";
    for (std::size_t i = 0; i < candidate.size(); ++i) {
        for (auto c : alphabet) {
            candidate[i] = c;
            auto digit = calc_check_digit(candidate);
            EXPECT_GE(digit, '0');
            EXPECT_LE(digit, '9');
            EXPECT_EQ(calc_check_digit(candidate), digit);
        }
        candidate[i] = '0';
    }
}

TEST(TestSedolChecksum, Validate)
{
    EXPECT_TRUE(sedol_checksum::validate("BD9MZZ7"));
    EXPECT_TRUE(sedol_checksum::validate("B15KXQ8"));
    EXPECT_TRUE(sedol_checksum::validate("5954135"));

    EXPECT_FALSE(sedol_checksum::validate("BD9MZZ6"));
    EXPECT_FALSE(sedol_checksum::validate("BD9MZZ"));
    EXPECT_FALSE(sedol_checksum::validate("BD9MZZ77"));
    EXPECT_FALSE(sedol_checksum::validate("AD9MZZ7"));
    EXPECT_FALSE(sedol_checksum::validate(""));
}

} // namespace
