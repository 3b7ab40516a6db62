// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "cleaner.hpp"

#include "common/gtest_utils.hpp"

using namespace sedol;
using namespace std::literals;

namespace {

TEST(TestCleaner, RemovesSeparators)
{
    // Common UK DMO format
    EXPECT_STR(clean("BD-9MZ-Z7"), "BD9MZZ7");
    EXPECT_STR(clean("BD-9MZ-Z7??!!  "), "BD9MZZ7");
    EXPECT_STR(clean(" BD9-MZ-Z7?"), "BD9MZZ7");
    EXPECT_STR(clean("B0Y.N5X.5"), "B0YN5X5");
    EXPECT_STR(clean("\tB0YN5X5\r\n"), "B0YN5X5");
}

TEST(TestCleaner, PreservesCase)
{
    EXPECT_STR(clean("bd-9mz-z7"), "bd9mzz7");
    EXPECT_STR(clean("aEiOu"), "aEiOu");
}

TEST(TestCleaner, RemovesNonAscii)
{
    EXPECT_STR(clean("B\xC3\xA9" "D9MZZ7"), "BD9MZZ7");
    EXPECT_STR(clean("\xE2\x80\x94" "5954135"), "5954135");
}

TEST(TestCleaner, RemovesNullCharacters)
{
    EXPECT_STR(clean("BD9\0MZZ7"sv), "BD9MZZ7");
}

TEST(TestCleaner, EmptyResult)
{
    EXPECT_TRUE(clean("").empty());
    EXPECT_TRUE(clean("   ").empty());
    EXPECT_TRUE(clean("-_-!?").empty());
}

TEST(TestCleaner, Idempotent)
{
    for (std::string_view input : {"BD-9MZ-Z7??!!  ", "", "  a b c ", "0-1-2", "~~~"}) {
        auto once = clean(input);
        EXPECT_THAT(once, ::testing::MatchesRegex("[A-Za-z0-9]*"));
        EXPECT_EQ(clean(once), once);
    }
}

} // namespace
