// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "common/gtest_utils.hpp"
#include "sedol.h"

using namespace std::literals;

SEDOL_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return SEDOL_LOG_TRACE;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return SEDOL_LOG_DEBUG;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return SEDOL_LOG_ERROR;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return SEDOL_LOG_WARN;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return SEDOL_LOG_INFO;
    }

    return SEDOL_LOG_OFF;
}

void log_cb(SEDOL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    fmt::print("[{}][{}:{}:{}]: {}\n", level_to_str(level), file, function, line, message);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
SEDOL_LOG_LEVEL find_log_level(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("SEDOL_TEST_LOG_LEVEL");
    if (env_level != nullptr) {
        return str_to_level(env_level);
    }

    SEDOL_LOG_LEVEL level = SEDOL_LOG_TRACE;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log_level" || arg == "--log-level") {
            if (i + 1 < argc) {
                level = str_to_level(argv[i + 1]);
            }
            break;
        }
    }
    return level;
}

int main(int argc, char *argv[])
{
    sedol_set_log_cb(log_cb, find_log_level(argc, argv));

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
