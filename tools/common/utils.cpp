// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <iostream>
#include <string_view>

#include "common/utils.hpp"

using namespace std::literals;

const char* level_to_str(SEDOL_LOG_LEVEL level)
{
    switch (level) {
    case SEDOL_LOG_TRACE:
        return "trace";
    case SEDOL_LOG_DEBUG:
        return "debug";
    case SEDOL_LOG_ERROR:
        return "error";
    case SEDOL_LOG_WARN:
        return "warn";
    case SEDOL_LOG_INFO:
        return "info";
    case SEDOL_LOG_OFF:
        break;
    }

    return "off";
}

SEDOL_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return SEDOL_LOG_TRACE;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return SEDOL_LOG_DEBUG;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return SEDOL_LOG_INFO;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return SEDOL_LOG_WARN;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return SEDOL_LOG_ERROR;
    }

    return SEDOL_LOG_OFF;
}

void log_cb(SEDOL_LOG_LEVEL level,
            const char* function, const char* file, unsigned line,
            const char* message, uint64_t  /*length*/)
{
    std::cerr << "[" << level_to_str(level)
              << "][" << file
              << ":" << function
              << ":" << line
              << "]: " << message
              << '\n';
}
