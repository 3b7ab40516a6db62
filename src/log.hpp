// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "sedol.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
#ifdef _WIN32
        char separator = '\\';
#else
        const char separator = '/';
#endif
        if (*path++ == separator) {
            base = path;
        }
    }
    return base;
}

#define SEDOL_LOG_HELPER(level, function, file, line, fmt_str, ...)                                \
    {                                                                                              \
        if (sedol::logger::valid(level)) {                                                         \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = ::fmt::format(fmt_str, ##__VA_ARGS__);                              \
                sedol::logger::log(                                                                \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    }

#define SEDOL_LOG(level, fmt, ...)                                                                 \
    SEDOL_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define SEDOL_TRACE(fmt, ...) SEDOL_LOG(sedol::log_level::trace, fmt, ##__VA_ARGS__)
#define SEDOL_DEBUG(fmt, ...) SEDOL_LOG(sedol::log_level::debug, fmt, ##__VA_ARGS__)
#define SEDOL_INFO(fmt, ...) SEDOL_LOG(sedol::log_level::info, fmt, ##__VA_ARGS__)
#define SEDOL_WARN(fmt, ...) SEDOL_LOG(sedol::log_level::warn, fmt, ##__VA_ARGS__)
#define SEDOL_ERROR(fmt, ...) SEDOL_LOG(sedol::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace sedol {

// This enum is 32 bit for compatibility with SEDOL_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

static_assert(static_cast<uint32_t>(log_level::trace) == SEDOL_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == SEDOL_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == SEDOL_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == SEDOL_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == SEDOL_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == SEDOL_LOG_OFF);

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

class logger {
public:
    using log_cb_type = sedol_log_cb;

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace sedol
