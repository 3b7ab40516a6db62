// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <cstring>
#include <string_view>

namespace sedol_fuzz {

// Utility to convert raw bytes to string_view
inline std::string_view bytes_to_string_view(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view{reinterpret_cast<const char *>(data), size};
}

// Abort the run so the fuzzer records the input
inline void check(bool condition)
{
    if (!condition) {
        __builtin_trap();
    }
}

} // namespace sedol_fuzz
