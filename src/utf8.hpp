// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>

namespace sedol::utf8 {

constexpr uint32_t max_codepoint = 0x10FFFF;
constexpr uint32_t replacement_character = 0xFFFD;
constexpr uint32_t invalid = 0xFFFFFFFF;
constexpr uint32_t eof = 0xFFFFFFFE;

// Writes up to four bytes, returns the number written or 0 if the codepoint
// is out of range.
uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer);

// Decodes the codepoint starting at position and advances position past it.
// Malformed sequences advance by a single byte and return invalid.
uint32_t fetch_next_codepoint(const char *utf8_buffer, uint64_t &position, uint64_t length);

// Encodes the codepoint, surrogates and out of range values are rendered as
// U+FFFD.
std::string to_string(uint32_t codepoint);

} // namespace sedol::utf8
