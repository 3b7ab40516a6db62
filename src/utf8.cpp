// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#include <array>
#include <cstdint>
#include <string>

#include "utf8.hpp"

namespace sedol::utf8 {

namespace {

// Length of the sequence starting at buffer[0], -1 if it isn't well formed
int8_t sequence_length(const char *buffer, uint64_t length_left)
{
    if (length_left == 0) {
        return 0;
    }

    const auto lead = static_cast<uint8_t>(buffer[0]);
    int8_t expected = -1;

    // 0xxxxxxx
    if ((lead & 0x80) == 0) {
        return 1;
    }

    if ((lead >> 5) == 0x6) {
        // 110xxxxx
        expected = 2;
    } else if ((lead >> 4) == 0xe) {
        // 1110xxxx
        expected = 3;
    } else if ((lead >> 3) == 0x1e) {
        // 11110xxx
        expected = 4;
    }

    if (expected < 0 || static_cast<uint64_t>(expected) > length_left) {
        return -1;
    }

    // Continuation bytes are all 10xxxxxx
    for (int8_t i = 1; i < expected; ++i) {
        if ((static_cast<uint8_t>(buffer[i]) >> 6) != 0x2) {
            return -1;
        }
    }

    return expected;
}

} // namespace

uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer)
{
    if (codepoint <= 0x7F) {
        *utf8_buffer = static_cast<char>(codepoint);
        return 1;
    }

    /*
     0x000080-0x0007FF: 110xxxxx 10xxxxxx
     0x000800-0x00FFFF: 1110xxxx 10xxxxxx 10xxxxxx
     0x010000-0x10FFFF: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
     */
    if (codepoint > max_codepoint) {
        return 0;
    }

    if (codepoint > 0xFFFF) {
        *utf8_buffer++ = static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        *utf8_buffer++ = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 4;
    }

    if (codepoint > 0x7FF) {
        *utf8_buffer++ = static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        *utf8_buffer++ = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 3;
    }

    *utf8_buffer++ = static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F));
    *utf8_buffer++ = static_cast<char>(0x80 | (codepoint & 0x3F));
    return 2;
}

uint32_t fetch_next_codepoint(const char *utf8_buffer, uint64_t &position, uint64_t length)
{
    if (position >= length) {
        return eof;
    }

    const int8_t next_length = sequence_length(&utf8_buffer[position], length - position);
    if (next_length == 0) {
        return eof;
    }

    if (next_length < 0) {
        position += 1;
        return invalid;
    }

    if (next_length == 1) {
        return static_cast<uint8_t>(utf8_buffer[position++]);
    }

    //  2 bytes: 110xxxxx -> & 00011111
    //  3 bytes: 1110xxxx -> & 00001111
    //  4 bytes: 11110xxx -> & 00000111
    uint32_t codepoint = static_cast<uint8_t>(utf8_buffer[position]) & (0xFF >> (next_length + 1));
    for (int8_t i = 1; i < next_length; ++i) {
        codepoint <<= 6;
        codepoint |= static_cast<uint8_t>(utf8_buffer[position + i]) & 0x3F;
    }

    position += static_cast<uint8_t>(next_length);
    return codepoint;
}

std::string to_string(uint32_t codepoint)
{
    if ((codepoint >= 0xD800 && codepoint <= 0xDFFF) || codepoint > max_codepoint) {
        codepoint = replacement_character;
    }

    std::array<char, 4> buffer{};
    auto written = codepoint_to_bytes(codepoint, buffer.data());
    return {buffer.data(), written};
}

} // namespace sedol::utf8
