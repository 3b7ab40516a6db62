// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "common/utils.hpp"
#include "sedol.h"

namespace {

void print_usage(const char *name)
{
    printf("Usage: %s [--clean] [--check-digit] [--log-level <level>] <sedol>...\n", name);
    printf("  --clean          remove non-alphanumeric characters before validating\n");
    printf("  --check-digit    complete each six character prefix with its check digit\n");
    printf("  --log-level      one of trace, debug, info, warn, error, off (default)\n");
}

std::string clean(const std::string &input)
{
    std::string output(input.size(), '\0');
    auto length = static_cast<uint32_t>(output.size());
    if (!sedol_clean(input.data(), static_cast<uint32_t>(input.size()), output.data(), &length)) {
        return {};
    }
    output.resize(length);
    return output;
}

bool check_digit(const std::string &input)
{
    char digit = 0;
    auto code = sedol_calc_check_digit(input.data(), static_cast<uint32_t>(input.size()), &digit);
    if (code != SEDOL_OK) {
        printf("%s: not a valid SEDOL prefix\n", input.c_str());
        return false;
    }

    printf("%s: %.6s%c\n", input.c_str(), input.c_str(), digit);
    return true;
}

bool validate(const std::string &input)
{
    sedol_error error{};
    auto code = sedol_validate(input.data(), static_cast<uint32_t>(input.size()), &error);
    if (code == SEDOL_OK) {
        printf("%s: ok\n", input.c_str());
        return true;
    }

    if (code < SEDOL_OK) {
        printf("%s: internal error\n", input.c_str());
        return false;
    }

    std::array<char, 128> message{};
    sedol_error_to_string(&error, message.data(), message.size());
    printf("%s: %s\n", input.c_str(), message.data());
    return false;
}

} // namespace

int main(int argc, char *argv[])
{
    bool clean_input = false;
    bool compute_check_digit = false;
    SEDOL_LOG_LEVEL level = SEDOL_LOG_OFF;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--clean") {
            clean_input = true;
        } else if (arg == "--check-digit") {
            compute_check_digit = true;
        } else if (arg == "--log-level" || arg == "--log_level") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            level = str_to_level(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            inputs.emplace_back(arg);
        }
    }

    if (inputs.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    sedol_set_log_cb(log_cb, level);

    bool success = true;
    for (auto &input : inputs) {
        if (clean_input) {
            input = clean(input);
        }

        success = (compute_check_digit ? check_digit(input) : validate(input)) && success;
    }

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
