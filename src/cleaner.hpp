// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace sedol {

// Remove all characters except ASCII letters and digits, case is preserved.
std::string clean(std::string_view input);

} // namespace sedol
