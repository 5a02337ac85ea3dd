// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file environment_config.h
 * @brief Bounded parsing of environment variables
 *
 * Every getter returns std::nullopt (or false) for a missing, malformed or
 * out-of-range value so the caller can fall back to its default.
 */

#pragma once

#include <optional>
#include <string>

namespace printcast {
namespace config {

class EnvironmentConfig {
  public:
    /// Integer in [min, max]; trailing garbage is rejected
    static std::optional<int> get_int(const char* name, int min, int max);

    /// True when set, even to an empty string
    static bool exists(const char* name);

    static std::optional<std::string> get_string(const char* name);
};

} // namespace config
} // namespace printcast
