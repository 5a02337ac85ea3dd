// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "environment_config.h"

#include <cerrno>
#include <cstdlib>

namespace printcast {
namespace config {

std::optional<int> EnvironmentConfig::get_int(const char* name, int min, int max) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0') {
        return std::nullopt;
    }
    if (parsed < min || parsed > max) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

bool EnvironmentConfig::exists(const char* name) {
    return std::getenv(name) != nullptr;
}

std::optional<std::string> EnvironmentConfig::get_string(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace config
} // namespace printcast
