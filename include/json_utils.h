// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

#include "hv/json.hpp"

// Lenient field readers for SDCP payloads. Firmware versions disagree on whether numbers
// arrive as numbers or strings, and on whether flags are booleans or 0/1.
namespace printcast::json_util {

/// Field @p key of object @p j, or nullptr when @p j is not an object or the field is null/absent.
inline const nlohmann::json* field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    const nlohmann::json* v = field(j, key);
    return (v && v->is_string()) ? v->get<std::string>() : def;
}

/// Number or fully numeric string; "12abc" is rejected
inline std::optional<double> optional_double(const nlohmann::json& j, const char* key) {
    const nlohmann::json* v = field(j, key);
    if (!v) {
        return std::nullopt;
    }
    if (v->is_number()) {
        return v->get<double>();
    }
    if (!v->is_string()) {
        return std::nullopt;
    }
    const std::string& text = v->get_ref<const std::string&>();
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (*end != '\0') {
        return std::nullopt;
    }
    return parsed;
}

/// Truncated toward zero; values outside int range give nullopt
inline std::optional<int> optional_int(const nlohmann::json& j, const char* key) {
    std::optional<double> v = optional_double(j, key);
    if (!v || !(*v > INT_MIN - 1.0 && *v < INT_MAX + 1.0)) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

/// Whole number that fits in int, given as a JSON integer or a decimal string.
/// Floats and everything else give nullopt.
inline std::optional<int> integer_value(const nlohmann::json& v) {
    int64_t wide = 0;
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(INT_MAX)) {
            return std::nullopt;
        }
        return static_cast<int>(u);
    } else if (v.is_number_integer()) {
        wide = v.get<int64_t>();
    } else if (v.is_string()) {
        const std::string& text = v.get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (*end != '\0') {
            return std::nullopt;
        }
        wide = parsed;
    } else {
        return std::nullopt;
    }
    if (wide < INT_MIN || wide > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(wide);
}

inline double safe_double(const nlohmann::json& j, const char* key, double def = 0.0) {
    return optional_double(j, key).value_or(def);
}

inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    return optional_int(j, key).value_or(def);
}

inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    const nlohmann::json* v = field(j, key);
    if (v && v->is_boolean()) {
        return v->get<bool>();
    }
    if (v && v->is_number()) {
        return v->get<double>() != 0.0;
    }
    return def;
}

} // namespace printcast::json_util
