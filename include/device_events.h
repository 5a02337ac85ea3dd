// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace printcast {

/**
 * @brief Lifecycle events emitted by a device client
 *
 * The supervisor reacts to DISCONNECTED, ERROR and RECONNECTED. The remaining
 * types are informational and only logged.
 */
enum class DeviceEventType {
    DISCONNECTED,   ///< WebSocket closed after having been open
    ERROR,          ///< Transport or protocol error on an open connection
    RECONNECTING,   ///< Client-level reconnect attempt started
    RECONNECTED,    ///< Connection re-established after a drop
    REQUEST_TIMEOUT ///< A command timed out
};

inline const char* device_event_name(DeviceEventType type) {
    switch (type) {
    case DeviceEventType::DISCONNECTED:
        return "DISCONNECTED";
    case DeviceEventType::ERROR:
        return "ERROR";
    case DeviceEventType::RECONNECTING:
        return "RECONNECTING";
    case DeviceEventType::RECONNECTED:
        return "RECONNECTED";
    case DeviceEventType::REQUEST_TIMEOUT:
        return "REQUEST_TIMEOUT";
    }
    return "UNKNOWN";
}

struct DeviceEvent {
    DeviceEventType type;
    std::string message; ///< Human-readable message
    bool is_error;       ///< true for errors, false for warnings/info
};

using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

} // namespace printcast
