// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printcast {

/**
 * @brief Error categories for device operations
 */
enum class DeviceErrorType {
    NONE,            // No error
    TIMEOUT,         // Command or connect timed out
    CONNECTION_LOST, // WebSocket closed while the command was pending
    NOT_CONNECTED,   // Command issued without an open connection
    ACK_ERROR,       // Device answered with a non-zero Ack
    PARSE_ERROR,     // Malformed device message
    UNKNOWN
};

/**
 * @brief Error information delivered to device command error callbacks
 */
struct DeviceError {
    DeviceErrorType type = DeviceErrorType::NONE;
    int code = 0;        // Device Ack code if applicable
    std::string message; // Human-readable error message
    std::string method;  // Command that caused the error ("cmd 386")

    bool has_error() const {
        return type != DeviceErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case DeviceErrorType::NONE:
            return "NONE";
        case DeviceErrorType::TIMEOUT:
            return "TIMEOUT";
        case DeviceErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case DeviceErrorType::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case DeviceErrorType::ACK_ERROR:
            return "ACK_ERROR";
        case DeviceErrorType::PARSE_ERROR:
            return "PARSE_ERROR";
        case DeviceErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    static std::string command_name(int cmd) {
        return "cmd " + std::to_string(cmd);
    }

    static DeviceError timeout(int cmd, uint32_t timeout_ms) {
        DeviceError err;
        err.type = DeviceErrorType::TIMEOUT;
        err.method = command_name(cmd);
        err.message = "Command timed out after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    static DeviceError connection_lost(int cmd) {
        DeviceError err;
        err.type = DeviceErrorType::CONNECTION_LOST;
        err.method = command_name(cmd);
        err.message = "Connection to printer lost";
        return err;
    }

    static DeviceError not_connected(int cmd) {
        DeviceError err;
        err.type = DeviceErrorType::NOT_CONNECTED;
        err.method = command_name(cmd);
        err.message = "Printer not connected";
        return err;
    }

    /**
     * @brief Error for a device response carrying a non-zero Ack
     */
    static DeviceError from_ack(int cmd, int ack) {
        DeviceError err;
        err.type = DeviceErrorType::ACK_ERROR;
        err.code = ack;
        err.method = command_name(cmd);
        err.message = "Printer rejected command (Ack " + std::to_string(ack) + ")";
        return err;
    }

    static DeviceError parse_error(const std::string& what, int cmd = -1) {
        DeviceError err;
        err.type = DeviceErrorType::PARSE_ERROR;
        err.method = cmd >= 0 ? command_name(cmd) : "";
        err.message = "JSON parse error: " + what;
        return err;
    }
};

} // namespace printcast
