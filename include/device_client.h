// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file device_client.h
 * @brief Abstract connection to one printer
 *
 * The supervisor only talks to printers through this interface, so tests can
 * drive it with a scripted fake and the wire protocol stays in SdcpClient.
 *
 * All callbacks are delivered on the control loop.
 */

#pragma once

#include "device_error.h"
#include "device_events.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "hv/json.hpp"

namespace printcast {

/**
 * @brief Unique identifier for device commands
 *
 * Valid IDs are always > 0; ID 0 indicates a command that was not sent.
 */
using RequestId = uint64_t;
constexpr RequestId INVALID_REQUEST_ID = 0;

/// SDCP command numbers used by the monitor
constexpr int SDCP_CMD_STATUS = 0;
constexpr int SDCP_CMD_ATTRIBUTES = 1;
constexpr int SDCP_CMD_CAMERA_STREAM = 386;

/// Device port and path of the SDCP WebSocket
constexpr int SDCP_WEBSOCKET_PORT = 3030;

using ConnectCallback = std::function<void(bool success, const std::string& error)>;
using StatusCallback = std::function<void(const nlohmann::json& payload)>;
using CommandSuccessCallback = std::function<void(const nlohmann::json& response)>;
using CommandErrorCallback = std::function<void(const DeviceError& error)>;

class IDeviceClient {
  public:
    virtual ~IDeviceClient() = default;

    /**
     * @brief Open the connection to @p address
     *
     * @p on_done is invoked exactly once: with success when the connection is
     * open, or with an error after failure or @p timeout_ms.
     */
    virtual void connect(const std::string& address, uint32_t timeout_ms,
                         ConnectCallback on_done) = 0;

    /// Close the connection and stop client-level reconnects. Idempotent.
    virtual void disconnect() = 0;

    /**
     * @brief Send a command and wait for the matching response
     *
     * Exactly one of @p on_success / @p on_error is invoked, unless the
     * client is destroyed first.
     *
     * @return Request ID, or INVALID_REQUEST_ID when not connected
     *         (@p on_error has then already been invoked)
     */
    virtual RequestId send_command(int cmd, const nlohmann::json& data,
                                   CommandSuccessCallback on_success,
                                   CommandErrorCallback on_error, uint32_t timeout_ms) = 0;

    /// Listener for unsolicited status/attributes messages (replaces any previous)
    virtual void on_status(StatusCallback cb) = 0;

    /// Listener for lifecycle events (replaces any previous)
    virtual void register_event_handler(DeviceEventCallback cb) = 0;

    virtual void start_status_polling(uint32_t interval_ms) = 0;
    virtual void stop_status_polling() = 0;

    virtual bool is_connected() const = 0;
    virtual std::string address() const = 0;
};

using DeviceClientPtr = std::shared_ptr<IDeviceClient>;
using DeviceClientFactory = std::function<DeviceClientPtr()>;

} // namespace printcast
