// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file sdcp_client.h
 * @brief WebSocket client for SDCP printers (Elegoo Centauri family)
 *
 * Handles the connection lifecycle, client-level reconnects with exponential
 * backoff, command/response matching by RequestID, command timeouts and
 * periodic status polling. Runs on the control loop: the libhv WebSocket
 * client is bound to the same EventLoop as the Scheduler.
 */

#pragma once

#include "device_client.h"
#include "scheduler.h"

#include "hv/WebSocketClient.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace printcast {

/**
 * @brief Connection state of an SdcpClient
 */
enum class ConnectionState {
    DISCONNECTED, // Not connected
    CONNECTING,   // Connection in progress
    CONNECTED,    // Connected and ready
    RECONNECTING  // Automatic reconnection in progress
};

/**
 * @brief Command awaiting its response
 */
struct PendingCommand {
    RequestId id = INVALID_REQUEST_ID;
    int cmd = -1;
    CommandSuccessCallback success_callback;
    CommandErrorCallback error_callback;
    uint64_t sent_at_ms = 0;
    uint32_t timeout_ms = 0;

    bool is_timed_out(uint64_t now_ms) const {
        return now_ms - sent_at_ms > timeout_ms;
    }
};

class SdcpClient : public hv::WebSocketClient, public IDeviceClient {
  public:
    SdcpClient(hv::EventLoopPtr loop, Scheduler& scheduler);
    ~SdcpClient() override;

    SdcpClient(const SdcpClient&) = delete;
    SdcpClient& operator=(const SdcpClient&) = delete;

    void connect(const std::string& address, uint32_t timeout_ms,
                 ConnectCallback on_done) override;
    void disconnect() override;

    RequestId send_command(int cmd, const nlohmann::json& data, CommandSuccessCallback on_success,
                           CommandErrorCallback on_error, uint32_t timeout_ms) override;

    void on_status(StatusCallback cb) override;
    void register_event_handler(DeviceEventCallback cb) override;

    void start_status_polling(uint32_t interval_ms) override;
    void stop_status_polling() override;

    bool is_connected() const override {
        return connection_state_.load() == ConnectionState::CONNECTED;
    }
    std::string address() const override {
        return address_;
    }

    ConnectionState get_connection_state() const {
        return connection_state_.load();
    }

    /// MainboardID learned from the device ("" until the first message)
    const std::string& mainboard_id() const {
        return mainboard_id_;
    }

    /**
     * @brief Configure client-level reconnect backoff
     */
    void set_reconnect_delays(uint32_t min_delay_ms, uint32_t max_delay_ms) {
        reconnect_min_delay_ms_ = min_delay_ms;
        reconnect_max_delay_ms_ = max_delay_ms;
    }

  private:
    void handle_open();
    void handle_message(const std::string& msg);
    void handle_close();

    void finish_connect(bool success, const std::string& error);
    void dispatch_response(const nlohmann::json& j);
    void check_request_timeouts();
    void cleanup_pending_requests();
    void emit_event(DeviceEventType type, const std::string& message, bool is_error);
    void set_connection_state(ConnectionState new_state);
    void enable_reconnect();
    void cancel_timers();

    Scheduler& scheduler_;
    std::string address_;

    std::atomic<ConnectionState> connection_state_{ConnectionState::DISCONNECTED};
    bool ever_connected_ = false;
    bool user_disconnect_ = false;

    ConnectCallback connect_cb_;
    TimerId connect_timer_ = INVALID_TIMER_ID;
    TimerId poll_timer_ = INVALID_TIMER_ID;
    TimerId timeout_timer_ = INVALID_TIMER_ID;

    std::string mainboard_id_;

    std::mutex requests_mutex_;
    std::map<std::string, PendingCommand> pending_requests_;
    RequestId next_request_id_ = 1;

    std::mutex callbacks_mutex_;
    StatusCallback status_cb_;
    DeviceEventCallback event_handler_;

    uint32_t reconnect_min_delay_ms_ = 1000;
    uint32_t reconnect_max_delay_ms_ = 10000;

    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);
    std::atomic<bool> is_destroying_{false};
};

} // namespace printcast
