// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sdcp_client.h"

#include "sdcp_protocol.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <vector>

using json = nlohmann::json;

namespace printcast {

namespace {

constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;
constexpr uint32_t TIMEOUT_SWEEP_INTERVAL_MS = 500;
constexpr int PING_INTERVAL_MS = 10000;

const char* connection_state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "DISCONNECTED";
    case ConnectionState::CONNECTING:
        return "CONNECTING";
    case ConnectionState::CONNECTED:
        return "CONNECTED";
    case ConnectionState::RECONNECTING:
        return "RECONNECTING";
    }
    return "UNKNOWN";
}

int64_t unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

SdcpClient::SdcpClient(hv::EventLoopPtr loop, Scheduler& scheduler)
    : hv::WebSocketClient(std::move(loop)), scheduler_(scheduler) {}

SdcpClient::~SdcpClient() {
    is_destroying_.store(true);
    lifetime_guard_.reset();

    cancel_timers();
    setReconnect(nullptr);

    onopen = []() {};
    onmessage = [](const std::string&) {};
    onclose = []() {};

    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        pending_requests_.clear();
    }
    close();
}

void SdcpClient::set_connection_state(ConnectionState new_state) {
    ConnectionState old_state = connection_state_.exchange(new_state);
    if (old_state != new_state) {
        spdlog::debug("[SDCP Client] {} -> {}", connection_state_name(old_state),
                      connection_state_name(new_state));
    }
}

void SdcpClient::cancel_timers() {
    for (TimerId* timer : {&connect_timer_, &poll_timer_, &timeout_timer_}) {
        if (*timer != INVALID_TIMER_ID) {
            scheduler_.cancel(*timer);
            *timer = INVALID_TIMER_ID;
        }
    }
}

void SdcpClient::connect(const std::string& address, uint32_t timeout_ms,
                         ConnectCallback on_done) {
    close();
    setReconnect(nullptr);

    address_ = address;
    user_disconnect_ = false;
    ever_connected_ = false;
    connect_cb_ = std::move(on_done);

    std::string url = sdcp::websocket_url(address);
    setConnectTimeout(static_cast<int>(timeout_ms));
    setPingInterval(PING_INTERVAL_MS);

    spdlog::debug("[SDCP Client] Connecting to {}", url);
    set_connection_state(ConnectionState::CONNECTING);

    std::weak_ptr<bool> weak_guard = lifetime_guard_;

    onopen = [this, weak_guard]() {
        if (!weak_guard.lock() || is_destroying_.load()) {
            return;
        }
        try {
            handle_open();
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] onopen handler threw exception: {}", e.what());
        }
    };

    onmessage = [this, weak_guard](const std::string& msg) {
        if (!weak_guard.lock() || is_destroying_.load()) {
            return;
        }
        try {
            handle_message(msg);
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] onmessage handler threw exception: {}", e.what());
        }
    };

    onclose = [this, weak_guard]() {
        if (!weak_guard.lock() || is_destroying_.load()) {
            return;
        }
        try {
            handle_close();
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] onclose handler threw exception: {}", e.what());
        }
    };

    // libhv bounds the TCP connect; this also bounds the WebSocket handshake
    connect_timer_ = scheduler_.call_later(timeout_ms, [this, weak_guard, timeout_ms, url]() {
        if (!weak_guard.lock()) {
            return;
        }
        connect_timer_ = INVALID_TIMER_ID;
        if (connect_cb_) {
            spdlog::warn("[SDCP Client] Connection to {} timed out after {}ms", url, timeout_ms);
            setReconnect(nullptr);
            set_connection_state(ConnectionState::DISCONNECTED);
            finish_connect(false, "Connection timeout after " + std::to_string(timeout_ms) + "ms");
            close();
        }
    });

    http_headers headers;
    int rc = open(url.c_str(), headers);
    if (rc != 0) {
        spdlog::error("[SDCP Client] open({}) failed: {}", url, rc);
        set_connection_state(ConnectionState::DISCONNECTED);
        finish_connect(false, "Failed to open WebSocket (error " + std::to_string(rc) + ")");
    }
}

void SdcpClient::finish_connect(bool success, const std::string& error) {
    if (connect_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(connect_timer_);
        connect_timer_ = INVALID_TIMER_ID;
    }
    ConnectCallback cb = std::move(connect_cb_);
    connect_cb_ = nullptr;
    if (!cb) {
        return;
    }
    try {
        cb(success, error);
    } catch (const std::exception& e) {
        spdlog::error("[SDCP Client] Connect callback threw exception: {}", e.what());
    }
}

void SdcpClient::enable_reconnect() {
    reconn_setting_t reconn;
    reconn_setting_init(&reconn);
    reconn.min_delay = reconnect_min_delay_ms_;
    reconn.max_delay = reconnect_max_delay_ms_;
    reconn.delay_policy = 2; // Exponential backoff
    setReconnect(&reconn);
}

void SdcpClient::handle_open() {
    spdlog::info("[SDCP Client] Connected to {}", address_);

    bool is_reconnect = ever_connected_;
    ever_connected_ = true;
    set_connection_state(ConnectionState::CONNECTED);
    enable_reconnect();

    if (timeout_timer_ == INVALID_TIMER_ID) {
        timeout_timer_ =
            scheduler_.call_every(TIMEOUT_SWEEP_INTERVAL_MS, [this]() { check_request_timeouts(); });
    }

    if (is_reconnect) {
        emit_event(DeviceEventType::RECONNECTED, "Connection restored", false);
    } else {
        finish_connect(true, "");
    }
}

void SdcpClient::handle_message(const std::string& msg) {
    if (msg.size() > MAX_MESSAGE_SIZE) {
        spdlog::error("[SDCP Client] Message too large: {} bytes (max: {})", msg.size(),
                      MAX_MESSAGE_SIZE);
        emit_event(DeviceEventType::ERROR,
                   "Received oversized message from printer (" + std::to_string(msg.size()) +
                       " bytes)",
                   true);
        return;
    }

    check_request_timeouts();

    json j;
    try {
        j = json::parse(msg);
    } catch (const json::parse_error& e) {
        spdlog::warn("[SDCP Client] {}", DeviceError::parse_error(e.what()).message);
        return;
    }

    if (mainboard_id_.empty()) {
        std::string id = sdcp::find_mainboard_id(j);
        if (!id.empty()) {
            mainboard_id_ = id;
            spdlog::debug("[SDCP Client] Learned MainboardID {}", mainboard_id_);
        }
    }

    switch (sdcp::classify(j)) {
    case sdcp::MessageKind::RESPONSE:
        dispatch_response(j);
        break;
    case sdcp::MessageKind::STATUS: {
        StatusCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = status_cb_;
        }
        if (cb) {
            cb(j);
        }
        break;
    }
    case sdcp::MessageKind::OTHER:
        spdlog::trace("[SDCP Client] Ignoring message: {}", msg.substr(0, 200));
        break;
    }
}

void SdcpClient::dispatch_response(const json& j) {
    std::string request_id = sdcp::response_request_id(j);

    CommandSuccessCallback success_cb;
    int cmd = -1;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(request_id);
        if (it == pending_requests_.end()) {
            spdlog::trace("[SDCP Client] Response for unknown request {}", request_id);
            return;
        }
        cmd = it->second.cmd;
        success_cb = std::move(it->second.success_callback);
        pending_requests_.erase(it);
    }

    spdlog::trace("[SDCP Client] Response for cmd {} (Ack {})", cmd, sdcp::response_ack(j));
    if (success_cb) {
        try {
            success_cb(j);
        } catch (const std::exception& e) {
            spdlog::error("[SDCP Client] Success callback for cmd {} threw exception: {}", cmd,
                          e.what());
        }
    }
}

void SdcpClient::handle_close() {
    ConnectionState previous = connection_state_.load();
    cleanup_pending_requests();

    if (connect_cb_) {
        // Never opened: report the failed attempt, no client-level retries
        setReconnect(nullptr);
        set_connection_state(ConnectionState::DISCONNECTED);
        finish_connect(false, "Connection to " + address_ + " failed");
        return;
    }

    if (user_disconnect_) {
        set_connection_state(ConnectionState::DISCONNECTED);
        return;
    }

    if (previous == ConnectionState::CONNECTED) {
        spdlog::warn("[SDCP Client] Connection to {} lost", address_);
        emit_event(DeviceEventType::DISCONNECTED, "Connection to printer lost", true);
    }

    if (isReconnect()) {
        set_connection_state(ConnectionState::RECONNECTING);
        emit_event(DeviceEventType::RECONNECTING, "Reconnecting to printer", false);
    } else {
        set_connection_state(ConnectionState::DISCONNECTED);
    }
}

void SdcpClient::disconnect() {
    if (connection_state_.load() != ConnectionState::DISCONNECTED) {
        spdlog::debug("[SDCP Client] Disconnecting from {}", address_);
    }
    user_disconnect_ = true;
    setReconnect(nullptr);
    cancel_timers();
    connect_cb_ = nullptr;
    close();
    cleanup_pending_requests();
    set_connection_state(ConnectionState::DISCONNECTED);
}

RequestId SdcpClient::send_command(int cmd, const json& data, CommandSuccessCallback on_success,
                                   CommandErrorCallback on_error, uint32_t timeout_ms) {
    if (!is_connected()) {
        spdlog::debug("[SDCP Client] Can't send cmd {}: not connected", cmd);
        if (on_error) {
            on_error(DeviceError::not_connected(cmd));
        }
        return INVALID_REQUEST_ID;
    }

    std::string request_id = sdcp::generate_request_id();
    json msg = sdcp::build_request(cmd, data, request_id, mainboard_id_, unix_seconds());

    RequestId id;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        id = next_request_id_++;
        PendingCommand pending;
        pending.id = id;
        pending.cmd = cmd;
        pending.success_callback = std::move(on_success);
        pending.error_callback = on_error;
        pending.sent_at_ms = scheduler_.now_ms();
        pending.timeout_ms = timeout_ms;
        pending_requests_[request_id] = std::move(pending);
    }

    int rc = send(msg.dump());
    if (rc < 0) {
        spdlog::warn("[SDCP Client] Failed to send cmd {} (rc {})", cmd, rc);
        {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            pending_requests_.erase(request_id);
        }
        if (on_error) {
            on_error(DeviceError::connection_lost(cmd));
        }
        return INVALID_REQUEST_ID;
    }

    spdlog::trace("[SDCP Client] Sent cmd {} as request {}", cmd, request_id);
    return id;
}

void SdcpClient::on_status(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    status_cb_ = std::move(cb);
}

void SdcpClient::register_event_handler(DeviceEventCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    event_handler_ = std::move(cb);
}

void SdcpClient::start_status_polling(uint32_t interval_ms) {
    stop_status_polling();
    spdlog::debug("[SDCP Client] Polling status every {}ms", interval_ms);

    auto poll = [this, interval_ms]() {
        if (!is_connected()) {
            return;
        }
        send_command(
            SDCP_CMD_STATUS, json::object(), nullptr,
            [](const DeviceError& err) {
                spdlog::debug("[SDCP Client] Status poll failed: {}", err.message);
            },
            interval_ms * 2);
    };
    poll();
    poll_timer_ = scheduler_.call_every(interval_ms, poll);
}

void SdcpClient::stop_status_polling() {
    if (poll_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(poll_timer_);
        poll_timer_ = INVALID_TIMER_ID;
    }
}

void SdcpClient::emit_event(DeviceEventType type, const std::string& message, bool is_error) {
    DeviceEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(DeviceEvent{type, message, is_error});
    } catch (const std::exception& e) {
        spdlog::error("[SDCP Client] Event handler threw exception: {}", e.what());
    }
}

void SdcpClient::check_request_timeouts() {
    // Two-phase: collect under lock, invoke outside so callbacks may send commands
    std::vector<std::pair<CommandErrorCallback, DeviceError>> timed_out;
    uint64_t now = scheduler_.now_ms();

    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        for (auto it = pending_requests_.begin(); it != pending_requests_.end();) {
            const PendingCommand& req = it->second;
            if (req.is_timed_out(now)) {
                spdlog::warn("[SDCP Client] cmd {} timed out after {}ms", req.cmd,
                             now - req.sent_at_ms);
                timed_out.emplace_back(req.error_callback,
                                       DeviceError::timeout(req.cmd, req.timeout_ms));
                it = pending_requests_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [cb, error] : timed_out) {
        emit_event(DeviceEventType::REQUEST_TIMEOUT, error.method + ": " + error.message, false);
        if (cb) {
            try {
                cb(error);
            } catch (const std::exception& e) {
                spdlog::error("[SDCP Client] Timeout callback threw exception: {}", e.what());
            }
        }
    }
}

void SdcpClient::cleanup_pending_requests() {
    std::vector<std::pair<CommandErrorCallback, DeviceError>> failed;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        for (auto& [request_id, req] : pending_requests_) {
            failed.emplace_back(req.error_callback, DeviceError::connection_lost(req.cmd));
        }
        pending_requests_.clear();
    }

    if (!failed.empty()) {
        spdlog::debug("[SDCP Client] Failing {} pending command(s)", failed.size());
    }
    for (auto& [cb, error] : failed) {
        if (cb) {
            try {
                cb(error);
            } catch (const std::exception& e) {
                spdlog::error("[SDCP Client] Cleanup callback threw exception: {}", e.what());
            }
        }
    }
}

} // namespace printcast
