// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_DEVICE_CLIENT_H
#define MOCK_DEVICE_CLIENT_H

/**
 * @file mock_device_client.h
 * @brief Scripted device client for supervisor tests
 *
 * MockDeviceNetwork describes the fake LAN shared by every client a test
 * creates: which addresses accept connections and how the camera command
 * answers. Results are delivered through the scheduler's post queue, like
 * the real client delivers them on the control loop, so a test calls
 * ManualScheduler::run_posted() to let them arrive.
 *
 * @example
 * auto network = std::make_shared<MockDeviceNetwork>();
 * network->reachable.insert("10.0.0.5");
 * MockDeviceFactory factory(sched, network);
 * ConnectivitySupervisor sup(sched, status, relay, discovery, factory.factory());
 */

#include "device_client.h"
#include "scheduler.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hv/json.hpp"

using namespace printcast;

struct MockDeviceNetwork {
    std::set<std::string> reachable;

    // Camera command (386) behaviour
    int camera_ack = 0;
    std::string video_url = "10.0.0.5:3031/video";
    std::optional<DeviceError> camera_error;

    /// Hold camera responses until MockDeviceClient::flush_deferred()
    bool defer_camera = false;

    /// Every connect() address, in order, across all clients
    std::vector<std::string> connect_attempts;

    size_t attempts_to(const std::string& address) const {
        return static_cast<size_t>(
            std::count(connect_attempts.begin(), connect_attempts.end(), address));
    }
};

class MockDeviceClient : public IDeviceClient,
                         public std::enable_shared_from_this<MockDeviceClient> {
  public:
    struct SentCommand {
        int cmd;
        nlohmann::json data;
    };

    MockDeviceClient(Scheduler& scheduler, std::shared_ptr<MockDeviceNetwork> network)
        : scheduler_(scheduler), network_(std::move(network)) {}

    void connect(const std::string& address, uint32_t timeout_ms,
                 ConnectCallback on_done) override {
        address_ = address;
        last_timeout_ms_ = timeout_ms;
        ++connect_calls_;
        network_->connect_attempts.push_back(address);

        bool ok = network_->reachable.count(address) > 0;
        std::weak_ptr<MockDeviceClient> weak = weak_from_this();
        scheduler_.post([weak, ok, on_done]() {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            self->connected_ = ok;
            on_done(ok, ok ? "" : "Connection timeout");
        });
    }

    void disconnect() override {
        connected_ = false;
        ++disconnect_calls_;
    }

    RequestId send_command(int cmd, const nlohmann::json& data, CommandSuccessCallback on_success,
                           CommandErrorCallback on_error, uint32_t /*timeout_ms*/) override {
        commands_.push_back({cmd, data});
        if (!connected_) {
            on_error(DeviceError::not_connected(cmd));
            return INVALID_REQUEST_ID;
        }

        RequestId id = ++next_request_id_;
        std::function<void()> respond;
        if (cmd == SDCP_CMD_CAMERA_STREAM) {
            auto network = network_;
            respond = [network, on_success, on_error]() {
                if (network->camera_error) {
                    on_error(*network->camera_error);
                    return;
                }
                nlohmann::json inner = {{"Ack", network->camera_ack}};
                if (network->camera_ack == 0 && !network->video_url.empty()) {
                    inner["VideoUrl"] = network->video_url;
                }
                nlohmann::json response;
                response["Data"] = {
                    {"Cmd", SDCP_CMD_CAMERA_STREAM}, {"Data", inner}, {"RequestID", "mock"}};
                on_success(response);
            };
            if (network_->defer_camera) {
                deferred_.push_back(std::move(respond));
                return id;
            }
        } else {
            respond = [cmd, on_success]() {
                nlohmann::json response;
                response["Data"] = {{"Cmd", cmd}, {"Data", {{"Ack", 0}}}, {"RequestID", "mock"}};
                on_success(response);
            };
        }

        std::weak_ptr<MockDeviceClient> weak = weak_from_this();
        scheduler_.post([weak, respond]() {
            if (weak.lock()) {
                respond();
            }
        });
        return id;
    }

    void on_status(StatusCallback cb) override {
        status_cb_ = std::move(cb);
    }

    void register_event_handler(DeviceEventCallback cb) override {
        event_cb_ = std::move(cb);
    }

    void start_status_polling(uint32_t interval_ms) override {
        polling_ = true;
        poll_interval_ms_ = interval_ms;
        ++poll_starts_;
    }

    void stop_status_polling() override {
        polling_ = false;
    }

    bool is_connected() const override {
        return connected_;
    }

    std::string address() const override {
        return address_;
    }

    // ---- test helpers ----

    void emit_status(const nlohmann::json& payload) {
        if (status_cb_) {
            status_cb_(payload);
        }
    }

    /// Deliver a lifecycle event, updating the connected flag the way a real client would
    void emit_event(DeviceEventType type, const std::string& message = "") {
        if (type == DeviceEventType::DISCONNECTED || type == DeviceEventType::ERROR) {
            connected_ = false;
        } else if (type == DeviceEventType::RECONNECTED) {
            connected_ = true;
        }
        if (event_cb_) {
            event_cb_(DeviceEvent{type, message, type == DeviceEventType::ERROR});
        }
    }

    /// Change the connected flag without emitting an event
    void set_connected(bool connected) {
        connected_ = connected;
    }

    /// Answer held camera commands
    void flush_deferred() {
        auto pending = std::move(deferred_);
        deferred_.clear();
        for (auto& respond : pending) {
            respond();
        }
    }

    size_t count_commands(int cmd) const {
        return static_cast<size_t>(
            std::count_if(commands_.begin(), commands_.end(),
                          [cmd](const SentCommand& c) { return c.cmd == cmd; }));
    }

    const std::vector<SentCommand>& commands() const {
        return commands_;
    }
    int connect_calls() const {
        return connect_calls_;
    }
    int disconnect_calls() const {
        return disconnect_calls_;
    }
    bool polling() const {
        return polling_;
    }
    int poll_starts() const {
        return poll_starts_;
    }
    uint32_t poll_interval_ms() const {
        return poll_interval_ms_;
    }
    uint32_t last_timeout_ms() const {
        return last_timeout_ms_;
    }

  private:
    Scheduler& scheduler_;
    std::shared_ptr<MockDeviceNetwork> network_;

    std::string address_;
    bool connected_ = false;
    int connect_calls_ = 0;
    int disconnect_calls_ = 0;
    bool polling_ = false;
    int poll_starts_ = 0;
    uint32_t poll_interval_ms_ = 0;
    uint32_t last_timeout_ms_ = 0;
    RequestId next_request_id_ = 0;

    StatusCallback status_cb_;
    DeviceEventCallback event_cb_;
    std::vector<SentCommand> commands_;
    std::vector<std::function<void()>> deferred_;
};

/**
 * @brief Builds MockDeviceClients and remembers each one
 */
class MockDeviceFactory {
  public:
    MockDeviceFactory(Scheduler& scheduler, std::shared_ptr<MockDeviceNetwork> network)
        : scheduler_(scheduler), network_(std::move(network)) {}

    DeviceClientFactory factory() {
        return [this]() -> DeviceClientPtr {
            auto client = std::make_shared<MockDeviceClient>(scheduler_, network_);
            created_.push_back(client);
            return client;
        };
    }

    std::shared_ptr<MockDeviceClient> latest() const {
        return created_.empty() ? nullptr : created_.back();
    }

    const std::vector<std::shared_ptr<MockDeviceClient>>& created() const {
        return created_;
    }

  private:
    Scheduler& scheduler_;
    std::shared_ptr<MockDeviceNetwork> network_;
    std::vector<std::shared_ptr<MockDeviceClient>> created_;
};

#endif // MOCK_DEVICE_CLIENT_H
