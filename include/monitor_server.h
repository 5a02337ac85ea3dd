// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file monitor_server.h
 * @brief HTTP and WebSocket surface for observers
 *
 * Routes:
 *   GET  /api/status       current printer status and observer counts
 *   GET  /api/camera       multipart/x-mixed-replace MJPEG relay
 *   POST /api/connect/:ip  connect to a specific printer
 *   WS   /                 status push channel
 *
 * Static files are served from PUBLIC_DIR when configured.
 *
 * @threading Handlers run on libhv server threads. Anything touching the
 *            supervisor is posted to the control loop; the gate, relay
 *            registries, status store and user stats are thread-safe.
 */

#pragma once

#include "broadcast_gate.h"
#include "connectivity_supervisor.h"
#include "media_relay.h"
#include "printer_status.h"
#include "scheduler.h"
#include "subscriber_registry.h"
#include "user_stats.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "hv/HttpServer.h"
#include "hv/WebSocketServer.h"

namespace printcast {

/// Client identity from X-Forwarded-For (first hop) or the peer address
ClientIdentity client_identity_from(const HttpRequestPtr& req);

/// Multipart part header for one frame ("--frame\r\nContent-Type: ...\r\n\r\n")
std::string multipart_part_header(const Frame& frame);

/// Dotted-quad IPv4 check for /api/connect/:ip
bool is_valid_ipv4(const std::string& address);

class MonitorServer {
  public:
    struct Options {
        uint16_t port = 3000;
        std::optional<std::string> public_dir;
        int worker_threads = 2;
        size_t max_pending_camera_bytes = 4 * 1024 * 1024;
    };

    MonitorServer(Scheduler& scheduler, PrinterStatusStore& status, UserStats& users,
                  BroadcastGate& gate, MediaRelay& relay, ConnectivitySupervisor& supervisor,
                  Options options);
    ~MonitorServer();

    MonitorServer(const MonitorServer&) = delete;
    MonitorServer& operator=(const MonitorServer&) = delete;

    /// Invoked (from any thread) when observer counts change
    void set_users_changed_callback(std::function<void()> cb) {
        users_changed_cb_ = std::move(cb);
    }

    /// Bind and start serving; false if the port could not be bound
    bool start();
    void stop();

    /// Current `{type:"status"}` message, as sent to new WebSocket clients
    std::string current_status_message() const;

  private:
    void setup_routes();

    int handle_status(HttpRequest* req, HttpResponse* resp);
    int handle_camera(const HttpContextPtr& ctx);
    int handle_connect(const HttpContextPtr& ctx);

    void on_ws_open(const WebSocketChannelPtr& channel, const HttpRequestPtr& req);
    void on_ws_close(const WebSocketChannelPtr& channel);

    void notify_users_changed();

    Scheduler& scheduler_;
    PrinterStatusStore& status_;
    UserStats& users_;
    BroadcastGate& gate_;
    MediaRelay& relay_;
    ConnectivitySupervisor& supervisor_;
    Options options_;

    hv::HttpService http_;
    hv::WebSocketService ws_;
    std::unique_ptr<hv::WebSocketServer> server_;

    std::function<void()> users_changed_cb_;
    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);
};

} // namespace printcast
