// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitor_server.h"

#include "status_messages.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <atomic>

using json = nlohmann::json;

namespace printcast {

namespace {

/// One WebSocket observer
class WsMessageSink : public IMessageSink {
  public:
    explicit WsMessageSink(WebSocketChannelPtr channel) : channel_(std::move(channel)) {}

    bool send_text(const std::string& message) override {
        if (!channel_->isConnected()) {
            return false;
        }
        return channel_->send(message) >= 0;
    }

  private:
    WebSocketChannelPtr channel_;
};

/// One /api/camera response
class MultipartFrameSink : public IFrameSink {
  public:
    MultipartFrameSink(HttpResponseWriterPtr writer, size_t max_pending_bytes)
        : writer_(std::move(writer)), max_pending_bytes_(max_pending_bytes) {}

    bool write_frame(const Frame& frame) override {
        if (!writer_->isConnected()) {
            return false;
        }
        // Slow reader: drop this frame instead of queueing it
        if (writer_->writeBufsize() > max_pending_bytes_) {
            spdlog::trace("[MonitorServer] Camera client behind by {} bytes, skipping frame",
                          writer_->writeBufsize());
            return true;
        }
        std::string part = multipart_part_header(frame);
        part.append(frame.data);
        part.append("\r\n");
        return writer_->WriteBody(part) >= 0;
    }

  private:
    HttpResponseWriterPtr writer_;
    size_t max_pending_bytes_;
};

/// Ties a camera response to its relay subscription; closes exactly once
struct CameraSession {
    std::atomic<SubscriberId> id{0};
    std::atomic<bool> closed{false};
};

struct WsSession {
    SubscriberId id = 0;
    std::string ip;
};

} // namespace

ClientIdentity client_identity_from(const HttpRequestPtr& req) {
    ClientIdentity client;
    std::string forwarded = req->GetHeader("X-Forwarded-For");
    if (!forwarded.empty()) {
        size_t comma = forwarded.find(',');
        client.ip = forwarded.substr(0, comma);
        size_t first = client.ip.find_first_not_of(' ');
        size_t last = client.ip.find_last_not_of(' ');
        client.ip = first == std::string::npos ? "" : client.ip.substr(first, last - first + 1);
    }
    if (client.ip.empty()) {
        client.ip = req->client_addr.ip;
    }
    client.user_agent = req->GetHeader("User-Agent");
    return client;
}

std::string multipart_part_header(const Frame& frame) {
    std::string header = "--frame\r\nContent-Type: ";
    header += frame.content_type;
    header += "\r\nContent-Length: ";
    header += std::to_string(frame.data.size());
    header += "\r\n\r\n";
    return header;
}

bool is_valid_ipv4(const std::string& address) {
    in_addr addr{};
    return inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

MonitorServer::MonitorServer(Scheduler& scheduler, PrinterStatusStore& status, UserStats& users,
                             BroadcastGate& gate, MediaRelay& relay,
                             ConnectivitySupervisor& supervisor, Options options)
    : scheduler_(scheduler), status_(status), users_(users), gate_(gate), relay_(relay),
      supervisor_(supervisor), options_(std::move(options)) {
    setup_routes();
}

MonitorServer::~MonitorServer() {
    stop();
}

std::string MonitorServer::current_status_message() const {
    return make_status_message(status_.snapshot(), users_.snapshot());
}

void MonitorServer::notify_users_changed() {
    if (users_changed_cb_) {
        users_changed_cb_();
    }
}

void MonitorServer::setup_routes() {
    std::weak_ptr<bool> guard = lifetime_guard_;

    http_.GET("/api/status", [this, guard](HttpRequest* req, HttpResponse* resp) {
        if (!guard.lock()) {
            return static_cast<int>(HTTP_STATUS_SERVICE_UNAVAILABLE);
        }
        return handle_status(req, resp);
    });

    http_.GET("/api/camera", [this, guard](const HttpContextPtr& ctx) {
        if (!guard.lock()) {
            return static_cast<int>(HTTP_STATUS_SERVICE_UNAVAILABLE);
        }
        return handle_camera(ctx);
    });

    http_.POST("/api/connect/:ip", [this, guard](const HttpContextPtr& ctx) {
        if (!guard.lock()) {
            return static_cast<int>(HTTP_STATUS_SERVICE_UNAVAILABLE);
        }
        return handle_connect(ctx);
    });

    if (options_.public_dir) {
        spdlog::info("[MonitorServer] Serving static files from {}", *options_.public_dir);
        http_.Static("/", options_.public_dir->c_str());
    }

    ws_.onopen = [this, guard](const WebSocketChannelPtr& channel, const HttpRequestPtr& req) {
        if (guard.lock()) {
            on_ws_open(channel, req);
        }
    };
    ws_.onmessage = [](const WebSocketChannelPtr&, const std::string& msg) {
        spdlog::trace("[MonitorServer] Ignoring client message ({} bytes)", msg.size());
    };
    ws_.onclose = [this, guard](const WebSocketChannelPtr& channel) {
        if (guard.lock()) {
            on_ws_close(channel);
        }
    };
}

bool MonitorServer::start() {
    server_ = std::make_unique<hv::WebSocketServer>(&ws_);
    server_->registerHttpService(&http_);
    server_->setPort(options_.port);
    server_->setThreadNum(options_.worker_threads);

    int rc = server_->start();
    if (rc != 0) {
        spdlog::error("[MonitorServer] Failed to listen on port {} (error {})", options_.port, rc);
        server_.reset();
        return false;
    }
    spdlog::info("[MonitorServer] Listening on port {}", options_.port);
    return true;
}

void MonitorServer::stop() {
    if (!server_) {
        return;
    }
    spdlog::debug("[MonitorServer] Stopping");
    lifetime_guard_.reset();
    server_->stop();
    server_.reset();
}

// ============================================================================
// HTTP handlers
// ============================================================================

int MonitorServer::handle_status(HttpRequest* /*req*/, HttpResponse* resp) {
    try {
        return resp->Json(make_status_payload(status_.snapshot(), users_.snapshot()));
    } catch (const std::exception& e) {
        spdlog::error("[MonitorServer] Failed to serialize status: {}", e.what());
        return HTTP_STATUS_INTERNAL_SERVER_ERROR;
    }
}

int MonitorServer::handle_camera(const HttpContextPtr& ctx) {
    ClientIdentity client = client_identity_from(ctx->request);
    HttpResponseWriterPtr writer = ctx->writer;

    writer->WriteStatus(HTTP_STATUS_OK);
    writer->WriteHeader("Content-Type", "multipart/x-mixed-replace; boundary=frame");
    writer->WriteHeader("Cache-Control", "no-cache, no-store, must-revalidate");
    writer->WriteHeader("Pragma", "no-cache");
    writer->WriteHeader("Connection", "close");
    writer->EndHeaders();

    auto session = std::make_shared<CameraSession>();
    std::weak_ptr<bool> guard = lifetime_guard_;
    std::string ip = client.ip;

    writer->onclose = [this, guard, session, ip]() {
        if (!guard.lock() || session->closed.exchange(true)) {
            return;
        }
        SubscriberId id = session->id.load();
        if (id != 0) {
            relay_.remove_subscriber(id);
        }
        users_.camera_disconnected();
        spdlog::debug("[MonitorServer] Camera client {} disconnected", ip);
        notify_users_changed();
    };

    users_.camera_connected(client.ip);
    SubscriberId id = relay_.add_subscriber(
        std::make_shared<MultipartFrameSink>(writer, options_.max_pending_camera_bytes), client);
    session->id.store(id);
    // Closed before the subscription existed
    if (session->closed.load()) {
        relay_.remove_subscriber(id);
    }

    spdlog::info("[MonitorServer] Camera client {} connected ({} watching)", client.ip,
                 relay_.subscriber_count());
    notify_users_changed();
    return HTTP_STATUS_UNFINISHED;
}

int MonitorServer::handle_connect(const HttpContextPtr& ctx) {
    std::string ip = ctx->param("ip");
    if (!is_valid_ipv4(ip)) {
        ctx->response->status_code = HTTP_STATUS_BAD_REQUEST;
        return ctx->send(json{{"success", false}, {"error", "Invalid IP address"}}.dump());
    }

    spdlog::info("[MonitorServer] Connect requested to {} by {}", ip,
                 client_identity_from(ctx->request).ip);

    std::weak_ptr<bool> guard = lifetime_guard_;
    scheduler_.post([this, guard, ctx, ip]() {
        if (!guard.lock()) {
            return;
        }
        supervisor_.connect_to(ip, "", [ctx, ip](bool success, const std::string& message) {
            json body;
            if (success) {
                body = {{"success", true}, {"message", "Connected to printer at " + ip}};
            } else {
                ctx->response->status_code = HTTP_STATUS_INTERNAL_SERVER_ERROR;
                body = {{"success", false}, {"error", message}};
            }
            ctx->send(body.dump());
        });
    });
    return HTTP_STATUS_UNFINISHED;
}

// ============================================================================
// WebSocket push channel
// ============================================================================

void MonitorServer::on_ws_open(const WebSocketChannelPtr& channel, const HttpRequestPtr& req) {
    ClientIdentity client = client_identity_from(req);
    users_.web_connected(client.ip);

    std::string initial;
    try {
        initial = current_status_message();
    } catch (const std::exception& e) {
        spdlog::error("[MonitorServer] Failed to serialize initial status: {}", e.what());
    }

    auto session = channel->newContextPtr<WsSession>();
    session->ip = client.ip;
    session->id = gate_.attach(std::make_shared<WsMessageSink>(channel), client, initial);

    spdlog::info("[MonitorServer] WebSocket client {} connected ({} total)", client.ip,
                 gate_.subscriber_count());
    notify_users_changed();
}

void MonitorServer::on_ws_close(const WebSocketChannelPtr& channel) {
    auto session = channel->getContextPtr<WsSession>();
    if (!session) {
        return;
    }
    gate_.detach(session->id);
    users_.web_disconnected();
    channel->deleteContextPtr();
    spdlog::info("[MonitorServer] WebSocket client {} disconnected", session->ip);
    notify_users_changed();
}

} // namespace printcast
