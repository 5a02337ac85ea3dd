// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_source.h"

#include "hv/HttpMessage.h"
#include "hv/HttpParser.h"
#include "hv/TcpClient.h"

#include <spdlog/spdlog.h>

#include <atomic>

namespace printcast {

struct HttpMediaSource::Session {
    std::atomic<bool> cancelled{false};
    MediaSourceCallbacks callbacks;
    std::string url;

    // Owned by the client's loop thread once started
    std::unique_ptr<HttpParser> parser;
    HttpResponse response;
    bool headers_seen = false;
    bool close_reported = false;

    std::unique_ptr<hv::TcpClient> client;
};

HttpMediaSource::HttpMediaSource(uint32_t connect_timeout_ms, uint32_t read_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), read_timeout_ms_(read_timeout_ms) {}

HttpMediaSource::~HttpMediaSource() {
    cancel();
}

void HttpMediaSource::report_close(Session& session, const std::string& error) {
    if (session.cancelled.load() || session.close_reported) {
        return;
    }
    session.close_reported = true;
    if (session.callbacks.on_close) {
        session.callbacks.on_close(error);
    }
}

void HttpMediaSource::open(const std::string& url, MediaSourceCallbacks callbacks) {
    cancel();

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->ParseUrl();
    req->headers["Host"] = req->host;
    req->headers["Connection"] = "close";

    auto session = std::make_shared<Session>();
    session->callbacks = std::move(callbacks);
    session->url = url;
    session->parser.reset(HttpParser::New(HTTP_CLIENT, HTTP_V1));
    session->parser->InitResponse(&session->response);
    session->client = std::make_unique<hv::TcpClient>();

    spdlog::debug("[HttpMediaSource] Opening {}", url);

    // Raw pointer: the session owns the client and outlives its loop thread
    Session* s = session.get();
    session->response.http_cb = [s](HttpMessage* msg, http_parser_state state, const char* data,
                                    size_t size) {
        if (s->cancelled.load()) {
            return;
        }
        if (state == HP_HEADERS_COMPLETE) {
            s->headers_seen = true;
            auto* resp = static_cast<HttpResponse*>(msg);
            if (s->callbacks.on_open) {
                s->callbacks.on_open(static_cast<int>(resp->status_code),
                                     resp->GetHeader("Content-Type"));
            }
        } else if (state == HP_BODY && data != nullptr && size > 0) {
            if (s->callbacks.on_data) {
                s->callbacks.on_data(data, size);
            }
        }
    };

    if (session->client->createsocket(req->port, req->host.c_str()) < 0) {
        spdlog::warn("[HttpMediaSource] Cannot create socket for {}", url);
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_ = session;
        }
        report_close(*session, "Camera stream request failed (no response)");
        return;
    }
    session->client->setConnectTimeout(static_cast<int>(connect_timeout_ms_));

    std::string request_text = req->Dump(true, true);
    uint32_t read_timeout_ms = read_timeout_ms_;

    session->client->onConnection = [s, request_text,
                                     read_timeout_ms](const hv::SocketChannelPtr& channel) {
        if (s->cancelled.load()) {
            return;
        }
        if (channel->isConnected()) {
            if (read_timeout_ms > 0) {
                channel->setReadTimeout(static_cast<int>(read_timeout_ms));
            }
            channel->write(request_text);
            return;
        }

        std::string error;
        if (!s->headers_seen) {
            error = "Camera stream request failed (no response)";
        } else if (!s->parser->IsComplete()) {
            error = "Camera stream connection lost";
        }
        report_close(*s, error);
    };

    session->client->onMessage = [s](const hv::SocketChannelPtr& channel, hv::Buffer* buf) {
        if (s->cancelled.load()) {
            return;
        }
        int parsed = s->parser->FeedRecvData(static_cast<const char*>(buf->data()), buf->size());
        if (parsed != static_cast<int>(buf->size())) {
            spdlog::warn("[HttpMediaSource] Malformed HTTP response from {}: {}", s->url,
                         s->parser->StrError(s->parser->GetError()));
            channel->close();
            return;
        }
        if (s->parser->IsComplete()) {
            channel->close();
        }
    };

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = session;
    }
    session->client->start();
}

void HttpMediaSource::cancel() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session = std::move(session_);
        session_.reset();
    }
    if (!session) {
        return;
    }

    session->cancelled.store(true);
    // Closes the socket and joins the client's loop thread
    session->client->stop(true);
    spdlog::trace("[HttpMediaSource] Fetch of {} cancelled", session->url);
}

bool HttpMediaSource::fetch_active() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_ && session_->client->isConnected();
}

} // namespace printcast
