// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file media_source.h
 * @brief Upstream byte-stream fetchers for the camera relay
 *
 * IMediaSource opens one streaming HTTP GET at a time and reports headers,
 * body chunks and the end of the stream through callbacks. Callbacks run on
 * the source's network thread; consumers hand them over to their own loop.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace printcast {

struct MediaSourceCallbacks {
    /// Response headers received. @p status is the HTTP status code.
    std::function<void(int status, const std::string& content_type)> on_open;

    std::function<void(const char* data, size_t len)> on_data;

    /// Stream finished. @p error is empty for a clean end of stream.
    std::function<void(const std::string& error)> on_close;
};

class IMediaSource {
  public:
    virtual ~IMediaSource() = default;

    /// Start fetching @p url. Any previous fetch is cancelled first.
    virtual void open(const std::string& url, MediaSourceCallbacks callbacks) = 0;

    /// Stop the current fetch. No callbacks for it are delivered afterwards.
    virtual void cancel() = 0;
};

/**
 * @brief IMediaSource over a libhv TcpClient and HttpParser
 *
 * Each open() connects a TcpClient running its own event loop thread and feeds
 * the socket into a streaming HTTP response parser, so the body is never
 * accumulated. cancel() closes the socket and joins that thread; a session
 * never outlives the fetch that created it.
 *
 * A session with no bytes for @p read_timeout_ms is closed with an error
 * (0 disables the read timeout).
 *
 * @threading open()/cancel() are called from the control loop, never from
 * inside a callback.
 */
class HttpMediaSource : public IMediaSource {
  public:
    explicit HttpMediaSource(uint32_t connect_timeout_ms = 10000, uint32_t read_timeout_ms = 0);
    ~HttpMediaSource() override;

    HttpMediaSource(const HttpMediaSource&) = delete;
    HttpMediaSource& operator=(const HttpMediaSource&) = delete;

    void open(const std::string& url, MediaSourceCallbacks callbacks) override;
    void cancel() override;

    /// True while the current session's socket is connected
    bool fetch_active() const;

  private:
    struct Session;

    /// Delivers on_close once, unless the session was cancelled
    static void report_close(Session& session, const std::string& error);

    uint32_t connect_timeout_ms_;
    uint32_t read_timeout_ms_;

    mutable std::mutex session_mutex_;
    std::shared_ptr<Session> session_;
};

} // namespace printcast
