// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file media_relay.h
 * @brief Camera stream relay: upstream fetch, reframing, throttle and fan-out
 *
 * One upstream MJPEG connection feeds any number of observers. Accepted
 * frames replace the cached latest frame and are written to every attached
 * sink; a sink that fails a write is dropped. New observers get the cached
 * frame first, before any newer frame can reach them.
 *
 * Any upstream failure (HTTP error, transport error, framing error, end of
 * stream, or no data for the stall timeout) marks the camera unavailable and
 * schedules a full restart. When the same failure repeats up to the tracker
 * threshold, the relay enters FATAL_RESTART and reports it once; the owner
 * is expected to warn observers and exit for a supervised restart.
 *
 * State machine:
 *   IDLE -> FETCHING -> STREAMING -> (STREAMING | RETRY_SCHEDULED -> FETCHING)
 *   any failure with the threshold reached -> FATAL_RESTART (terminal)
 *
 * @threading All state transitions run on the control loop. Source
 *            callbacks are posted there and tagged with a fetch generation,
 *            so callbacks from a superseded fetch are ignored.
 *            add_subscriber()/remove_subscriber() may be called from any thread.
 */

#pragma once

#include "camera_failure_tracker.h"
#include "media_source.h"
#include "mjpeg_parser.h"
#include "scheduler.h"
#include "subscriber_registry.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace printcast {

struct Frame {
    std::string data;
    std::string content_type = "image/jpeg";
};

/// Immutable shared frame; replaced, never mutated
using FramePtr = std::shared_ptr<const Frame>;

/**
 * @brief Binary frame destination (one camera HTTP response)
 */
class IFrameSink {
  public:
    virtual ~IFrameSink() = default;

    /// @return false if the sink is gone; it is then dropped
    virtual bool write_frame(const Frame& frame) = 0;
};

/**
 * @brief Minimum-interval frame throttle
 *
 * A frame is accepted when at least 1000/max_fps ms passed since the last
 * accepted frame.
 */
class FrameRateLimiter {
  public:
    explicit FrameRateLimiter(uint32_t max_fps);

    bool accept(uint64_t now_ms);
    void reset() {
        last_accept_ms_.reset();
    }

    uint32_t max_fps() const {
        return max_fps_;
    }

  private:
    bool interval_elapsed(uint64_t elapsed_ms) const;

    uint32_t max_fps_;
    std::optional<uint64_t> last_accept_ms_;
};

enum class RelayState { IDLE, FETCHING, STREAMING, RETRY_SCHEDULED, FATAL_RESTART };

const char* to_string(RelayState state);

struct MediaRelayConfig {
    uint32_t max_fps = 15;
    uint32_t retry_delay_ms = 5000;
    uint32_t stall_timeout_ms = 10000;
    uint32_t failure_threshold = 3;
    size_t max_buffer_bytes = MjpegStreamParser::DEFAULT_MAX_BUFFER_BYTES;
};

class MediaRelay {
  public:
    using Registry = SubscriberRegistry<IFrameSink>;

    /// Camera availability changed: (available, error reason)
    using CameraStatusCallback =
        std::function<void(bool available, const std::optional<std::string>& error)>;

    /// Failure threshold reached; called once with the repeated reason
    using FatalCallback = std::function<void(const std::string& reason)>;

    MediaRelay(Scheduler& scheduler, IMediaSource& source, MediaRelayConfig config = {});
    ~MediaRelay();

    MediaRelay(const MediaRelay&) = delete;
    MediaRelay& operator=(const MediaRelay&) = delete;

    void set_camera_status_callback(CameraStatusCallback cb) {
        camera_status_cb_ = std::move(cb);
    }
    void set_fatal_callback(FatalCallback cb) {
        fatal_cb_ = std::move(cb);
    }

    /**
     * @brief Start (or restart) relaying from @p url
     *
     * Cancels any current fetch or pending retry. Ignored in FATAL_RESTART.
     */
    void start(const std::string& url);

    /// Stop relaying and go IDLE. Clears the failure streak. Subscribers stay attached.
    void stop();

    SubscriberId add_subscriber(std::shared_ptr<IFrameSink> sink, ClientIdentity client);
    bool remove_subscriber(SubscriberId id);

    FramePtr latest_frame() const;

    RelayState state() const {
        return state_;
    }
    const std::string& url() const {
        return url_;
    }
    size_t subscriber_count() const {
        return registry_.size();
    }
    const CameraFailureTracker& failure_tracker() const {
        return tracker_;
    }

  private:
    void begin_fetch();
    void on_source_open(uint64_t generation, int status, const std::string& content_type);
    void on_source_data(uint64_t generation, const std::string& chunk);
    void on_source_close(uint64_t generation, const std::string& error);
    void check_stall();
    void fail(const std::string& reason);
    void accept_frame(std::string&& bytes);
    void publish(FramePtr frame);
    void cancel_timers();
    void set_state(RelayState state);

    Scheduler& scheduler_;
    IMediaSource& source_;
    MediaRelayConfig config_;

    RelayState state_ = RelayState::IDLE;
    std::string url_;
    uint64_t generation_ = 0;
    std::unique_ptr<MjpegStreamParser> parser_;
    FrameRateLimiter limiter_;
    CameraFailureTracker tracker_;

    TimerId retry_timer_ = INVALID_TIMER_ID;
    TimerId stall_timer_ = INVALID_TIMER_ID;
    uint64_t last_data_ms_ = 0;

    CameraStatusCallback camera_status_cb_;
    FatalCallback fatal_cb_;

    // Guards latest_frame_ and pairs it with the registry snapshot
    mutable std::mutex frame_mutex_;
    FramePtr latest_frame_;
    Registry registry_;

    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);
};

} // namespace printcast
