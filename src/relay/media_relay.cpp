// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_relay.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>

namespace printcast {

FrameRateLimiter::FrameRateLimiter(uint32_t max_fps) : max_fps_(max_fps) {}

bool FrameRateLimiter::interval_elapsed(uint64_t elapsed_ms) const {
    // elapsed >= 1000 / max_fps, compared without rounding the interval
    return max_fps_ == 0 || elapsed_ms * max_fps_ >= 1000;
}

bool FrameRateLimiter::accept(uint64_t now_ms) {
    if (last_accept_ms_ && !interval_elapsed(now_ms - *last_accept_ms_)) {
        return false;
    }
    last_accept_ms_ = now_ms;
    return true;
}

const char* to_string(RelayState state) {
    switch (state) {
    case RelayState::IDLE:
        return "IDLE";
    case RelayState::FETCHING:
        return "FETCHING";
    case RelayState::STREAMING:
        return "STREAMING";
    case RelayState::RETRY_SCHEDULED:
        return "RETRY_SCHEDULED";
    case RelayState::FATAL_RESTART:
        return "FATAL_RESTART";
    }
    return "UNKNOWN";
}

MediaRelay::MediaRelay(Scheduler& scheduler, IMediaSource& source, MediaRelayConfig config)
    : scheduler_(scheduler), source_(source), config_(config), limiter_(config.max_fps),
      tracker_(config.failure_threshold) {}

MediaRelay::~MediaRelay() {
    lifetime_guard_.reset();
    cancel_timers();
    source_.cancel();
}

void MediaRelay::set_state(RelayState state) {
    if (state_ != state) {
        spdlog::debug("[MediaRelay] State {} -> {}", to_string(state_), to_string(state));
        state_ = state;
    }
}

void MediaRelay::start(const std::string& url) {
    if (state_ == RelayState::FATAL_RESTART) {
        spdlog::debug("[MediaRelay] Ignoring start in FATAL_RESTART");
        return;
    }
    url_ = url;
    spdlog::info("[MediaRelay] Starting camera relay from {}", url_);
    begin_fetch();
}

void MediaRelay::stop() {
    if (state_ == RelayState::FATAL_RESTART) {
        return;
    }
    if (state_ != RelayState::IDLE) {
        spdlog::info("[MediaRelay] Stopping camera relay");
    }
    ++generation_;
    cancel_timers();
    source_.cancel();
    parser_.reset();
    tracker_.reset();
    url_.clear();
    set_state(RelayState::IDLE);
}

void MediaRelay::cancel_timers() {
    if (retry_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(retry_timer_);
        retry_timer_ = INVALID_TIMER_ID;
    }
    if (stall_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(stall_timer_);
        stall_timer_ = INVALID_TIMER_ID;
    }
}

void MediaRelay::begin_fetch() {
    cancel_timers();
    source_.cancel();
    parser_.reset();
    limiter_.reset();

    uint64_t gen = ++generation_;
    set_state(RelayState::FETCHING);
    last_data_ms_ = scheduler_.now_ms();

    uint32_t check_every = std::max<uint32_t>(1, std::min<uint32_t>(config_.stall_timeout_ms, 1000));
    stall_timer_ = scheduler_.call_every(check_every, [this]() { check_stall(); });

    std::weak_ptr<bool> guard = lifetime_guard_;
    Scheduler* sched = &scheduler_;

    MediaSourceCallbacks cbs;
    cbs.on_open = [this, guard, sched, gen](int status, const std::string& content_type) {
        sched->post([this, guard, gen, status, content_type]() {
            if (guard.lock()) {
                on_source_open(gen, status, content_type);
            }
        });
    };
    cbs.on_data = [this, guard, sched, gen](const char* data, size_t len) {
        sched->post([this, guard, gen, chunk = std::string(data, len)]() {
            if (guard.lock()) {
                on_source_data(gen, chunk);
            }
        });
    };
    cbs.on_close = [this, guard, sched, gen](const std::string& error) {
        sched->post([this, guard, gen, error]() {
            if (guard.lock()) {
                on_source_close(gen, error);
            }
        });
    };

    source_.open(url_, std::move(cbs));
}

void MediaRelay::on_source_open(uint64_t generation, int status, const std::string& content_type) {
    if (generation != generation_ || state_ != RelayState::FETCHING) {
        return;
    }

    if (status < 200 || status >= 300) {
        fail("Camera error " + std::to_string(status));
        return;
    }

    std::string boundary = extract_boundary(content_type);
    spdlog::info("[MediaRelay] Camera stream open (HTTP {}, boundary '{}')", status, boundary);

    parser_ = std::make_unique<MjpegStreamParser>(boundary, config_.max_buffer_bytes);
    last_data_ms_ = scheduler_.now_ms();
    tracker_.reset();
    set_state(RelayState::STREAMING);

    if (camera_status_cb_) {
        camera_status_cb_(true, std::nullopt);
    }
}

void MediaRelay::on_source_data(uint64_t generation, const std::string& chunk) {
    if (generation != generation_ || state_ != RelayState::STREAMING || !parser_) {
        return;
    }

    last_data_ms_ = scheduler_.now_ms();

    bool ok = parser_->feed(chunk, [this](std::string&& bytes) { accept_frame(std::move(bytes)); });
    if (!ok) {
        fail("Camera stream protocol error: " + parser_->error());
    }
}

void MediaRelay::on_source_close(uint64_t generation, const std::string& error) {
    if (generation != generation_) {
        return;
    }
    if (state_ != RelayState::FETCHING && state_ != RelayState::STREAMING) {
        return;
    }
    fail(error.empty() ? "Camera stream ended" : error);
}

void MediaRelay::check_stall() {
    if (state_ != RelayState::FETCHING && state_ != RelayState::STREAMING) {
        return;
    }
    uint64_t idle = scheduler_.now_ms() - last_data_ms_;
    if (idle >= config_.stall_timeout_ms) {
        spdlog::warn("[MediaRelay] No camera data for {}ms", idle);
        fail("Camera stream stalled");
    }
}

void MediaRelay::accept_frame(std::string&& bytes) {
    if (!limiter_.accept(scheduler_.now_ms())) {
        return;
    }
    auto frame = std::make_shared<Frame>();
    frame->data = std::move(bytes);
    publish(std::move(frame));
}

void MediaRelay::publish(FramePtr frame) {
    std::vector<Registry::EntryPtr> targets;
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        latest_frame_ = frame;
        targets = registry_.snapshot();
    }

    registry_.deliver(
        targets, [&frame](IFrameSink& sink) { return sink.write_frame(*frame); },
        [](const Registry::Entry& entry) {
            spdlog::debug("[MediaRelay] Dropping camera subscriber {} ({}): write failed",
                          entry.id, entry.client.ip);
        });
}

void MediaRelay::fail(const std::string& reason) {
    ++generation_;
    cancel_timers();
    source_.cancel();
    parser_.reset();

    bool fatal = tracker_.record_failure(reason);
    spdlog::error("[MediaRelay] Camera stream failed: {} (streak {}/{})", reason,
                  tracker_.consecutive_count(), tracker_.threshold());

    if (camera_status_cb_) {
        camera_status_cb_(false, reason);
    }

    if (fatal) {
        set_state(RelayState::FATAL_RESTART);
        spdlog::critical("[MediaRelay] Camera failed {} times with the same error: {}",
                         tracker_.consecutive_count(), reason);
        if (fatal_cb_) {
            fatal_cb_(reason);
        }
        return;
    }

    set_state(RelayState::RETRY_SCHEDULED);
    retry_timer_ = scheduler_.call_later(config_.retry_delay_ms, [this]() {
        retry_timer_ = INVALID_TIMER_ID;
        if (state_ == RelayState::RETRY_SCHEDULED && !url_.empty()) {
            spdlog::info("[MediaRelay] Retrying camera stream");
            begin_fetch();
        }
    });
}

SubscriberId MediaRelay::add_subscriber(std::shared_ptr<IFrameSink> sink, ClientIdentity client) {
    Registry::EntryPtr entry;
    FramePtr replay;
    std::unique_lock<std::mutex> write_lock;
    {
        // Write lock held from insertion so no newer frame can overtake the replay
        std::lock_guard<std::mutex> lock(frame_mutex_);
        std::tie(entry, write_lock) = registry_.add_locked(std::move(sink), std::move(client));
        replay = latest_frame_;
    }

    spdlog::debug("[MediaRelay] Camera subscriber {} attached from {} ({} total)", entry->id,
                  entry->client.ip, registry_.size());

    if (replay && !entry->sink->write_frame(*replay)) {
        write_lock.unlock();
        registry_.remove(entry->id);
    }
    return entry->id;
}

bool MediaRelay::remove_subscriber(SubscriberId id) {
    bool removed = registry_.remove(id);
    if (removed) {
        spdlog::debug("[MediaRelay] Camera subscriber {} detached ({} remaining)", id,
                      registry_.size());
    }
    return removed;
}

FramePtr MediaRelay::latest_frame() const {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    return latest_frame_;
}

} // namespace printcast
