// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hv/EventLoop.h"

#include <cstdint>
#include <functional>

namespace printcast {

/** @brief Identifier for a scheduled timer; 0 means "no timer" */
using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief Timer and task-posting facade over the control event loop
 *
 * Every component that mutates shared monitor state (status, candidate list,
 * relay state, broadcast gate) does so from callbacks delivered through this
 * interface, so all of that state has a single writer: the control loop.
 *
 * Work produced on other threads (HTTP server, discovery, media fetch) is
 * handed over with post().
 *
 * Tests substitute a manual implementation that advances a virtual clock.
 */
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /// Monotonic milliseconds
    virtual uint64_t now_ms() const = 0;

    /**
     * @brief Run @p fn once after @p delay_ms on the control loop
     * @return Timer ID usable with cancel()
     */
    virtual TimerId call_later(uint32_t delay_ms, std::function<void()> fn) = 0;

    /**
     * @brief Run @p fn every @p interval_ms on the control loop until cancelled
     */
    virtual TimerId call_every(uint32_t interval_ms, std::function<void()> fn) = 0;

    /// Cancel a timer. Unknown or already-fired IDs are ignored.
    virtual void cancel(TimerId id) = 0;

    /// Run @p fn on the control loop as soon as possible
    virtual void post(std::function<void()> fn) = 0;
};

/**
 * @brief Scheduler backed by a libhv EventLoop
 *
 * Timers are registered with setTimerInLoop() so they can be armed from any
 * thread; callbacks always run on the loop thread.
 */
class HvScheduler : public Scheduler {
  public:
    explicit HvScheduler(hv::EventLoopPtr loop);
    ~HvScheduler() override = default;

    HvScheduler(const HvScheduler&) = delete;
    HvScheduler& operator=(const HvScheduler&) = delete;

    uint64_t now_ms() const override;
    TimerId call_later(uint32_t delay_ms, std::function<void()> fn) override;
    TimerId call_every(uint32_t interval_ms, std::function<void()> fn) override;
    void cancel(TimerId id) override;
    void post(std::function<void()> fn) override;

    hv::EventLoopPtr loop() const {
        return loop_;
    }

  private:
    hv::EventLoopPtr loop_;
};

} // namespace printcast
