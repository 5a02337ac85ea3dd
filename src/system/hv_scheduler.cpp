// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scheduler.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

namespace printcast {

namespace {

// Exceptions must never unwind into libhv's C event loop
void run_guarded(const std::function<void()>& fn, const char* what) {
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::error("[Scheduler] {} threw exception: {}", what, e.what());
    }
}

} // namespace

HvScheduler::HvScheduler(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

uint64_t HvScheduler::now_ms() const {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

TimerId HvScheduler::call_later(uint32_t delay_ms, std::function<void()> fn) {
    return loop_->setTimerInLoop(
        static_cast<int>(delay_ms),
        [fn = std::move(fn)](hv::TimerID) { run_guarded(fn, "Timer callback"); }, 1);
}

TimerId HvScheduler::call_every(uint32_t interval_ms, std::function<void()> fn) {
    return loop_->setTimerInLoop(
        static_cast<int>(interval_ms),
        [fn = std::move(fn)](hv::TimerID) { run_guarded(fn, "Interval callback"); }, INFINITE);
}

void HvScheduler::cancel(TimerId id) {
    if (id == INVALID_TIMER_ID) {
        return;
    }
    loop_->killTimer(id);
}

void HvScheduler::post(std::function<void()> fn) {
    loop_->runInLoop([fn = std::move(fn)]() { run_guarded(fn, "Posted task"); });
}

} // namespace printcast
