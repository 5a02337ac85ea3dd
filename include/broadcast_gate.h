// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file broadcast_gate.h
 * @brief Rate-limited fan-out of status messages to push-channel subscribers
 *
 * Non-urgent messages are sent at most once per interval. A message arriving
 * inside the interval arms a single deferred send for the remaining time;
 * further messages before it fires only replace its payload, so the deferred
 * send always carries the newest data. Urgent messages skip the throttle
 * entirely and are written immediately, even while a deferred send is armed.
 *
 * @threading broadcast()/broadcast_urgent() run on the control loop.
 *            attach()/detach() may be called from server threads.
 */

#pragma once

#include "scheduler.h"
#include "subscriber_registry.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace printcast {

/**
 * @brief Text message destination (one WebSocket connection)
 */
class IMessageSink {
  public:
    virtual ~IMessageSink() = default;

    /// @return false if the message could not be written; the sink is then dropped
    virtual bool send_text(const std::string& message) = 0;
};

class BroadcastGate {
  public:
    using Registry = SubscriberRegistry<IMessageSink>;

    BroadcastGate(Scheduler& scheduler, uint32_t interval_ms);
    ~BroadcastGate();

    BroadcastGate(const BroadcastGate&) = delete;
    BroadcastGate& operator=(const BroadcastGate&) = delete;

    /**
     * @brief Attach a sink, optionally writing @p initial_message to it first
     *
     * The initial message is written under the entry's write lock, so no
     * broadcast can reach the sink before it.
     */
    SubscriberId attach(std::shared_ptr<IMessageSink> sink, ClientIdentity client,
                        const std::string& initial_message = "");

    bool detach(SubscriberId id);

    /// Throttled send
    void broadcast(const std::string& message);

    /// Immediate send that ignores the throttle. The window restarts from now and an armed
    /// deferred send stays armed.
    void broadcast_urgent(const std::string& message);

    /// Drop any armed deferred send (shutdown)
    void cancel_pending();

    size_t subscriber_count() const {
        return registry_.size();
    }

    bool has_pending() const {
        return pending_timer_ != INVALID_TIMER_ID;
    }

    uint32_t interval_ms() const {
        return interval_ms_;
    }

  private:
    void send_now(const std::string& message);
    void fire_pending();

    Scheduler& scheduler_;
    uint32_t interval_ms_;
    Registry registry_;

    std::optional<uint64_t> last_send_ms_;
    TimerId pending_timer_ = INVALID_TIMER_ID;
    std::string pending_message_;
};

} // namespace printcast
