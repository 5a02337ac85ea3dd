// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "broadcast_gate.h"

#include <spdlog/spdlog.h>

namespace printcast {

BroadcastGate::BroadcastGate(Scheduler& scheduler, uint32_t interval_ms)
    : scheduler_(scheduler), interval_ms_(interval_ms) {}

BroadcastGate::~BroadcastGate() {
    cancel_pending();
}

SubscriberId BroadcastGate::attach(std::shared_ptr<IMessageSink> sink, ClientIdentity client,
                                   const std::string& initial_message) {
    std::string ip = client.ip;
    auto [entry, write_lock] = registry_.add_locked(std::move(sink), std::move(client));
    spdlog::debug("[BroadcastGate] Subscriber {} attached from {} ({} total)", entry->id, ip,
                  registry_.size());

    if (!initial_message.empty() && !entry->sink->send_text(initial_message)) {
        spdlog::debug("[BroadcastGate] Initial send to subscriber {} failed", entry->id);
        write_lock.unlock();
        registry_.remove(entry->id);
    }
    return entry->id;
}

bool BroadcastGate::detach(SubscriberId id) {
    bool removed = registry_.remove(id);
    if (removed) {
        spdlog::debug("[BroadcastGate] Subscriber {} detached ({} remaining)", id,
                      registry_.size());
    }
    return removed;
}

void BroadcastGate::broadcast(const std::string& message) {
    uint64_t now = scheduler_.now_ms();

    if (pending_timer_ != INVALID_TIMER_ID) {
        pending_message_ = message;
        return;
    }

    if (!last_send_ms_ || now - *last_send_ms_ >= interval_ms_) {
        send_now(message);
        return;
    }

    uint64_t wait = interval_ms_ - (now - *last_send_ms_);
    pending_message_ = message;
    pending_timer_ =
        scheduler_.call_later(static_cast<uint32_t>(wait), [this]() { fire_pending(); });
    spdlog::trace("[BroadcastGate] Deferred send armed for {}ms", wait);
}

void BroadcastGate::broadcast_urgent(const std::string& message) {
    spdlog::debug("[BroadcastGate] Urgent send to {} subscribers", registry_.size());
    send_now(message);
}

void BroadcastGate::cancel_pending() {
    if (pending_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(pending_timer_);
        pending_timer_ = INVALID_TIMER_ID;
        pending_message_.clear();
    }
}

void BroadcastGate::fire_pending() {
    pending_timer_ = INVALID_TIMER_ID;
    std::string message = std::move(pending_message_);
    pending_message_.clear();
    send_now(message);
}

void BroadcastGate::send_now(const std::string& message) {
    last_send_ms_ = scheduler_.now_ms();
    registry_.deliver([&](IMessageSink& sink) { return sink.send_text(message); },
                      [](const Registry::Entry& entry) {
                          spdlog::debug("[BroadcastGate] Dropping subscriber {} ({}): send failed",
                                        entry.id, entry.client.ip);
                      });
}

} // namespace printcast
