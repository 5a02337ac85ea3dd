// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file subscriber_registry.h
 * @brief Thread-safe set of attached observer sinks
 *
 * Shared by the status broadcast path and the camera relay. Each entry owns
 * its sink plus a per-entry write mutex, so fan-out can write to a snapshot
 * of entries without holding the registry lock, and a removal racing with a
 * fan-out never produces a write after remove() returns.
 *
 * @threading add()/remove() are called from HTTP server threads, deliver()
 *            from the control loop. All methods are safe from any thread.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace printcast {

using SubscriberId = uint64_t;

/// Originating client of a subscription
struct ClientIdentity {
    std::string ip;
    std::string user_agent;
};

template <typename Sink> class SubscriberRegistry {
  public:
    struct Entry {
        SubscriberId id = 0;
        ClientIdentity client;
        std::shared_ptr<Sink> sink;
        std::mutex write_mutex;
        std::atomic<bool> closed{false};
    };
    using EntryPtr = std::shared_ptr<Entry>;

    /// Deliver callback; returning false marks the sink as failed
    using DeliverFn = std::function<bool(Sink&)>;

    /// Called once per sink removed because a delivery failed
    using FailureFn = std::function<void(const Entry&)>;

    EntryPtr add(std::shared_ptr<Sink> sink, ClientIdentity client) {
        auto entry = std::make_shared<Entry>();
        entry->sink = std::move(sink);
        entry->client = std::move(client);

        std::lock_guard<std::mutex> lock(mutex_);
        entry->id = ++next_id_;
        entries_[entry->id] = entry;
        return entry;
    }

    /**
     * @brief add(), returning with the entry's write lock held
     *
     * Lets the caller write an initial message before any fan-out can reach
     * the new sink.
     */
    std::pair<EntryPtr, std::unique_lock<std::mutex>> add_locked(std::shared_ptr<Sink> sink,
                                                                 ClientIdentity client) {
        auto entry = std::make_shared<Entry>();
        entry->sink = std::move(sink);
        entry->client = std::move(client);
        std::unique_lock<std::mutex> write_lock(entry->write_mutex);

        std::lock_guard<std::mutex> lock(mutex_);
        entry->id = ++next_id_;
        entries_[entry->id] = entry;
        return {entry, std::move(write_lock)};
    }

    /**
     * @brief Detach a subscriber
     * @return true if the subscriber was attached
     */
    bool remove(SubscriberId id) {
        EntryPtr entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                return false;
            }
            entry = it->second;
            entries_.erase(it);
        }
        // Waits out a write in progress
        std::lock_guard<std::mutex> write_lock(entry->write_mutex);
        entry->closed.store(true);
        return true;
    }

    std::vector<EntryPtr> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EntryPtr> out;
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    /**
     * @brief Write to one entry under its own lock, skipping closed entries
     * @return false if the entry is closed or the write failed
     */
    static bool deliver_to(Entry& entry, const DeliverFn& fn) {
        std::lock_guard<std::mutex> lock(entry.write_mutex);
        if (entry.closed.load()) {
            return false;
        }
        return fn(*entry.sink);
    }

    /**
     * @brief Deliver to every entry in @p targets; failed sinks are removed
     * @return Number of successful deliveries
     */
    size_t deliver(const std::vector<EntryPtr>& targets, const DeliverFn& fn,
                   const FailureFn& on_failure = nullptr) {
        size_t delivered = 0;
        for (const auto& entry : targets) {
            if (deliver_to(*entry, fn)) {
                ++delivered;
                continue;
            }
            if (!entry->closed.load() && remove(entry->id) && on_failure) {
                on_failure(*entry);
            }
        }
        return delivered;
    }

    size_t deliver(const DeliverFn& fn, const FailureFn& on_failure = nullptr) {
        return deliver(snapshot(), fn, on_failure);
    }

  private:
    mutable std::mutex mutex_;
    std::map<SubscriberId, EntryPtr> entries_;
    SubscriberId next_id_ = 0;
};

} // namespace printcast
