// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file printer_status.h
 * @brief Canonical printer status model and its owning store
 *
 * CanonicalStatus is the single normalized view of the device that every
 * observer sees. It is created with defaults at startup, replaced wholesale
 * with defaults when the device is lost, and patched field by field from
 * each device payload while connected.
 *
 * @pattern Value type + mutex-guarded owner. Writers run on the control loop;
 *          HTTP handlers read copies through PrinterStatusStore::snapshot().
 */

#pragma once

#include "status_projector.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace printcast {

struct TemperatureReading {
    double current = 0.0;
    double target = 0.0;
};

struct CanonicalStatus {
    bool connected = false;
    std::string device_name = "Unknown";

    StatusLabel consolidated = StatusLabel::UNKNOWN;
    StatusLabel machine_state = StatusLabel::UNKNOWN;
    std::optional<int> machine_code;
    StatusLabel job_state = StatusLabel::UNKNOWN;
    std::optional<int> job_code;
    std::optional<StatusLabel> previous_consolidated;

    double progress = 0.0;
    int print_time_seconds = 0;
    int remaining_time_seconds = 0;
    int current_layer = 0;
    int total_layers = 0;
    std::string current_file;

    TemperatureReading bed;
    TemperatureReading nozzle;
    TemperatureReading enclosure;

    bool camera_available = false;
    std::optional<std::string> camera_error;

    std::optional<std::string> last_update;

    /// 1 when the machine reports PRINTING without a known filename, else 0
    int custom_state = 0;
};

/// Format a wall-clock time as ISO-8601 UTC with milliseconds ("2025-01-31T12:00:00.123Z")
std::string format_iso8601_utc(std::chrono::system_clock::time_point tp);

inline std::string iso8601_utc_now() {
    return format_iso8601_utc(std::chrono::system_clock::now());
}

/// True when @p status equals the defaults in every field except lastUpdate
bool is_disconnected_default(const CanonicalStatus& status);

nlohmann::json to_json(const CanonicalStatus& status);

/**
 * @brief Result of patching a status from one device payload
 */
struct PayloadEffect {
    bool had_status = false;           ///< Payload carried a Status block
    bool consolidated_changed = false; ///< Retained consolidated label changed
    StatusLabel from = StatusLabel::UNKNOWN;
    StatusLabel to = StatusLabel::UNKNOWN;
};

/**
 * @brief Patch @p status from a raw device payload
 *
 * Applies Attributes.Name, the Status block (labels, PrintInfo, temperatures)
 * and stamps lastUpdate. A consolidated label of UNKNOWN never replaces a
 * held value. Fields absent from the payload keep their stored values.
 *
 * @param status Status to patch in place
 * @param payload Device message containing "Status" and/or "Attributes"
 * @param timestamp Value for lastUpdate
 */
PayloadEffect apply_device_payload(CanonicalStatus& status, const nlohmann::json& payload,
                                   const std::string& timestamp);

/**
 * @brief Owner of the one CanonicalStatus instance
 *
 * @threading update()/reset_to_defaults() are called from the control loop.
 *            snapshot() may be called from any thread.
 */
class PrinterStatusStore {
  public:
    PrinterStatusStore() = default;

    PrinterStatusStore(const PrinterStatusStore&) = delete;
    PrinterStatusStore& operator=(const PrinterStatusStore&) = delete;

    CanonicalStatus snapshot() const;

    /// Run @p mutator on the held status under the store lock
    void update(const std::function<void(CanonicalStatus&)>& mutator);

    /**
     * @brief Replace the status with defaults and stamp lastUpdate
     * @return false when the status already was at the disconnected defaults
     *         (nothing changed)
     */
    bool reset_to_defaults(const std::string& timestamp);

    bool is_connected() const;

  private:
    mutable std::mutex mutex_;
    CanonicalStatus status_;
};

} // namespace printcast
