// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file connectivity_supervisor.h
 * @brief Owns the active device client and keeps a printer connected
 *
 * Two entry points:
 *   - start_auto_connect(): discover printers, try each candidate up to the
 *     retry budget, fail over to the next, rediscover when the list runs out.
 *   - connect_to(): connect to one explicit address. This supersedes any
 *     background auto-connect and disables failover for that session.
 *
 * After a successful connect the supervisor runs post-connect setup: mark the
 * status connected, request attributes, negotiate the camera stream URL and
 * (re)start or stop the media relay. Setup runs again after a client-level
 * reconnect, or when status arrives while the model says disconnected. A
 * re-entrancy guard turns a second trigger during setup into a no-op.
 *
 * @pattern Generation counters. Every client callback and every deferred
 *          auto-connect step carries the generation it was issued under and
 *          is ignored once a newer session or auto-connect run exists.
 * @threading Control loop only. Discovery results arrive on a background
 *            thread and are posted to the loop.
 */

#pragma once

#include "device_client.h"
#include "media_relay.h"
#include "printer_discovery.h"
#include "printer_status.h"
#include "scheduler.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printcast {

struct SupervisorConfig {
    uint32_t command_timeout_ms = 10000;
    uint32_t status_poll_interval_ms = 2000;
    uint32_t discovery_timeout_ms = 5000;
    uint32_t retry_delay_ms = 5000;
    uint32_t candidate_retry_budget = 3;
    uint32_t reconnect_grace_ms = 15000;
};

/**
 * @brief Auto-connect cursor over discovered printers
 */
struct CandidateList {
    std::vector<DiscoveredPrinter> candidates;
    size_t current_index = 0;
    uint32_t consecutive_failures = 0;

    bool exhausted() const {
        return candidates.empty() || current_index >= candidates.size();
    }

    void clear() {
        candidates.clear();
        current_index = 0;
        consecutive_failures = 0;
    }
};

enum class SupervisorPhase { IDLE, DISCOVERING, CONNECTING, CONNECTED, WAITING_RETRY };

const char* to_string(SupervisorPhase phase);

class ConnectivitySupervisor {
  public:
    using ConnectDoneCallback = std::function<void(bool success, const std::string& message)>;

    ConnectivitySupervisor(Scheduler& scheduler, PrinterStatusStore& status, MediaRelay& relay,
                           IPrinterDiscovery& discovery, DeviceClientFactory factory,
                           SupervisorConfig config = {});
    ~ConnectivitySupervisor();

    ConnectivitySupervisor(const ConnectivitySupervisor&) = delete;
    ConnectivitySupervisor& operator=(const ConnectivitySupervisor&) = delete;

    /// Invoked whenever CanonicalStatus changed and should be broadcast
    void set_status_changed_callback(std::function<void()> cb) {
        status_changed_cb_ = std::move(cb);
    }

    /// Begin discovery + candidate failover
    void start_auto_connect();

    /**
     * @brief Connect to one printer, replacing any current client
     *
     * @param address IPv4 address or hostname
     * @param name Display name; empty keeps the name reported by the device
     * @param on_done Invoked once when the connect attempt resolves
     */
    void connect_to(const std::string& address, const std::string& name,
                    ConnectDoneCallback on_done);

    /// Tear everything down (shutdown)
    void stop();

    const CandidateList& candidate_list() const {
        return candidates_;
    }
    SupervisorPhase phase() const {
        return phase_;
    }
    bool auto_mode() const {
        return auto_mode_;
    }
    bool setup_pending() const {
        return setup_needed_;
    }
    bool setup_in_progress() const {
        return setup_in_progress_;
    }
    DeviceClientPtr client() const {
        return client_;
    }

  private:
    void connect_internal(const std::string& address, const std::string& name,
                          ConnectDoneCallback on_done);
    void on_connect_result(uint64_t session, bool success, const std::string& error);
    void teardown_client();
    void resolve_pending_connect(bool success, const std::string& message);

    void auto_connect_step();
    void on_discovery_done(const std::vector<DiscoveredPrinter>& printers);
    void attempt_current_candidate();
    void on_candidate_result(bool success, const std::string& error);
    void schedule_auto_step(uint32_t delay_ms);
    void cancel_auto_timers();
    void failover_after_grace(uint64_t session);

    void handle_device_event(uint64_t session, const DeviceEvent& event);
    void handle_status_payload(uint64_t session, const nlohmann::json& payload);
    void handle_printer_lost(const std::string& reason);

    void run_post_connect_setup();
    void on_camera_response(uint64_t session, const nlohmann::json& response);
    void on_camera_error(uint64_t session, const DeviceError& error);
    void finish_setup(const std::optional<std::string>& camera_url);

    void reset_status_to_defaults();
    void notify_status_changed();
    void set_phase(SupervisorPhase phase);

    Scheduler& scheduler_;
    PrinterStatusStore& status_;
    MediaRelay& relay_;
    IPrinterDiscovery& discovery_;
    DeviceClientFactory factory_;
    SupervisorConfig config_;

    DeviceClientPtr client_;
    std::string device_name_;
    uint64_t session_gen_ = 0;
    ConnectDoneCallback pending_connect_;

    bool setup_needed_ = false;
    bool setup_in_progress_ = false;

    bool auto_mode_ = false;
    bool session_from_auto_ = false;
    uint64_t auto_gen_ = 0;
    CandidateList candidates_;
    TimerId auto_timer_ = INVALID_TIMER_ID;
    TimerId grace_timer_ = INVALID_TIMER_ID;
    SupervisorPhase phase_ = SupervisorPhase::IDLE;

    std::function<void()> status_changed_cb_;
    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);
};

} // namespace printcast
