// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connectivity_supervisor.h"

#include "json_utils.h"
#include "sdcp_protocol.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace printcast {

const char* to_string(SupervisorPhase phase) {
    switch (phase) {
    case SupervisorPhase::IDLE:
        return "IDLE";
    case SupervisorPhase::DISCOVERING:
        return "DISCOVERING";
    case SupervisorPhase::CONNECTING:
        return "CONNECTING";
    case SupervisorPhase::CONNECTED:
        return "CONNECTED";
    case SupervisorPhase::WAITING_RETRY:
        return "WAITING_RETRY";
    }
    return "UNKNOWN";
}

ConnectivitySupervisor::ConnectivitySupervisor(Scheduler& scheduler, PrinterStatusStore& status,
                                               MediaRelay& relay, IPrinterDiscovery& discovery,
                                               DeviceClientFactory factory,
                                               SupervisorConfig config)
    : scheduler_(scheduler), status_(status), relay_(relay), discovery_(discovery),
      factory_(std::move(factory)), config_(config) {}

ConnectivitySupervisor::~ConnectivitySupervisor() {
    lifetime_guard_.reset();
    stop();
}

void ConnectivitySupervisor::set_phase(SupervisorPhase phase) {
    if (phase_ != phase) {
        spdlog::debug("[Supervisor] {} -> {}", to_string(phase_), to_string(phase));
        phase_ = phase;
    }
}

void ConnectivitySupervisor::notify_status_changed() {
    if (status_changed_cb_) {
        status_changed_cb_();
    }
}

void ConnectivitySupervisor::reset_status_to_defaults() {
    std::string now = iso8601_utc_now();
    status_.update([&now](CanonicalStatus& s) {
        s = CanonicalStatus{};
        s.last_update = now;
    });
}

void ConnectivitySupervisor::stop() {
    ++auto_gen_;
    ++session_gen_;
    auto_mode_ = false;
    cancel_auto_timers();
    discovery_.cancel();
    resolve_pending_connect(false, "Shutting down");
    if (client_) {
        client_->stop_status_polling();
        client_->disconnect();
        client_.reset();
    }
    set_phase(SupervisorPhase::IDLE);
}

// ============================================================================
// Session management
// ============================================================================

void ConnectivitySupervisor::connect_to(const std::string& address, const std::string& name,
                                        ConnectDoneCallback on_done) {
    if (auto_mode_) {
        spdlog::info("[Supervisor] Explicit connect to {} replaces auto-connect", address);
    }
    ++auto_gen_;
    auto_mode_ = false;
    cancel_auto_timers();
    discovery_.cancel();
    candidates_.clear();

    session_from_auto_ = false;
    connect_internal(address, name, std::move(on_done));
}

void ConnectivitySupervisor::resolve_pending_connect(bool success, const std::string& message) {
    ConnectDoneCallback cb = std::move(pending_connect_);
    pending_connect_ = nullptr;
    if (cb) {
        cb(success, message);
    }
}

void ConnectivitySupervisor::teardown_client() {
    if (grace_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(grace_timer_);
        grace_timer_ = INVALID_TIMER_ID;
    }
    resolve_pending_connect(false, "Superseded by a newer connection request");

    if (!client_) {
        return;
    }
    spdlog::debug("[Supervisor] Tearing down client for {}", client_->address());
    client_->stop_status_polling();
    client_->disconnect();

    // Released on a later loop turn; this may run inside one of its callbacks
    DeviceClientPtr retired = std::move(client_);
    client_.reset();
    scheduler_.post([retired]() mutable { retired.reset(); });
}

void ConnectivitySupervisor::connect_internal(const std::string& address,
                                              const std::string& name,
                                              ConnectDoneCallback on_done) {
    teardown_client();

    uint64_t session = ++session_gen_;
    client_ = factory_();
    device_name_ = name;
    setup_needed_ = true;
    setup_in_progress_ = false;
    pending_connect_ = std::move(on_done);
    set_phase(SupervisorPhase::CONNECTING);

    std::weak_ptr<bool> guard = lifetime_guard_;

    client_->on_status([this, guard, session](const json& payload) {
        if (guard.lock()) {
            handle_status_payload(session, payload);
        }
    });
    client_->register_event_handler([this, guard, session](const DeviceEvent& event) {
        if (guard.lock()) {
            handle_device_event(session, event);
        }
    });

    spdlog::info("[Supervisor] Connecting to {} ({})", address, name.empty() ? "unnamed" : name);
    client_->connect(address, config_.command_timeout_ms,
                     [this, guard, session](bool success, const std::string& error) {
                         if (guard.lock()) {
                             on_connect_result(session, success, error);
                         }
                     });
}

void ConnectivitySupervisor::on_connect_result(uint64_t session, bool success,
                                               const std::string& error) {
    if (session != session_gen_) {
        spdlog::debug("[Supervisor] Ignoring connect result of superseded session {}", session);
        return;
    }

    if (!success) {
        spdlog::error("[Supervisor] Failed to connect to printer: {}", error);
        relay_.stop();
        reset_status_to_defaults();
        notify_status_changed();
        set_phase(SupervisorPhase::IDLE);
        resolve_pending_connect(false, error);
        return;
    }

    spdlog::info("[Supervisor] Connected to {}", client_->address());
    set_phase(SupervisorPhase::CONNECTED);
    client_->start_status_polling(config_.status_poll_interval_ms);
    run_post_connect_setup();
    resolve_pending_connect(true, "Connected to " + client_->address());
}

// ============================================================================
// Post-connect setup
// ============================================================================

void ConnectivitySupervisor::run_post_connect_setup() {
    if (setup_in_progress_) {
        spdlog::debug("[Supervisor] Post-connect setup already running");
        return;
    }
    if (!client_) {
        return;
    }
    setup_in_progress_ = true;
    uint64_t session = session_gen_;

    std::string name = device_name_;
    status_.update([&name](CanonicalStatus& s) {
        s.connected = true;
        if (!name.empty()) {
            s.device_name = name;
        }
    });

    client_->send_command(
        SDCP_CMD_ATTRIBUTES, json::object(),
        [](const json& response) {
            int ack = sdcp::response_ack(response);
            if (ack != 0) {
                spdlog::warn("[Supervisor] {}",
                             DeviceError::from_ack(SDCP_CMD_ATTRIBUTES, ack).message);
            }
        },
        [](const DeviceError& err) {
            spdlog::warn("[Supervisor] Attributes request failed: {}", err.message);
        },
        config_.command_timeout_ms);

    std::weak_ptr<bool> guard = lifetime_guard_;
    client_->send_command(
        SDCP_CMD_CAMERA_STREAM, json{{"Enable", 1}},
        [this, guard, session](const json& response) {
            if (guard.lock()) {
                on_camera_response(session, response);
            }
        },
        [this, guard, session](const DeviceError& err) {
            if (guard.lock()) {
                on_camera_error(session, err);
            }
        },
        config_.command_timeout_ms);
}

void ConnectivitySupervisor::on_camera_response(uint64_t session, const json& response) {
    if (session != session_gen_) {
        return;
    }

    int ack = sdcp::response_ack(response);
    std::string video_url;
    if (response.contains("Data") && response["Data"].is_object() &&
        response["Data"].contains("Data")) {
        video_url = json_util::safe_string(response["Data"]["Data"], "VideoUrl");
    }

    if (ack == 0 && !video_url.empty()) {
        std::string url = "http://" + video_url;
        spdlog::info("[Supervisor] Camera stream available at {}", url);
        status_.update([](CanonicalStatus& s) {
            s.camera_available = true;
            s.camera_error.reset();
        });
        finish_setup(url);
        return;
    }

    std::string reason = ack != 0 ? sdcp::camera_ack_reason(ack) : "Camera not available";
    spdlog::warn("[Supervisor] Camera unavailable: {}", reason);
    status_.update([&reason](CanonicalStatus& s) {
        s.camera_available = false;
        s.camera_error = reason;
    });
    finish_setup(std::nullopt);
}

void ConnectivitySupervisor::on_camera_error(uint64_t session, const DeviceError& error) {
    if (session != session_gen_) {
        return;
    }
    spdlog::warn("[Supervisor] Camera request failed: {}", error.message);
    status_.update([&error](CanonicalStatus& s) {
        s.camera_available = false;
        s.camera_error = error.message;
    });
    finish_setup(std::nullopt);
}

void ConnectivitySupervisor::finish_setup(const std::optional<std::string>& camera_url) {
    setup_in_progress_ = false;
    setup_needed_ = false;

    if (camera_url) {
        relay_.start(*camera_url);
    } else {
        relay_.stop();
    }
    notify_status_changed();
}

// ============================================================================
// Device events and status
// ============================================================================

void ConnectivitySupervisor::handle_device_event(uint64_t session, const DeviceEvent& event) {
    if (session != session_gen_) {
        return;
    }

    spdlog::debug("[Supervisor] Device event {}: {}", device_event_name(event.type),
                  event.message);

    switch (event.type) {
    case DeviceEventType::DISCONNECTED:
    case DeviceEventType::ERROR:
        handle_printer_lost(event.message);
        break;

    case DeviceEventType::RECONNECTED:
        if (grace_timer_ != INVALID_TIMER_ID) {
            scheduler_.cancel(grace_timer_);
            grace_timer_ = INVALID_TIMER_ID;
        }
        set_phase(SupervisorPhase::CONNECTED);
        if (setup_needed_) {
            spdlog::info("[Supervisor] Printer reconnected, refreshing state");
            run_post_connect_setup();
        }
        break;

    case DeviceEventType::RECONNECTING:
    case DeviceEventType::REQUEST_TIMEOUT:
        break;
    }
}

void ConnectivitySupervisor::handle_printer_lost(const std::string& reason) {
    spdlog::warn("[Supervisor] Printer lost: {}", reason);
    setup_needed_ = true;
    relay_.stop();
    if (status_.reset_to_defaults(iso8601_utc_now())) {
        notify_status_changed();
    }

    if (session_from_auto_ && auto_mode_ && grace_timer_ == INVALID_TIMER_ID) {
        uint64_t session = session_gen_;
        grace_timer_ = scheduler_.call_later(config_.reconnect_grace_ms, [this, session]() {
            grace_timer_ = INVALID_TIMER_ID;
            failover_after_grace(session);
        });
    }
}

void ConnectivitySupervisor::handle_status_payload(uint64_t session, const json& payload) {
    if (session != session_gen_) {
        return;
    }

    if (!status_.is_connected() && setup_needed_) {
        run_post_connect_setup();
    }

    PayloadEffect effect;
    std::string now = iso8601_utc_now();
    status_.update(
        [&](CanonicalStatus& s) { effect = apply_device_payload(s, payload, now); });

    if (effect.consolidated_changed) {
        spdlog::info("[Supervisor] Status changed: {} -> {}", to_string(effect.from),
                     to_string(effect.to));
    }
    notify_status_changed();
}

// ============================================================================
// Auto-connect / failover
// ============================================================================

void ConnectivitySupervisor::start_auto_connect() {
    spdlog::info("[Supervisor] Starting printer auto-connect");
    ++auto_gen_;
    auto_mode_ = true;
    cancel_auto_timers();
    auto_connect_step();
}

void ConnectivitySupervisor::cancel_auto_timers() {
    if (auto_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(auto_timer_);
        auto_timer_ = INVALID_TIMER_ID;
    }
    if (grace_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(grace_timer_);
        grace_timer_ = INVALID_TIMER_ID;
    }
}

void ConnectivitySupervisor::schedule_auto_step(uint32_t delay_ms) {
    uint64_t gen = auto_gen_;
    set_phase(SupervisorPhase::WAITING_RETRY);
    if (auto_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(auto_timer_);
    }
    auto_timer_ = scheduler_.call_later(delay_ms, [this, gen]() {
        auto_timer_ = INVALID_TIMER_ID;
        if (gen == auto_gen_ && auto_mode_) {
            auto_connect_step();
        }
    });
}

void ConnectivitySupervisor::auto_connect_step() {
    if (!candidates_.exhausted()) {
        attempt_current_candidate();
        return;
    }

    spdlog::info("[Supervisor] Auto-discovering printers...");
    set_phase(SupervisorPhase::DISCOVERING);

    uint64_t gen = auto_gen_;
    std::weak_ptr<bool> guard = lifetime_guard_;
    Scheduler* scheduler = &scheduler_;
    discovery_.discover(config_.discovery_timeout_ms,
                        [this, guard, gen, scheduler](const std::vector<DiscoveredPrinter>& found) {
                            scheduler->post([this, guard, gen, found]() {
                                if (guard.lock() && gen == auto_gen_ && auto_mode_) {
                                    on_discovery_done(found);
                                }
                            });
                        });
}

void ConnectivitySupervisor::on_discovery_done(const std::vector<DiscoveredPrinter>& printers) {
    std::vector<DiscoveredPrinter> eligible = filter_proxies(printers);
    if (eligible.empty()) {
        spdlog::info("[Supervisor] No eligible printers found on network, retrying in {}ms",
                     config_.retry_delay_ms);
        candidates_.clear();
        schedule_auto_step(config_.retry_delay_ms);
        return;
    }

    spdlog::info("[Supervisor] Discovered {} eligible printer(s)", eligible.size());
    candidates_.candidates = std::move(eligible);
    candidates_.current_index = 0;
    candidates_.consecutive_failures = 0;
    attempt_current_candidate();
}

void ConnectivitySupervisor::attempt_current_candidate() {
    const DiscoveredPrinter printer = candidates_.candidates[candidates_.current_index];
    spdlog::info("[Supervisor] Trying printer {}/{} at {} (attempt {}/{})",
                 candidates_.current_index + 1, candidates_.candidates.size(), printer.address,
                 candidates_.consecutive_failures + 1, config_.candidate_retry_budget);

    uint64_t gen = auto_gen_;
    session_from_auto_ = true;
    connect_internal(printer.address, printer.display_name(),
                     [this, gen](bool success, const std::string& error) {
                         if (gen == auto_gen_ && auto_mode_) {
                             on_candidate_result(success, error);
                         }
                     });
}

void ConnectivitySupervisor::on_candidate_result(bool success, const std::string& error) {
    if (success) {
        candidates_.consecutive_failures = 0;
        return;
    }

    candidates_.consecutive_failures++;
    spdlog::warn("[Supervisor] Connection attempt {}/{} failed: {}",
                 candidates_.consecutive_failures, config_.candidate_retry_budget, error);

    if (candidates_.consecutive_failures >= config_.candidate_retry_budget) {
        candidates_.current_index++;
        candidates_.consecutive_failures = 0;
        if (candidates_.current_index >= candidates_.candidates.size()) {
            spdlog::warn("[Supervisor] All candidates exhausted, rediscovering in {}ms",
                         config_.retry_delay_ms);
            candidates_.clear();
        } else {
            spdlog::info("[Supervisor] Moving on to printer {}/{}", candidates_.current_index + 1,
                         candidates_.candidates.size());
        }
    }
    schedule_auto_step(config_.retry_delay_ms);
}

void ConnectivitySupervisor::failover_after_grace(uint64_t session) {
    if (session != session_gen_ || !auto_mode_) {
        return;
    }
    if (client_ && client_->is_connected()) {
        return;
    }
    spdlog::warn("[Supervisor] Printer did not come back within {}ms, resuming failover",
                 config_.reconnect_grace_ms);
    candidates_.consecutive_failures = 0;
    teardown_client();
    auto_connect_step();
}

} // namespace printcast
