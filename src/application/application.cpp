// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "broadcast_gate.h"
#include "connectivity_supervisor.h"
#include "logging_init.h"
#include "media_relay.h"
#include "media_source.h"
#include "monitor_server.h"
#include "printer_discovery.h"
#include "printer_status.h"
#include "scheduler.h"
#include "sdcp_client.h"
#include "status_messages.h"
#include "user_stats.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>

namespace printcast {

namespace {

// Restart flush delay: lets the urgent server_restarting message reach clients
constexpr uint32_t RESTART_FLUSH_DELAY_MS = 1000;
constexpr uint32_t SIGNAL_POLL_INTERVAL_MS = 200;

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int /*sig*/) {
    g_shutdown_requested.store(true);
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    if (!parse_args(argc, argv)) {
        return m_args.help_requested ? 0 : 1;
    }

    init_config();
    init_logging();

    spdlog::info("[Application] Starting printcast on port {}", m_config.port);
    spdlog::debug("[Application] Broadcast interval {}ms, camera cap {} fps",
                  m_config.ws_update_interval_ms, m_config.max_fps);

    init_services();

    if (!start_server()) {
        shutdown();
        return 1;
    }

    install_signal_handlers();
    m_scheduler->post([this]() { start_connectivity(); });

    // Blocks until stop()
    m_loop->run();

    shutdown();
    return m_exit_code;
}

bool Application::parse_args(int argc, char** argv) {
    return parse_cli_args(argc, argv, m_args);
}

void Application::init_config() {
    m_config = load_app_config_from_env();
    apply_cli_overrides(m_config, m_args);
}

void Application::init_logging() {
    logging::init(m_config.log);
}

void Application::init_services() {
    m_loop = std::make_shared<hv::EventLoop>();
    m_scheduler = std::make_unique<HvScheduler>(m_loop);

    m_status = std::make_unique<PrinterStatusStore>();
    m_users = std::make_unique<UserStats>();
    m_gate = std::make_unique<BroadcastGate>(*m_scheduler, m_config.ws_update_interval_ms);

    // Read timeout backs up the relay's stall check
    m_media_source = std::make_unique<HttpMediaSource>(m_config.command_timeout_ms,
                                                       2 * m_config.stream_stall_timeout_ms);
    m_relay = std::make_unique<MediaRelay>(*m_scheduler, *m_media_source, m_config.relay_config());
    m_relay->set_camera_status_callback(
        [this](bool available, const std::optional<std::string>& error) {
            on_camera_status(available, error);
        });
    m_relay->set_fatal_callback([this](const std::string& reason) { on_camera_fatal(reason); });

    m_discovery = std::make_unique<UdpPrinterDiscovery>();

    hv::EventLoopPtr loop = m_loop;
    HvScheduler* scheduler = m_scheduler.get();
    DeviceClientFactory factory = [loop, scheduler]() -> DeviceClientPtr {
        return std::make_shared<SdcpClient>(loop, *scheduler);
    };
    m_supervisor = std::make_unique<ConnectivitySupervisor>(
        *m_scheduler, *m_status, *m_relay, *m_discovery, factory, m_config.supervisor_config());
    m_supervisor->set_status_changed_callback([this]() { broadcast_status(); });

    MonitorServer::Options options;
    options.port = m_config.port;
    options.public_dir = m_config.public_dir;
    m_server = std::make_unique<MonitorServer>(*m_scheduler, *m_status, *m_users, *m_gate,
                                               *m_relay, *m_supervisor, options);
    m_server->set_users_changed_callback(
        [this]() { m_scheduler->post([this]() { broadcast_status(); }); });
}

bool Application::start_server() {
    return m_server->start();
}

void Application::start_connectivity() {
    if (m_config.printer_ip) {
        connect_fixed_printer();
    } else {
        m_supervisor->start_auto_connect();
    }
}

void Application::connect_fixed_printer() {
    const std::string ip = *m_config.printer_ip;
    spdlog::info("[Application] Using configured printer at {}", ip);
    m_supervisor->connect_to(ip, "", [this, ip](bool success, const std::string& message) {
        if (success || m_shutdown_complete) {
            return;
        }
        spdlog::warn("[Application] Printer at {} unreachable ({}), retrying in {}ms", ip,
                     message, m_config.retry_delay_ms);
        m_scheduler->call_later(m_config.retry_delay_ms, [this]() {
            // A connect via /api/connect may have replaced the configured printer
            auto client = m_supervisor->client();
            if (client && client->address() != *m_config.printer_ip) {
                return;
            }
            connect_fixed_printer();
        });
    });
}

void Application::install_signal_handlers() {
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
    std::signal(SIGPIPE, SIG_IGN);

    m_scheduler->call_every(SIGNAL_POLL_INTERVAL_MS, [this]() {
        if (g_shutdown_requested.load()) {
            spdlog::info("[Application] Shutdown requested");
            m_loop->stop();
        }
    });
}

// ============================================================================
// Runtime callbacks (control loop)
// ============================================================================

void Application::broadcast_status() {
    try {
        m_gate->broadcast(make_status_message(m_status->snapshot(), m_users->snapshot()));
    } catch (const std::exception& e) {
        spdlog::error("[Application] Failed to build status message: {}", e.what());
    }
}

void Application::on_camera_status(bool available, const std::optional<std::string>& error) {
    m_status->update([&](CanonicalStatus& s) {
        s.camera_available = available;
        s.camera_error = available ? std::nullopt : error;
    });
    broadcast_status();
}

void Application::on_camera_fatal(const std::string& reason) {
    if (m_fatal_pending) {
        return;
    }
    m_fatal_pending = true;

    spdlog::critical("[Application] Camera failed repeatedly with the same error; exiting to "
                     "restart. Error: {}",
                     reason);
    spdlog::critical("=== Recent log messages (backtrace) ===");
    spdlog::dump_backtrace();

    try {
        m_gate->broadcast_urgent(make_restart_message(reason));
    } catch (const std::exception& e) {
        spdlog::error("[Application] Failed to send restart notice: {}", e.what());
    }

    m_scheduler->call_later(RESTART_FLUSH_DELAY_MS, [this]() {
        m_exit_code = 1;
        m_loop->stop();
    });
}

void Application::shutdown() {
    // Guard against multiple calls (destructor + explicit shutdown)
    if (m_shutdown_complete) {
        return;
    }
    m_shutdown_complete = true;
    if (!m_loop) {
        return; // never initialized (--help or bad arguments)
    }

    spdlog::info("[Application] Shutting down...");

    // Reverse initialization order
    if (m_server) {
        m_server->stop();
    }
    if (m_supervisor) {
        m_supervisor->stop();
    }
    if (m_relay) {
        m_relay->stop();
    }
    if (m_gate) {
        m_gate->cancel_pending();
    }

    m_server.reset();
    m_supervisor.reset();
    m_discovery.reset();
    m_relay.reset();
    m_media_source.reset();
    m_gate.reset();
    m_users.reset();
    m_status.reset();
    m_scheduler.reset();
    m_loop.reset();

    spdlog::info("[Application] Shutdown complete");
}

} // namespace printcast
