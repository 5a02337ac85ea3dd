// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "app_config.h"
#include "cli_args.h"

#include <memory>
#include <optional>
#include <string>

#include "hv/EventLoop.h"

namespace printcast {

class BroadcastGate;
class ConnectivitySupervisor;
class HttpMediaSource;
class HvScheduler;
class MediaRelay;
class MonitorServer;
class PrinterStatusStore;
class UdpPrinterDiscovery;
class UserStats;

/**
 * @brief Main application orchestrator
 *
 * Application wires the subsystems together in order:
 * 1. Parse CLI args, read the environment
 * 2. Initialize logging
 * 3. Create the control loop and the services that live on it
 * 4. Start the HTTP/WebSocket server
 * 5. Connect to the configured printer, or start auto-connect
 * 6. Run the control loop until a signal or a fatal camera failure
 * 7. Shutdown in reverse order
 *
 * Usage:
 *   printcast::Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @return Exit code (0 = clean shutdown, 1 = error or fatal camera failure)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    void init_config();
    void init_logging();
    void init_services();
    bool start_server();
    void start_connectivity();
    void connect_fixed_printer();
    void install_signal_handlers();

    // Runtime
    void broadcast_status();
    void on_camera_status(bool available, const std::optional<std::string>& error);
    void on_camera_fatal(const std::string& reason);

    void shutdown();

    CliArgs m_args;
    AppConfig m_config;
    int m_exit_code = 0;
    bool m_fatal_pending = false;
    bool m_shutdown_complete = false;

    // Owned services (in initialization order)
    hv::EventLoopPtr m_loop;
    std::unique_ptr<HvScheduler> m_scheduler;
    std::unique_ptr<PrinterStatusStore> m_status;
    std::unique_ptr<UserStats> m_users;
    std::unique_ptr<BroadcastGate> m_gate;
    std::unique_ptr<HttpMediaSource> m_media_source;
    std::unique_ptr<MediaRelay> m_relay;
    std::unique_ptr<UdpPrinterDiscovery> m_discovery;
    std::unique_ptr<ConnectivitySupervisor> m_supervisor;
    std::unique_ptr<MonitorServer> m_server;
};

} // namespace printcast
