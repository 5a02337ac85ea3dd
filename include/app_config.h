// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file app_config.h
 * @brief Runtime settings resolved from the environment and the command line
 */

#include "cli_args.h"
#include "connectivity_supervisor.h"
#include "logging_init.h"
#include "media_relay.h"

#include <cstdint>
#include <optional>
#include <string>

namespace printcast {

struct AppConfig {
    uint16_t port = 3000;
    uint32_t ws_update_interval_ms = 1000;

    uint32_t max_fps = 15;
    uint32_t camera_max_start_failures = 3;
    uint32_t camera_retry_delay_ms = 5000;
    uint32_t stream_stall_timeout_ms = 10000;

    uint32_t command_timeout_ms = 10000;
    uint32_t status_poll_interval_ms = 2000;
    uint32_t candidate_retry_budget = 3;
    uint32_t retry_delay_ms = 5000;
    uint32_t discovery_timeout_ms = 5000;
    uint32_t reconnect_grace_ms = 15000;

    std::optional<std::string> printer_ip; ///< set = fixed device, no auto-connect
    std::optional<std::string> public_dir;

    logging::LogConfig log;

    SupervisorConfig supervisor_config() const;
    MediaRelayConfig relay_config() const;
};

/**
 * @brief Read every setting from the environment
 *
 * Invalid or out-of-range values keep their default and log a warning.
 */
AppConfig load_app_config_from_env();

/// Command-line values win over the environment
void apply_cli_overrides(AppConfig& config, const CliArgs& args);

} // namespace printcast
