// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_config.h"

#include "environment_config.h"

#include <spdlog/spdlog.h>

namespace printcast {

using config::EnvironmentConfig;

namespace {

void read_bounded(const char* name, int min, int max, uint32_t& out) {
    if (!EnvironmentConfig::exists(name)) {
        return;
    }
    auto value = EnvironmentConfig::get_int(name, min, max);
    if (!value) {
        spdlog::warn("[Config] Ignoring {}={} (expected {}-{}), using {}", name,
                     EnvironmentConfig::get_string(name).value_or(""), min, max, out);
        return;
    }
    out = static_cast<uint32_t>(*value);
}

std::optional<std::string> read_non_empty(const char* name) {
    auto value = EnvironmentConfig::get_string(name);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

SupervisorConfig AppConfig::supervisor_config() const {
    SupervisorConfig sc;
    sc.command_timeout_ms = command_timeout_ms;
    sc.status_poll_interval_ms = status_poll_interval_ms;
    sc.discovery_timeout_ms = discovery_timeout_ms;
    sc.retry_delay_ms = retry_delay_ms;
    sc.candidate_retry_budget = candidate_retry_budget;
    sc.reconnect_grace_ms = reconnect_grace_ms;
    return sc;
}

MediaRelayConfig AppConfig::relay_config() const {
    MediaRelayConfig rc;
    rc.max_fps = max_fps;
    rc.retry_delay_ms = camera_retry_delay_ms;
    rc.stall_timeout_ms = stream_stall_timeout_ms;
    rc.failure_threshold = camera_max_start_failures;
    return rc;
}

AppConfig load_app_config_from_env() {
    AppConfig cfg;

    uint32_t port = cfg.port;
    read_bounded("PORT", 1, 65535, port);
    cfg.port = static_cast<uint16_t>(port);

    read_bounded("WS_UPDATE_INTERVAL", 50, 60000, cfg.ws_update_interval_ms);
    read_bounded("MAX_FPS", 1, 60, cfg.max_fps);
    read_bounded("COMMAND_TIMEOUT_MS", 500, 120000, cfg.command_timeout_ms);
    read_bounded("STATUS_POLL_INTERVAL_MS", 250, 60000, cfg.status_poll_interval_ms);
    read_bounded("CAMERA_MAX_START_FAILURES", 1, 100, cfg.camera_max_start_failures);
    read_bounded("CANDIDATE_RETRY_BUDGET", 1, 100, cfg.candidate_retry_budget);
    read_bounded("RETRY_DELAY_MS", 100, 600000, cfg.retry_delay_ms);
    read_bounded("DISCOVERY_TIMEOUT_MS", 500, 60000, cfg.discovery_timeout_ms);
    read_bounded("CAMERA_RETRY_DELAY_MS", 100, 600000, cfg.camera_retry_delay_ms);
    read_bounded("STREAM_STALL_TIMEOUT_MS", 1000, 600000, cfg.stream_stall_timeout_ms);
    read_bounded("RECONNECT_GRACE_MS", 0, 600000, cfg.reconnect_grace_ms);

    cfg.printer_ip = read_non_empty("PRINTER_IP");
    cfg.public_dir = read_non_empty("PUBLIC_DIR");

    if (auto level = read_non_empty("LOG_LEVEL")) {
        cfg.log.level = logging::parse_log_level(*level);
    }
    if (auto dest = read_non_empty("LOG_DEST")) {
        cfg.log.target = logging::parse_log_target(*dest);
    }
    if (auto file = read_non_empty("LOG_FILE")) {
        cfg.log.file_path = *file;
    }

    return cfg;
}

void apply_cli_overrides(AppConfig& config, const CliArgs& args) {
    if (args.port > 0) {
        config.port = static_cast<uint16_t>(args.port);
    }
    if (!args.printer_ip.empty()) {
        config.printer_ip = args.printer_ip;
    }
    config.log.level = logging::verbosity_to_level(args.verbosity, config.log.level);
    if (!args.log_dest.empty()) {
        config.log.target = logging::parse_log_target(args.log_dest);
    }
    if (!args.log_file.empty()) {
        config.log.file_path = args.log_file;
    }
}

} // namespace printcast
