// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup: console sink plus an optional syslog or rotating file sink
 *
 * init() also sets libhv's own logger level so its connection chatter follows ours.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace printcast {
namespace logging {

enum class LogTarget {
    Auto,    ///< console under systemd, else syslog on Linux
    Syslog,  ///< syslog(3)
    File,    ///< rotating file
    Console, ///< stdout only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< empty = $LOGS_DIRECTORY, /var/log/printcast or ./printcast.log
};

/// Build the sinks, install the default logger and enable the backtrace buffer
void init(const LogConfig& config);

/// libhv LOG_LEVEL_* for a spdlog level; info is raised to warn
int hv_log_level(spdlog::level::level_enum level);

/// "auto", "syslog", "file", "console"; anything else maps to Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// LOG_LEVEL names ("trace" .. "off"); unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string& str);

/// -v = info, -vv = debug, -vvv = trace; 0 keeps @p fallback
spdlog::level::level_enum verbosity_to_level(int verbosity, spdlog::level::level_enum fallback);

} // namespace logging
} // namespace printcast
