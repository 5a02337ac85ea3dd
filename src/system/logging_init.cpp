// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include "hv/hlog.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace printcast {
namespace logging {

namespace {

constexpr const char* IDENT = "printcast";
constexpr const char* LOG_FILE_NAME = "printcast.log";
constexpr size_t LOG_FILE_MAX_BYTES = 2 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 4;
constexpr size_t BACKTRACE_MESSAGES = 32;

bool dir_accepts_writes(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && access(dir.c_str(), W_OK) == 0;
}

// $LOGS_DIRECTORY (systemd LogsDirectory=), then /var/log/printcast, then the working dir
std::string default_log_file() {
    const char* logs_dir = std::getenv("LOGS_DIRECTORY");
    if (logs_dir && logs_dir[0] != '\0') {
        // systemd may pass a colon-separated list; the first entry is ours
        std::string first(logs_dir);
        first = first.substr(0, first.find(':'));
        if (dir_accepts_writes(first)) {
            return (std::filesystem::path(first) / LOG_FILE_NAME).string();
        }
    }

    std::filesystem::path system_dir = "/var/log/printcast";
    if (dir_accepts_writes(system_dir)) {
        return (system_dir / LOG_FILE_NAME).string();
    }

    return LOG_FILE_NAME;
}

// Under a systemd unit stdout already lands in the journal
LogTarget resolve_auto_target() {
    const char* invocation = std::getenv("INVOCATION_ID");
    if (invocation && invocation[0] != '\0') {
        return LogTarget::Console;
    }
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_DAEMON,
                                                               false);
#endif
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path.empty() ? default_log_file() : file_path, LOG_FILE_MAX_BYTES,
            LOG_FILE_COUNT);
    default:
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget target = config.target == LogTarget::Auto ? resolve_auto_target() : config.target;

    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // Console output still works; report and carry on
        fprintf(stderr, "printcast: cannot open %s log: %s\n", log_target_name(target), e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::enable_backtrace(BACKTRACE_MESSAGES);

    hlog_set_level(hv_log_level(config.level));

    spdlog::debug("[Logging] target={} console={} hv_level={}", log_target_name(target),
                  config.enable_console, hv_log_level(config.level));
}

int hv_log_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
    case spdlog::level::warn:
        // libhv logs every connection at INFO
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "console") {
        return LogTarget::Console;
    }
    if (str == "syslog") {
        return LogTarget::Syslog;
    }
    if (str == "file") {
        return LogTarget::File;
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Console:
        return "console";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Auto:
        break;
    }
    return "auto";
}

spdlog::level::level_enum parse_log_level(const std::string& str) {
    if (str == "off") {
        return spdlog::level::off;
    }
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(str);
    return level == spdlog::level::off ? spdlog::level::info : level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity, spdlog::level::level_enum fallback) {
    if (verbosity <= 0) {
        return fallback;
    }
    static const spdlog::level::level_enum by_count[] = {spdlog::level::info,
                                                         spdlog::level::debug};
    return verbosity <= 2 ? by_count[verbosity - 1] : spdlog::level::trace;
}

} // namespace logging
} // namespace printcast
