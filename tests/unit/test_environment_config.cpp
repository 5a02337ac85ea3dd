// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_config.h"
#include "environment_config.h"

#include <cstdlib>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace printcast;
using namespace printcast::config;

// Helper to set/unset environment variables for testing
class EnvGuard {
  public:
    explicit EnvGuard(const char* name, const char* value = nullptr) : m_name(name) {
        // Save original value if exists
        const char* original = std::getenv(name);
        if (original) {
            m_had_original = true;
            m_original = original;
        }

        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~EnvGuard() {
        if (m_had_original) {
            setenv(m_name.c_str(), m_original.c_str(), 1);
        } else {
            unsetenv(m_name.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

  private:
    std::string m_name;
    std::string m_original;
    bool m_had_original{false};
};

// ============================================================================
// EnvironmentConfig
// ============================================================================

TEST_CASE("EnvironmentConfig::get_int basic parsing", "[environment][config]") {
    SECTION("Valid integer within range") {
        EnvGuard guard("TEST_INT_VAR", "42");
        auto result = EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Integer at the bounds") {
        EnvGuard guard("TEST_INT_VAR", "100");
        REQUIRE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100) == 100);
        EnvGuard low("TEST_INT_VAR2", "0");
        REQUIRE(EnvironmentConfig::get_int("TEST_INT_VAR2", 0, 100) == 0);
    }

    SECTION("Out of range returns nullopt") {
        EnvGuard guard("TEST_INT_VAR", "101");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100).has_value());
        EnvGuard low("TEST_INT_VAR2", "-1");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR2", 0, 100).has_value());
    }

    SECTION("Missing variable returns nullopt") {
        EnvGuard guard("TEST_INT_VAR");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100).has_value());
    }

    SECTION("Empty string returns nullopt") {
        EnvGuard guard("TEST_INT_VAR", "");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100).has_value());
    }

    SECTION("Trailing garbage returns nullopt") {
        EnvGuard guard("TEST_INT_VAR", "42abc");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100).has_value());
    }

    SECTION("Non-numeric returns nullopt") {
        EnvGuard guard("TEST_INT_VAR", "fast");
        REQUIRE_FALSE(EnvironmentConfig::get_int("TEST_INT_VAR", 0, 100).has_value());
    }
}

TEST_CASE("EnvironmentConfig::exists and get_string", "[environment][config]") {
    SECTION("Set variable") {
        EnvGuard guard("TEST_STR_VAR", "hello");
        REQUIRE(EnvironmentConfig::exists("TEST_STR_VAR"));
        REQUIRE(EnvironmentConfig::get_string("TEST_STR_VAR") == std::string("hello"));
    }

    SECTION("Empty variable still exists") {
        EnvGuard guard("TEST_STR_VAR", "");
        REQUIRE(EnvironmentConfig::exists("TEST_STR_VAR"));
        auto value = EnvironmentConfig::get_string("TEST_STR_VAR");
        REQUIRE(value.has_value());
        REQUIRE(value->empty());
    }

    SECTION("Unset variable") {
        EnvGuard guard("TEST_STR_VAR");
        REQUIRE_FALSE(EnvironmentConfig::exists("TEST_STR_VAR"));
        REQUIRE_FALSE(EnvironmentConfig::get_string("TEST_STR_VAR").has_value());
    }
}

// ============================================================================
// load_app_config_from_env
// ============================================================================

namespace {

// Clears every variable the loader reads for the duration of a test
struct CleanEnv {
    EnvGuard port{"PORT"};
    EnvGuard ws{"WS_UPDATE_INTERVAL"};
    EnvGuard fps{"MAX_FPS"};
    EnvGuard cmd{"COMMAND_TIMEOUT_MS"};
    EnvGuard poll{"STATUS_POLL_INTERVAL_MS"};
    EnvGuard cam_failures{"CAMERA_MAX_START_FAILURES"};
    EnvGuard budget{"CANDIDATE_RETRY_BUDGET"};
    EnvGuard retry{"RETRY_DELAY_MS"};
    EnvGuard discovery{"DISCOVERY_TIMEOUT_MS"};
    EnvGuard cam_retry{"CAMERA_RETRY_DELAY_MS"};
    EnvGuard stall{"STREAM_STALL_TIMEOUT_MS"};
    EnvGuard grace{"RECONNECT_GRACE_MS"};
    EnvGuard printer{"PRINTER_IP"};
    EnvGuard public_dir{"PUBLIC_DIR"};
    EnvGuard level{"LOG_LEVEL"};
    EnvGuard dest{"LOG_DEST"};
    EnvGuard file{"LOG_FILE"};
};

} // namespace

TEST_CASE("load_app_config_from_env: defaults", "[environment][config]") {
    CleanEnv env;
    AppConfig cfg = load_app_config_from_env();

    REQUIRE(cfg.port == 3000);
    REQUIRE(cfg.ws_update_interval_ms == 1000);
    REQUIRE(cfg.max_fps == 15);
    REQUIRE(cfg.camera_max_start_failures == 3);
    REQUIRE(cfg.command_timeout_ms == 10000);
    REQUIRE(cfg.candidate_retry_budget == 3);
    REQUIRE(cfg.retry_delay_ms == 5000);
    REQUIRE(cfg.reconnect_grace_ms == 15000);
    REQUIRE_FALSE(cfg.printer_ip.has_value());
    REQUIRE_FALSE(cfg.public_dir.has_value());
    REQUIRE(cfg.log.level == spdlog::level::info);
    REQUIRE(cfg.log.target == logging::LogTarget::Auto);
    REQUIRE(cfg.log.file_path.empty());
}

TEST_CASE("load_app_config_from_env: overrides", "[environment][config]") {
    CleanEnv env;
    EnvGuard port("PORT", "8080");
    EnvGuard ws("WS_UPDATE_INTERVAL", "250");
    EnvGuard fps("MAX_FPS", "5");
    EnvGuard failures("CAMERA_MAX_START_FAILURES", "7");
    EnvGuard printer("PRINTER_IP", "192.168.1.50");
    EnvGuard level("LOG_LEVEL", "debug");
    EnvGuard dest("LOG_DEST", "file");
    EnvGuard file("LOG_FILE", "/tmp/printcast-test.log");

    AppConfig cfg = load_app_config_from_env();
    REQUIRE(cfg.port == 8080);
    REQUIRE(cfg.ws_update_interval_ms == 250);
    REQUIRE(cfg.max_fps == 5);
    REQUIRE(cfg.printer_ip == std::string("192.168.1.50"));
    REQUIRE(cfg.log.level == spdlog::level::debug);
    REQUIRE(cfg.log.target == logging::LogTarget::File);
    REQUIRE(cfg.log.file_path == "/tmp/printcast-test.log");

    SECTION("derived component configs") {
        MediaRelayConfig rc = cfg.relay_config();
        REQUIRE(rc.max_fps == 5);
        REQUIRE(rc.failure_threshold == 7);

        SupervisorConfig sc = cfg.supervisor_config();
        REQUIRE(sc.command_timeout_ms == cfg.command_timeout_ms);
        REQUIRE(sc.candidate_retry_budget == 3);
    }
}

TEST_CASE("load_app_config_from_env: invalid values keep defaults", "[environment][config]") {
    CleanEnv env;

    SECTION("port out of range") {
        EnvGuard port("PORT", "70000");
        REQUIRE(load_app_config_from_env().port == 3000);
    }

    SECTION("port not a number") {
        EnvGuard port("PORT", "http");
        REQUIRE(load_app_config_from_env().port == 3000);
    }

    SECTION("interval below the floor") {
        EnvGuard ws("WS_UPDATE_INTERVAL", "10");
        REQUIRE(load_app_config_from_env().ws_update_interval_ms == 1000);
    }

    SECTION("frame rate above the ceiling") {
        EnvGuard fps("MAX_FPS", "120");
        REQUIRE(load_app_config_from_env().max_fps == 15);
    }

    SECTION("empty PRINTER_IP means auto-connect") {
        EnvGuard printer("PRINTER_IP", "");
        REQUIRE_FALSE(load_app_config_from_env().printer_ip.has_value());
    }

    SECTION("unknown log level") {
        EnvGuard level("LOG_LEVEL", "chatty");
        REQUIRE(load_app_config_from_env().log.level == spdlog::level::info);
    }
}

TEST_CASE("apply_cli_overrides: command line wins", "[environment][config]") {
    CleanEnv env;
    EnvGuard port("PORT", "8080");
    EnvGuard printer("PRINTER_IP", "10.0.0.1");
    AppConfig cfg = load_app_config_from_env();

    SECTION("set values replace the environment") {
        CliArgs args;
        args.port = 9000;
        args.printer_ip = "10.0.0.2";
        args.verbosity = 2;
        args.log_dest = "console";
        args.log_file = "/tmp/x.log";
        apply_cli_overrides(cfg, args);

        REQUIRE(cfg.port == 9000);
        REQUIRE(cfg.printer_ip == std::string("10.0.0.2"));
        REQUIRE(cfg.log.level == spdlog::level::debug);
        REQUIRE(cfg.log.target == logging::LogTarget::Console);
        REQUIRE(cfg.log.file_path == "/tmp/x.log");
    }

    SECTION("unset values leave the environment alone") {
        apply_cli_overrides(cfg, CliArgs{});
        REQUIRE(cfg.port == 8080);
        REQUIRE(cfg.printer_ip == std::string("10.0.0.1"));
        REQUIRE(cfg.log.level == spdlog::level::info);
        REQUIRE(cfg.log.target == logging::LogTarget::Auto);
    }
}
