// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_projector.h"

#include <catch2/catch_test_macros.hpp>

#include "hv/json.hpp"

using namespace printcast;
using json = nlohmann::json;

// ============================================================================
// Code tables
// ============================================================================

TEST_CASE("machine_label: known machine codes", "[status_projector]") {
    REQUIRE(machine_label(0) == StatusLabel::IDLE);
    REQUIRE(machine_label(1) == StatusLabel::PRINTING);
    REQUIRE(machine_label(2) == StatusLabel::FILE_TRANSFERRING);
    REQUIRE(machine_label(5) == StatusLabel::LEVELING);
    REQUIRE(machine_label(7) == StatusLabel::STOPPING);
    REQUIRE(machine_label(8) == StatusLabel::STOPPED);
    REQUIRE(machine_label(9) == StatusLabel::HOMING);
    REQUIRE(machine_label(12) == StatusLabel::RECOVERY);
    REQUIRE(machine_label(13) == StatusLabel::PRINTING);
}

TEST_CASE("machine_label: unknown or missing codes", "[status_projector]") {
    REQUIRE(machine_label(3) == StatusLabel::UNKNOWN);
    REQUIRE(machine_label(42) == StatusLabel::UNKNOWN);
    REQUIRE(machine_label(-1) == StatusLabel::UNKNOWN);
    REQUIRE(machine_label(std::nullopt) == StatusLabel::UNKNOWN);
}

TEST_CASE("job_label: known job codes", "[status_projector]") {
    REQUIRE(job_label(0) == StatusLabel::IDLE);
    REQUIRE(job_label(1) == StatusLabel::HOMING);
    REQUIRE(job_label(2) == StatusLabel::DROPPING);
    REQUIRE(job_label(3) == StatusLabel::PRINTING);
    REQUIRE(job_label(4) == StatusLabel::LIFTING);
    REQUIRE(job_label(5) == StatusLabel::PAUSING);
    REQUIRE(job_label(6) == StatusLabel::PAUSED);
    REQUIRE(job_label(7) == StatusLabel::STOPPING);
    REQUIRE(job_label(8) == StatusLabel::STOPPED);
    REQUIRE(job_label(9) == StatusLabel::COMPLETE);
    REQUIRE(job_label(10) == StatusLabel::FILE_CHECKING);
    REQUIRE(job_label(12) == StatusLabel::RECOVERY);
    REQUIRE(job_label(13) == StatusLabel::PRINTING);
    REQUIRE(job_label(15) == StatusLabel::LOADING);
    REQUIRE(job_label(16) == StatusLabel::PREHEATING);
    REQUIRE(job_label(20) == StatusLabel::LEVELING);
}

TEST_CASE("job_label: loading variants", "[status_projector]") {
    REQUIRE(job_label(18) == StatusLabel::LOADING);
    REQUIRE(job_label(19) == StatusLabel::LOADING);
    REQUIRE(job_label(21) == StatusLabel::LOADING);
}

TEST_CASE("job_label: unknown codes", "[status_projector]") {
    REQUIRE(job_label(11) == StatusLabel::UNKNOWN);
    REQUIRE(job_label(14) == StatusLabel::UNKNOWN);
    REQUIRE(job_label(99) == StatusLabel::UNKNOWN);
    REQUIRE(job_label(std::nullopt) == StatusLabel::UNKNOWN);
}

TEST_CASE("to_string: label names", "[status_projector]") {
    REQUIRE(std::string(to_string(StatusLabel::FILE_TRANSFERRING)) == "FILE_TRANSFERRING");
    REQUIRE(std::string(to_string(StatusLabel::UNKNOWN)) == "UNKNOWN");
    REQUIRE(std::string(to_string(StatusLabel::PREHEATING)) == "PREHEATING");
}

// ============================================================================
// Code extraction
// ============================================================================

TEST_CASE("extract_machine_code: number or array", "[status_projector]") {
    SECTION("plain number") {
        REQUIRE(extract_machine_code(json{{"CurrentStatus", 1}}) == 1);
    }

    SECTION("array uses the first element") {
        REQUIRE(extract_machine_code(json{{"CurrentStatus", {8, 1}}}) == 8);
    }

    SECTION("empty array") {
        REQUIRE_FALSE(extract_machine_code(json{{"CurrentStatus", json::array()}}).has_value());
    }

    SECTION("missing field") {
        REQUIRE_FALSE(extract_machine_code(json::object()).has_value());
    }

    SECTION("non-numeric value") {
        REQUIRE_FALSE(extract_machine_code(json{{"CurrentStatus", "busy"}}).has_value());
    }

    SECTION("not an object") {
        REQUIRE_FALSE(extract_machine_code(json::array()).has_value());
    }
}

TEST_CASE("extract_job_code: PrintInfo.Status", "[status_projector]") {
    REQUIRE(extract_job_code(json{{"PrintInfo", {{"Status", 3}}}}) == 3);
    REQUIRE(extract_job_code(json{{"PrintInfo", {{"Status", "13"}}}}) == 13);
    REQUIRE_FALSE(extract_job_code(json{{"PrintInfo", json::object()}}).has_value());
    REQUIRE_FALSE(extract_job_code(json::object()).has_value());
    REQUIRE_FALSE(extract_job_code(json{{"PrintInfo", {{"Status", "13x"}}}}).has_value());
}

// ============================================================================
// Projection
// ============================================================================

TEST_CASE("project_status: consolidated follows the machine label", "[status_projector]") {
    json status = {{"CurrentStatus", {0}}, {"PrintInfo", {{"Status", 9}}}};
    ProjectedStatus p = project_status(status);

    REQUIRE(p.machine == StatusLabel::IDLE);
    REQUIRE(p.job == StatusLabel::COMPLETE);
    REQUIRE(p.consolidated == StatusLabel::IDLE);
    REQUIRE(p.machine_code == 0);
    REQUIRE(p.job_code == 9);
}

TEST_CASE("project_status: job code 13 always reads as PRINTING", "[status_projector]") {
    SECTION("with the machine printing") {
        ProjectedStatus p =
            project_status(json{{"CurrentStatus", {1}}, {"PrintInfo", {{"Status", 13}}}});
        REQUIRE(p.consolidated == StatusLabel::PRINTING);
        REQUIRE(p.machine == StatusLabel::PRINTING);
        REQUIRE(p.job == StatusLabel::PRINTING);
    }

    SECTION("with the machine idle") {
        ProjectedStatus p =
            project_status(json{{"CurrentStatus", 0}, {"PrintInfo", {{"Status", 13}}}});
        REQUIRE(p.machine == StatusLabel::IDLE);
        REQUIRE(p.consolidated == StatusLabel::PRINTING);
    }

    SECTION("with an unknown machine code") {
        ProjectedStatus p =
            project_status(json{{"CurrentStatus", 77}, {"PrintInfo", {{"Status", 13}}}});
        REQUIRE(p.machine == StatusLabel::UNKNOWN);
        REQUIRE(p.consolidated == StatusLabel::PRINTING);
    }

    SECTION("without a machine code") {
        ProjectedStatus p = project_status(json{{"PrintInfo", {{"Status", 13}}}});
        REQUIRE(p.consolidated == StatusLabel::PRINTING);
    }
}

TEST_CASE("project_status: empty status is all UNKNOWN", "[status_projector]") {
    ProjectedStatus p = project_status(json::object());
    REQUIRE(p.consolidated == StatusLabel::UNKNOWN);
    REQUIRE(p.machine == StatusLabel::UNKNOWN);
    REQUIRE(p.job == StatusLabel::UNKNOWN);
    REQUIRE_FALSE(p.machine_code.has_value());
    REQUIRE_FALSE(p.job_code.has_value());
}

TEST_CASE("extract codes: non-integral or out-of-range numbers are missing", "[status_projector]") {
    SECTION("machine code") {
        REQUIRE_FALSE(extract_machine_code(json{{"CurrentStatus", 1.5}}).has_value());
        REQUIRE_FALSE(extract_machine_code(json{{"CurrentStatus", 1e12}}).has_value());
        REQUIRE_FALSE(extract_machine_code(json{{"CurrentStatus", {3e10}}}).has_value());
        REQUIRE_FALSE(
            extract_machine_code(json{{"CurrentStatus", 9000000000000LL}}).has_value());
        REQUIRE_FALSE(
            extract_machine_code(json{{"CurrentStatus", 18446744073709551615ULL}}).has_value());
        REQUIRE(extract_machine_code(json{{"CurrentStatus", -1}}) == -1);
    }

    SECTION("job code") {
        REQUIRE_FALSE(extract_job_code(json{{"PrintInfo", {{"Status", 13.0}}}}).has_value());
        REQUIRE_FALSE(extract_job_code(json{{"PrintInfo", {{"Status", -1e300}}}}).has_value());
        REQUIRE_FALSE(
            extract_job_code(json{{"PrintInfo", {{"Status", "99999999999"}}}}).has_value());
        REQUIRE_FALSE(extract_job_code(json{{"PrintInfo", {{"Status", nullptr}}}}).has_value());
    }

    SECTION("projection treats them as unknown") {
        ProjectedStatus p = project_status(json{{"CurrentStatus", {1e20}}});
        REQUIRE_FALSE(p.machine_code.has_value());
    }
}
