// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file status_projector.h
 * @brief Maps raw SDCP status codes to canonical printer labels
 *
 * Pure functions with no state. The device reports two independent codes:
 * the machine state (Status.CurrentStatus, a number or an array whose first
 * element counts) and the job state (Status.PrintInfo.Status). The
 * consolidated label follows the machine label, except that job code 13
 * (printing recovery) always reads as PRINTING.
 */

#pragma once

#include <optional>
#include <string>

#include "hv/json.hpp"

namespace printcast {

enum class StatusLabel {
    UNKNOWN,
    IDLE,
    PRINTING,
    FILE_TRANSFERRING,
    LEVELING,
    STOPPING,
    STOPPED,
    HOMING,
    RECOVERY,
    DROPPING,
    LIFTING,
    PAUSING,
    PAUSED,
    COMPLETE,
    FILE_CHECKING,
    LOADING,
    PREHEATING
};

const char* to_string(StatusLabel label);

/// Job code meaning "printing recovery"; forces the consolidated label to PRINTING
constexpr int JOB_CODE_PRINTING_RECOVERY = 13;

StatusLabel machine_label(std::optional<int> code);
StatusLabel job_label(std::optional<int> code);

struct ProjectedStatus {
    StatusLabel consolidated = StatusLabel::UNKNOWN;
    StatusLabel machine = StatusLabel::UNKNOWN;
    StatusLabel job = StatusLabel::UNKNOWN;
    std::optional<int> machine_code;
    std::optional<int> job_code;
};

/**
 * @brief Extract machine and job codes from a device Status object
 *
 * @param status The "Status" object of a device payload (may be missing fields)
 * @return Labels and raw codes; UNKNOWN/nullopt where the payload has nothing usable
 */
ProjectedStatus project_status(const nlohmann::json& status);

/// Machine code from CurrentStatus, which may be a number or a non-empty array
std::optional<int> extract_machine_code(const nlohmann::json& status);

std::optional<int> extract_job_code(const nlohmann::json& status);

} // namespace printcast
