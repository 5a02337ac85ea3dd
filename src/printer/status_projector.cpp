// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_projector.h"

#include "json_utils.h"

namespace printcast {

const char* to_string(StatusLabel label) {
    switch (label) {
    case StatusLabel::UNKNOWN:
        return "UNKNOWN";
    case StatusLabel::IDLE:
        return "IDLE";
    case StatusLabel::PRINTING:
        return "PRINTING";
    case StatusLabel::FILE_TRANSFERRING:
        return "FILE_TRANSFERRING";
    case StatusLabel::LEVELING:
        return "LEVELING";
    case StatusLabel::STOPPING:
        return "STOPPING";
    case StatusLabel::STOPPED:
        return "STOPPED";
    case StatusLabel::HOMING:
        return "HOMING";
    case StatusLabel::RECOVERY:
        return "RECOVERY";
    case StatusLabel::DROPPING:
        return "DROPPING";
    case StatusLabel::LIFTING:
        return "LIFTING";
    case StatusLabel::PAUSING:
        return "PAUSING";
    case StatusLabel::PAUSED:
        return "PAUSED";
    case StatusLabel::COMPLETE:
        return "COMPLETE";
    case StatusLabel::FILE_CHECKING:
        return "FILE_CHECKING";
    case StatusLabel::LOADING:
        return "LOADING";
    case StatusLabel::PREHEATING:
        return "PREHEATING";
    }
    return "UNKNOWN";
}

StatusLabel machine_label(std::optional<int> code) {
    if (!code) {
        return StatusLabel::UNKNOWN;
    }
    switch (*code) {
    case 0:
        return StatusLabel::IDLE;
    case 1:
    case 13:
        return StatusLabel::PRINTING;
    case 2:
        return StatusLabel::FILE_TRANSFERRING;
    case 5:
        return StatusLabel::LEVELING;
    case 7:
        return StatusLabel::STOPPING;
    case 8:
        return StatusLabel::STOPPED;
    case 9:
        return StatusLabel::HOMING;
    case 12:
        return StatusLabel::RECOVERY;
    default:
        return StatusLabel::UNKNOWN;
    }
}

StatusLabel job_label(std::optional<int> code) {
    if (!code) {
        return StatusLabel::UNKNOWN;
    }
    switch (*code) {
    case 0:
        return StatusLabel::IDLE;
    case 1:
        return StatusLabel::HOMING;
    case 2:
        return StatusLabel::DROPPING;
    case 3:
    case JOB_CODE_PRINTING_RECOVERY:
        return StatusLabel::PRINTING;
    case 4:
        return StatusLabel::LIFTING;
    case 5:
        return StatusLabel::PAUSING;
    case 6:
        return StatusLabel::PAUSED;
    case 7:
        return StatusLabel::STOPPING;
    case 8:
        return StatusLabel::STOPPED;
    case 9:
        return StatusLabel::COMPLETE;
    case 10:
        return StatusLabel::FILE_CHECKING;
    case 12:
        return StatusLabel::RECOVERY;
    case 15:
    case 18: // filament loading variants
    case 19:
    case 21:
        return StatusLabel::LOADING;
    case 16:
        return StatusLabel::PREHEATING;
    case 20:
        return StatusLabel::LEVELING;
    default:
        return StatusLabel::UNKNOWN;
    }
}

std::optional<int> extract_machine_code(const nlohmann::json& status) {
    if (!status.is_object() || !status.contains("CurrentStatus")) {
        return std::nullopt;
    }
    const auto& current = status["CurrentStatus"];
    if (current.is_array()) {
        if (current.empty() || !current[0].is_number()) {
            return std::nullopt;
        }
        return json_util::integer_value(current[0]);
    }
    if (current.is_number()) {
        return json_util::integer_value(current);
    }
    return std::nullopt;
}

std::optional<int> extract_job_code(const nlohmann::json& status) {
    if (!status.is_object() || !status.contains("PrintInfo")) {
        return std::nullopt;
    }
    const nlohmann::json* code = json_util::field(status["PrintInfo"], "Status");
    if (!code) {
        return std::nullopt;
    }
    return json_util::integer_value(*code);
}

ProjectedStatus project_status(const nlohmann::json& status) {
    ProjectedStatus out;
    out.machine_code = extract_machine_code(status);
    out.job_code = extract_job_code(status);
    out.machine = machine_label(out.machine_code);
    out.job = job_label(out.job_code);

    out.consolidated = out.machine;
    if (out.job_code && *out.job_code == JOB_CODE_PRINTING_RECOVERY) {
        out.consolidated = StatusLabel::PRINTING;
    }
    return out;
}

} // namespace printcast
