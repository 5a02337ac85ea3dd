// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_status.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdio>
#include <ctime>

using json = nlohmann::json;

namespace printcast {

namespace {

json optional_code(const std::optional<int>& code) {
    return code ? json(*code) : json(nullptr);
}

json temperature_json(const TemperatureReading& t) {
    return {{"current", t.current}, {"target", t.target}};
}

void patch_temperature(const json& s, const char* key, double& field) {
    auto value = json_util::optional_double(s, key);
    if (value) {
        field = std::round(*value);
    }
}

} // namespace

std::string format_iso8601_utc(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
    return out;
}

bool is_disconnected_default(const CanonicalStatus& status) {
    CanonicalStatus defaults;
    defaults.last_update = status.last_update;
    return to_json(status) == to_json(defaults);
}

json to_json(const CanonicalStatus& s) {
    json j;
    j["connected"] = s.connected;
    j["deviceName"] = s.device_name;
    j["status"] = {
        {"consolidated", to_string(s.consolidated)},
        {"machine", {{"state", to_string(s.machine_state)}, {"code", optional_code(s.machine_code)}}},
        {"job", {{"state", to_string(s.job_state)}, {"code", optional_code(s.job_code)}}}};
    j["previousConsolidated"] =
        s.previous_consolidated ? json(to_string(*s.previous_consolidated)) : json(nullptr);
    j["progress"] = s.progress;
    j["printTimeSeconds"] = s.print_time_seconds;
    j["remainingTimeSeconds"] = s.remaining_time_seconds;
    j["layers"] = {{"current", s.current_layer}, {"total", s.total_layers}};
    j["currentFile"] = s.current_file;
    j["temperatures"] = {{"bed", temperature_json(s.bed)},
                         {"nozzle", temperature_json(s.nozzle)},
                         {"enclosure", temperature_json(s.enclosure)}};
    j["cameraAvailable"] = s.camera_available;
    j["cameraError"] = s.camera_error ? json(*s.camera_error) : json(nullptr);
    j["lastUpdate"] = s.last_update ? json(*s.last_update) : json(nullptr);
    j["customState"] = s.custom_state;
    return j;
}

PayloadEffect apply_device_payload(CanonicalStatus& status, const json& payload,
                                   const std::string& timestamp) {
    PayloadEffect effect;
    if (!payload.is_object()) {
        return effect;
    }

    status.last_update = timestamp;

    if (payload.contains("Attributes") && payload["Attributes"].is_object()) {
        std::string name = json_util::safe_string(payload["Attributes"], "Name");
        if (!name.empty()) {
            status.device_name = name;
        }
    }

    if (!payload.contains("Status") || !payload["Status"].is_object()) {
        return effect;
    }

    const json& s = payload["Status"];
    effect.had_status = true;

    ProjectedStatus projected = project_status(s);
    status.machine_state = projected.machine;
    status.machine_code = projected.machine_code;
    status.job_state = projected.job;
    status.job_code = projected.job_code;

    // Unmappable updates keep the held consolidated label
    if (projected.consolidated != StatusLabel::UNKNOWN &&
        projected.consolidated != status.consolidated) {
        effect.consolidated_changed = true;
        effect.from = status.consolidated;
        effect.to = projected.consolidated;
        status.previous_consolidated = status.consolidated;
        status.consolidated = projected.consolidated;
    }

    if (s.contains("PrintInfo") && s["PrintInfo"].is_object()) {
        const json& info = s["PrintInfo"];
        status.progress = json_util::safe_double(info, "Progress");
        status.current_file = json_util::safe_string(info, "Filename");
        status.print_time_seconds =
            static_cast<int>(std::floor(json_util::safe_double(info, "CurrentTicks")));
        double total_ticks = json_util::safe_double(info, "TotalTicks");
        status.remaining_time_seconds =
            static_cast<int>(std::floor(total_ticks - status.print_time_seconds));
        status.total_layers = json_util::safe_int(info, "TotalLayer");
        status.current_layer = json_util::safe_int(info, "CurrentLayer");
    }

    patch_temperature(s, "TempOfHotbed", status.bed.current);
    patch_temperature(s, "TempTargetHotbed", status.bed.target);
    patch_temperature(s, "TempOfNozzle", status.nozzle.current);
    patch_temperature(s, "TempTargetNozzle", status.nozzle.target);
    patch_temperature(s, "TempOfBox", status.enclosure.current);
    patch_temperature(s, "TempTargetBox", status.enclosure.target);

    bool has_filename = s.contains("PrintInfo") &&
                        !json_util::safe_string(s["PrintInfo"], "Filename").empty();
    status.custom_state = (projected.machine_code == 1 && !has_filename) ? 1 : 0;

    return effect;
}

CanonicalStatus PrinterStatusStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void PrinterStatusStore::update(const std::function<void(CanonicalStatus&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutator(status_);
}

bool PrinterStatusStore::reset_to_defaults(const std::string& timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_disconnected_default(status_)) {
        return false;
    }
    status_ = CanonicalStatus{};
    status_.last_update = timestamp;
    spdlog::debug("[PrinterStatus] Reset to disconnected defaults");
    return true;
}

bool PrinterStatusStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.connected;
}

} // namespace printcast
