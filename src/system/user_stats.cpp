// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "user_stats.h"

namespace printcast {

nlohmann::json to_json(const UserStatsSnapshot& stats) {
    return {{"webClients", stats.web_clients},
            {"cameraClients", stats.camera_clients},
            {"totalWebConnections", stats.total_web_connections},
            {"totalCameraConnections", stats.total_camera_connections},
            {"uniqueWebIPs", stats.unique_web_ips},
            {"uniqueCameraIPs", stats.unique_camera_ips}};
}

void UserStats::web_connected(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.web_clients++;
    counts_.total_web_connections++;
    if (!ip.empty()) {
        web_ips_.insert(ip);
    }
    counts_.unique_web_ips = static_cast<uint32_t>(web_ips_.size());
}

void UserStats::web_disconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (counts_.web_clients > 0) {
        counts_.web_clients--;
    }
}

void UserStats::camera_connected(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.camera_clients++;
    counts_.total_camera_connections++;
    if (!ip.empty()) {
        camera_ips_.insert(ip);
    }
    counts_.unique_camera_ips = static_cast<uint32_t>(camera_ips_.size());
}

void UserStats::camera_disconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (counts_.camera_clients > 0) {
        counts_.camera_clients--;
    }
}

UserStatsSnapshot UserStats::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

} // namespace printcast
