// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <string>

#include "hv/json.hpp"

namespace printcast {

struct UserStatsSnapshot {
    uint32_t web_clients = 0;
    uint32_t camera_clients = 0;
    uint64_t total_web_connections = 0;
    uint64_t total_camera_connections = 0;
    uint32_t unique_web_ips = 0;
    uint32_t unique_camera_ips = 0;
};

nlohmann::json to_json(const UserStatsSnapshot& stats);

/**
 * @brief Live and cumulative observer counters
 *
 * Live counts follow attach/detach of status and camera subscribers. Totals
 * and unique-IP counts only grow for the lifetime of the process.
 *
 * @threading All methods are safe from any thread.
 */
class UserStats {
  public:
    void web_connected(const std::string& ip);
    void web_disconnected();
    void camera_connected(const std::string& ip);
    void camera_disconnected();

    UserStatsSnapshot snapshot() const;

  private:
    mutable std::mutex mutex_;
    UserStatsSnapshot counts_;
    std::set<std::string> web_ips_;
    std::set<std::string> camera_ips_;
};

} // namespace printcast
