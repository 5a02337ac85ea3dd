// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_status.h"
#include "user_stats.h"

#include <string>

#include "hv/json.hpp"

namespace printcast {

/// {"printer": CanonicalStatus, "users": UserStats} as served by GET /api/status
nlohmann::json make_status_payload(const CanonicalStatus& status, const UserStatsSnapshot& users);

/// Push-channel frame {"type":"status","data":{printer, users}}
std::string make_status_message(const CanonicalStatus& status, const UserStatsSnapshot& users);

/// Push-channel frame {"type":"server_restarting","data":{"reason": ...}}
std::string make_restart_message(const std::string& reason);

} // namespace printcast
