// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "status_messages.h"

using json = nlohmann::json;

namespace printcast {

json make_status_payload(const CanonicalStatus& status, const UserStatsSnapshot& users) {
    return {{"printer", to_json(status)}, {"users", to_json(users)}};
}

std::string make_status_message(const CanonicalStatus& status, const UserStatsSnapshot& users) {
    json msg = {{"type", "status"}, {"data", make_status_payload(status, users)}};
    return msg.dump();
}

std::string make_restart_message(const std::string& reason) {
    json msg = {{"type", "server_restarting"}, {"data", {{"reason", reason}}}};
    return msg.dump();
}

} // namespace printcast
