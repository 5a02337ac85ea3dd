// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sdcp_protocol.h"

#include "device_client.h"
#include "json_utils.h"

#include <random>

using json = nlohmann::json;

namespace printcast::sdcp {

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    std::string id(32, '0');
    uint64_t bits = 0;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i % 16 == 0) {
            bits = rng();
        }
        id[i] = hex[bits & 0xF];
        bits >>= 4;
    }
    return id;
}

json build_request(int cmd, const json& data, const std::string& request_id,
                   const std::string& mainboard_id, int64_t timestamp_s) {
    json msg;
    msg["Id"] = request_id;
    msg["Data"] = {{"Cmd", cmd},
                   {"Data", data.is_null() ? json::object() : data},
                   {"RequestID", request_id},
                   {"MainboardID", mainboard_id},
                   {"TimeStamp", timestamp_s},
                   {"From", FROM_CLIENT}};
    msg["Topic"] = "sdcp/request/" + mainboard_id;
    return msg;
}

MessageKind classify(const json& msg) {
    if (!msg.is_object()) {
        return MessageKind::OTHER;
    }
    if (!response_request_id(msg).empty()) {
        return MessageKind::RESPONSE;
    }
    if (msg.contains("Status") || msg.contains("Attributes")) {
        return MessageKind::STATUS;
    }
    return MessageKind::OTHER;
}

std::string response_request_id(const json& msg) {
    if (!msg.is_object() || !msg.contains("Data") || !msg["Data"].is_object()) {
        return "";
    }
    return json_util::safe_string(msg["Data"], "RequestID");
}

std::string find_mainboard_id(const json& msg) {
    if (!msg.is_object()) {
        return "";
    }
    std::string id = json_util::safe_string(msg, "MainboardID");
    if (id.empty() && msg.contains("Data") && msg["Data"].is_object()) {
        id = json_util::safe_string(msg["Data"], "MainboardID");
    }
    if (id.empty() && msg.contains("Attributes") && msg["Attributes"].is_object()) {
        id = json_util::safe_string(msg["Attributes"], "MainboardID");
    }
    return id;
}

int response_ack(const json& msg) {
    if (!msg.is_object() || !msg.contains("Data") || !msg["Data"].is_object()) {
        return 0;
    }
    const json& data = msg["Data"];
    if (!data.contains("Data") || !data["Data"].is_object()) {
        return 0;
    }
    return json_util::safe_int(data["Data"], "Ack");
}

std::string camera_ack_reason(int ack) {
    switch (ack) {
    case 1:
        return "Exceeded maximum simultaneous streaming limit";
    case 2:
        return "Camera does not exist";
    case 3:
        return "Unknown error";
    default:
        return "Unknown error code " + std::to_string(ack);
    }
}

std::string websocket_url(const std::string& address) {
    return "ws://" + address + ":" + std::to_string(SDCP_WEBSOCKET_PORT) + "/websocket";
}

} // namespace printcast::sdcp
