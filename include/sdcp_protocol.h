// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file sdcp_protocol.h
 * @brief SDCP message framing helpers
 *
 * SDCP requests wrap a command in a Data envelope addressed by MainboardID:
 *
 *   {"Id": "...", "Topic": "sdcp/request/<MainboardID>",
 *    "Data": {"Cmd": 386, "Data": {...}, "RequestID": "...",
 *             "MainboardID": "...", "TimeStamp": 1700000000, "From": 0}}
 *
 * Responses echo RequestID inside Data; the command result sits in Data.Data
 * with an "Ack" code. Unsolicited messages carry a top-level "Status" or
 * "Attributes" object.
 */

#pragma once

#include <cstdint>
#include <string>

#include "hv/json.hpp"

namespace printcast::sdcp {

/// Client identity reported in requests
constexpr int FROM_CLIENT = 0;

enum class MessageKind {
    RESPONSE, ///< Data.RequestID present
    STATUS,   ///< Top-level Status and/or Attributes
    OTHER
};

/// 32 lowercase hex characters (a UUID without dashes)
std::string generate_request_id();

nlohmann::json build_request(int cmd, const nlohmann::json& data, const std::string& request_id,
                             const std::string& mainboard_id, int64_t timestamp_s);

MessageKind classify(const nlohmann::json& msg);

/// Data.RequestID of a response, or "" when absent
std::string response_request_id(const nlohmann::json& msg);

/// MainboardID from a response envelope, status message or attributes block
std::string find_mainboard_id(const nlohmann::json& msg);

/// Ack code of a response (Data.Data.Ack); 0 when absent
int response_ack(const nlohmann::json& msg);

/// Human-readable reason for a non-zero camera stream Ack
std::string camera_ack_reason(int ack);

std::string websocket_url(const std::string& address);

} // namespace printcast::sdcp
