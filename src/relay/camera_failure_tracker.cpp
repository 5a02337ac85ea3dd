// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "camera_failure_tracker.h"

#include <spdlog/spdlog.h>

namespace printcast {

bool CameraFailureTracker::record_failure(const std::string& message) {
    std::string msg = message.empty() ? FALLBACK_MESSAGE : message;

    if (last_error_ && *last_error_ == msg) {
        count_++;
    } else {
        last_error_ = msg;
        count_ = 1;
    }

    spdlog::debug("[CameraFailureTracker] '{}' failure streak {}/{}", msg, count_, threshold_);
    return count_ >= threshold_;
}

void CameraFailureTracker::reset() {
    last_error_.reset();
    count_ = 0;
}

} // namespace printcast
