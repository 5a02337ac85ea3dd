// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace printcast {

/**
 * @brief Counts consecutive identical camera startup failures
 *
 * Only a streak of the same message counts toward the threshold; a different
 * message restarts the streak at 1. Success clears it.
 */
class CameraFailureTracker {
  public:
    static constexpr const char* FALLBACK_MESSAGE = "Unknown camera error";

    explicit CameraFailureTracker(uint32_t threshold = 3) : threshold_(threshold) {}

    /**
     * @brief Record a failure
     * @return true when the streak has reached the threshold (fatal)
     */
    bool record_failure(const std::string& message);

    void reset();

    uint32_t consecutive_count() const {
        return count_;
    }
    const std::optional<std::string>& last_error() const {
        return last_error_;
    }
    uint32_t threshold() const {
        return threshold_;
    }

  private:
    uint32_t threshold_;
    std::optional<std::string> last_error_;
    uint32_t count_ = 0;
};

} // namespace printcast
