// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mjpeg_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace printcast {

namespace {

constexpr const char* HEADER_TERMINATOR = "\r\n\r\n";
constexpr size_t HEADER_TERMINATOR_LEN = 4;

} // namespace

std::string extract_boundary(const std::string& content_type) {
    static const std::string key = "boundary=";

    std::string lower = content_type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t pos = lower.find(key);
    if (pos == std::string::npos) {
        return "frame";
    }

    size_t start = pos + key.size();
    size_t end = start;
    while (end < content_type.size() && content_type[end] != ';' &&
           !std::isspace(static_cast<unsigned char>(content_type[end]))) {
        ++end;
    }

    std::string token = content_type.substr(start, end - start);
    token.erase(std::remove(token.begin(), token.end(), '"'), token.end());
    size_t first = token.find_first_not_of('-');
    token = (first == std::string::npos) ? std::string() : token.substr(first);

    return token.empty() ? "frame" : token;
}

MjpegStreamParser::MjpegStreamParser(const std::string& boundary, size_t max_buffer_bytes)
    : delimiter_("--" + boundary), max_buffer_bytes_(max_buffer_bytes) {}

void MjpegStreamParser::reset() {
    buffer_.clear();
    scan_offset_ = 0;
    state_ = State::SEEKING_BOUNDARY;
    error_.clear();
}

bool MjpegStreamParser::feed(const char* data, size_t len, const FrameCallback& on_frame) {
    if (!error_.empty()) {
        return false;
    }

    buffer_.append(data, len);
    advance(on_frame);

    if (buffer_.size() > max_buffer_bytes_) {
        error_ = "Stream buffer exceeded " + std::to_string(max_buffer_bytes_) +
                 " bytes without a complete frame";
        spdlog::warn("[MjpegParser] {}", error_);
        buffer_.clear();
        return false;
    }
    return true;
}

void MjpegStreamParser::advance(const FrameCallback& on_frame) {
    for (;;) {
        switch (state_) {
        case State::SEEKING_BOUNDARY: {
            size_t pos = buffer_.find(delimiter_);
            if (pos == std::string::npos) {
                // Keep a tail that could be the start of a split delimiter
                size_t keep = std::min(buffer_.size(), delimiter_.size() - 1);
                buffer_.erase(0, buffer_.size() - keep);
                return;
            }
            buffer_.erase(0, pos + delimiter_.size());
            scan_offset_ = 0;
            state_ = State::READING_HEADERS;
            break;
        }

        case State::READING_HEADERS: {
            size_t pos = buffer_.find(HEADER_TERMINATOR, scan_offset_);
            if (pos == std::string::npos) {
                scan_offset_ = buffer_.size() >= HEADER_TERMINATOR_LEN
                                   ? buffer_.size() - (HEADER_TERMINATOR_LEN - 1)
                                   : 0;
                return;
            }
            buffer_.erase(0, pos + HEADER_TERMINATOR_LEN);
            scan_offset_ = 0;
            state_ = State::READING_BODY;
            break;
        }

        case State::READING_BODY: {
            size_t pos = buffer_.find(delimiter_, scan_offset_);
            if (pos == std::string::npos) {
                scan_offset_ = buffer_.size() >= delimiter_.size()
                                   ? buffer_.size() - (delimiter_.size() - 1)
                                   : 0;
                return;
            }

            size_t frame_end = pos;
            if (frame_end >= 2 && buffer_[frame_end - 2] == '\r' && buffer_[frame_end - 1] == '\n') {
                frame_end -= 2;
            } else if (frame_end >= 1 && buffer_[frame_end - 1] == '\n') {
                frame_end -= 1;
            }

            if (frame_end > 0) {
                ++frames_emitted_;
                on_frame(buffer_.substr(0, frame_end));
            }

            // Leave the delimiter in place for SEEKING_BOUNDARY
            buffer_.erase(0, pos);
            scan_offset_ = 0;
            state_ = State::SEEKING_BOUNDARY;
            break;
        }
        }
    }
}

} // namespace printcast
