// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file mjpeg_parser.h
 * @brief Incremental multipart/x-mixed-replace reframer
 *
 * Bytes arrive in arbitrary chunks; a part may span many chunks and one
 * chunk may hold many parts. A frame is the data between the blank line
 * ending a part's headers and the next boundary delimiter, minus one
 * trailing CRLF (or LF). Consumed bytes are discarded as soon as a frame is
 * emitted so the buffer only ever holds the part in progress, and that
 * buffer is capped: a part larger than the cap is a protocol error.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace printcast {

/**
 * @brief Boundary token from a multipart Content-Type header
 *
 * Reads the value of "boundary=" up to whitespace or ';', strips quotes and
 * leading dashes. Returns "frame" when the header carries no boundary.
 */
std::string extract_boundary(const std::string& content_type);

class MjpegStreamParser {
  public:
    static constexpr size_t DEFAULT_MAX_BUFFER_BYTES = 8 * 1024 * 1024;

    enum class State { SEEKING_BOUNDARY, READING_HEADERS, READING_BODY };

    using FrameCallback = std::function<void(std::string&& frame)>;

    explicit MjpegStreamParser(const std::string& boundary,
                               size_t max_buffer_bytes = DEFAULT_MAX_BUFFER_BYTES);

    /**
     * @brief Consume one chunk, emitting every frame it completes
     * @return false on protocol error (see error()); the parser must not be fed again
     */
    bool feed(const char* data, size_t len, const FrameCallback& on_frame);

    bool feed(const std::string& chunk, const FrameCallback& on_frame) {
        return feed(chunk.data(), chunk.size(), on_frame);
    }

    void reset();

    State state() const {
        return state_;
    }
    const std::string& error() const {
        return error_;
    }
    size_t buffered_bytes() const {
        return buffer_.size();
    }
    uint64_t frames_emitted() const {
        return frames_emitted_;
    }
    const std::string& delimiter() const {
        return delimiter_;
    }

  private:
    void advance(const FrameCallback& on_frame);

    std::string delimiter_;
    size_t max_buffer_bytes_;
    std::string buffer_;
    size_t scan_offset_ = 0;
    State state_ = State::SEEKING_BOUNDARY;
    std::string error_;
    uint64_t frames_emitted_ = 0;
};

} // namespace printcast
