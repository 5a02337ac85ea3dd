// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_relay.h"

#include "../mocks/manual_scheduler.h"
#include "../mocks/mock_media_source.h"
#include "../mocks/recording_sinks.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace printcast;

namespace {

const std::string CAMERA_URL = "http://10.0.0.5:3031/video";

struct CameraStatusEvent {
    bool available;
    std::optional<std::string> error;
};

struct RelayFixture {
    ManualScheduler sched;
    MockMediaSource source;
    MediaRelayConfig config;
    MediaRelay relay;

    std::vector<CameraStatusEvent> camera_events;
    std::vector<std::string> fatal_reasons;

    static MediaRelayConfig make_config(uint32_t max_fps) {
        MediaRelayConfig c;
        c.max_fps = max_fps;
        c.retry_delay_ms = 5000;
        c.stall_timeout_ms = 10000;
        c.failure_threshold = 3;
        return c;
    }

    // Default 10 fps: 100ms between frames
    explicit RelayFixture(uint32_t max_fps = 10)
        : config(make_config(max_fps)), relay(sched, source, config) {
        relay.set_camera_status_callback(
            [this](bool available, const std::optional<std::string>& error) {
                camera_events.push_back({available, error});
            });
        relay.set_fatal_callback([this](const std::string& reason) {
            fatal_reasons.push_back(reason);
        });
    }

    /// start() and answer the fetch with a 200 MJPEG response
    void start_streaming() {
        relay.start(CAMERA_URL);
        source.respond(200);
        sched.run_posted();
    }

    void push_frame(const std::string& data) {
        source.push_frame(data);
        // Delimiter of the next part completes this one
        source.push("--frame\r\n");
        sched.run_posted();
    }

    void fail_fetch(int status) {
        source.respond(status);
        sched.run_posted();
    }

    std::shared_ptr<RecordingFrameSink> subscribe() {
        auto sink = std::make_shared<RecordingFrameSink>();
        relay.add_subscriber(sink, ClientIdentity{"10.0.0.20", "test"});
        return sink;
    }
};

} // namespace

// ============================================================================
// Rate limiter
// ============================================================================

TEST_CASE("FrameRateLimiter: minimum interval", "[media_relay]") {
    FrameRateLimiter limiter(15);

    // 1000/15 = 66.7ms
    REQUIRE(limiter.accept(0));
    REQUIRE_FALSE(limiter.accept(66));
    REQUIRE(limiter.accept(67));
    REQUIRE_FALSE(limiter.accept(133));
    REQUIRE(limiter.accept(134));

    limiter.reset();
    REQUIRE(limiter.accept(135));
}

TEST_CASE("FrameRateLimiter: zero disables the limit", "[media_relay]") {
    FrameRateLimiter limiter(0);
    REQUIRE(limiter.accept(5));
    REQUIRE(limiter.accept(5));
}

TEST_CASE("FrameRateLimiter: no 1s window exceeds max_fps + 1 frames", "[media_relay]") {
    for (uint32_t max_fps : {1u, 7u, 15u, 30u, 59u, 60u}) {
        CAPTURE(max_fps);
        FrameRateLimiter limiter(max_fps);

        // 1ms input spacing for three seconds
        std::vector<uint64_t> accepted;
        for (uint64_t t = 0; t < 3000; ++t) {
            if (limiter.accept(t)) {
                accepted.push_back(t);
            }
        }

        for (size_t i = 0; i < accepted.size(); ++i) {
            size_t in_window = 0;
            for (size_t j = i; j < accepted.size() && accepted[j] < accepted[i] + 1000; ++j) {
                ++in_window;
            }
            REQUIRE(in_window <= max_fps + 1);
        }
        REQUIRE(accepted.size() >= 3 * max_fps - 3);
    }
}

// ============================================================================
// Startup
// ============================================================================

TEST_CASE("MediaRelay: start opens the upstream stream", "[media_relay]") {
    RelayFixture f;
    REQUIRE(f.relay.state() == RelayState::IDLE);

    f.relay.start(CAMERA_URL);
    REQUIRE(f.relay.state() == RelayState::FETCHING);
    REQUIRE(f.source.open_calls() == 1);
    REQUIRE(f.source.urls[0] == CAMERA_URL);

    f.source.respond(200);
    REQUIRE(f.relay.state() == RelayState::FETCHING); // not yet on the loop
    f.sched.run_posted();

    REQUIRE(f.relay.state() == RelayState::STREAMING);
    REQUIRE(f.camera_events.size() == 1);
    REQUIRE(f.camera_events[0].available);
    REQUIRE_FALSE(f.camera_events[0].error.has_value());
}

TEST_CASE("MediaRelay: frames fan out to every subscriber", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    auto a = f.subscribe();
    auto b = f.subscribe();

    f.push_frame("jpeg-1");

    REQUIRE(a->frames == std::vector<std::string>{"jpeg-1"});
    REQUIRE(b->frames == std::vector<std::string>{"jpeg-1"});
    REQUIRE(f.relay.latest_frame());
    REQUIRE(f.relay.latest_frame()->data == "jpeg-1");
    REQUIRE(f.relay.latest_frame()->content_type == "image/jpeg");
}

TEST_CASE("MediaRelay: throttle caps frames per second", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    auto sink = f.subscribe();

    // 100 frames over one second from a fast source
    for (int i = 0; i < 100; ++i) {
        f.push_frame("jpeg-" + std::to_string(i));
        f.sched.advance(10);
    }

    REQUIRE(sink->frames.size() <= f.config.max_fps + 1);
    REQUIRE(sink->frames.size() >= f.config.max_fps);
    REQUIRE(sink->frames[0] == "jpeg-0");
}

TEST_CASE("MediaRelay: throttle holds at the highest frame rates", "[media_relay]") {
    for (uint32_t max_fps : {59u, 60u}) {
        CAPTURE(max_fps);
        RelayFixture f(max_fps);
        f.start_streaming();
        auto sink = f.subscribe();

        for (int i = 0; i < 1000; ++i) {
            f.push_frame("jpeg");
            f.sched.advance(1);
        }

        REQUIRE(sink->frames.size() <= max_fps + 1);
        REQUIRE(sink->frames.size() >= max_fps - 2);
    }
}

TEST_CASE("MediaRelay: late subscriber gets the cached frame first", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    f.push_frame("jpeg-A");

    auto late = f.subscribe();
    REQUIRE(late->frames == std::vector<std::string>{"jpeg-A"});

    f.sched.advance(100);
    f.push_frame("jpeg-B");
    REQUIRE(late->frames == std::vector<std::string>{"jpeg-A", "jpeg-B"});
}

TEST_CASE("MediaRelay: subscriber before any frame gets nothing until one arrives",
          "[media_relay]") {
    RelayFixture f;
    auto early = f.subscribe();
    REQUIRE(early->attempts == 0);
    REQUIRE(f.relay.subscriber_count() == 1);
}

TEST_CASE("MediaRelay: failing subscriber is dropped", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    auto good = f.subscribe();
    auto bad = f.subscribe();
    bad->fail = true;

    f.push_frame("jpeg-1");
    REQUIRE(f.relay.subscriber_count() == 1);

    f.sched.advance(100);
    f.push_frame("jpeg-2");
    REQUIRE(bad->attempts == 1);
    REQUIRE(good->frames.size() == 2);
}

TEST_CASE("MediaRelay: failing replay detaches the new subscriber", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    f.push_frame("jpeg-1");

    auto sink = std::make_shared<RecordingFrameSink>();
    sink->fail = true;
    f.relay.add_subscriber(sink, ClientIdentity{});
    REQUIRE(f.relay.subscriber_count() == 0);
}

TEST_CASE("MediaRelay: remove_subscriber", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    auto sink = std::make_shared<RecordingFrameSink>();
    SubscriberId id = f.relay.add_subscriber(sink, ClientIdentity{});

    REQUIRE(f.relay.remove_subscriber(id));
    REQUIRE_FALSE(f.relay.remove_subscriber(id));

    f.push_frame("jpeg-1");
    REQUIRE(sink->attempts == 0);
}

// ============================================================================
// Failures and retry
// ============================================================================

TEST_CASE("MediaRelay: HTTP error schedules a retry", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);
    f.fail_fetch(404);

    REQUIRE(f.relay.state() == RelayState::RETRY_SCHEDULED);
    REQUIRE(f.camera_events.size() == 1);
    REQUIRE_FALSE(f.camera_events[0].available);
    REQUIRE(f.camera_events[0].error == "Camera error 404");
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 1);

    f.sched.advance(4999);
    REQUIRE(f.source.open_calls() == 1);

    f.sched.advance(1);
    REQUIRE(f.relay.state() == RelayState::FETCHING);
    REQUIRE(f.source.open_calls() == 2);
    REQUIRE(f.source.urls[1] == CAMERA_URL);
}

TEST_CASE("MediaRelay: clean end of stream is a failure", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    f.source.close();
    f.sched.run_posted();

    REQUIRE(f.relay.state() == RelayState::RETRY_SCHEDULED);
    REQUIRE(f.camera_events.back().error == "Camera stream ended");
}

TEST_CASE("MediaRelay: transport error text is the failure reason", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);
    f.source.close("Connection refused");
    f.sched.run_posted();

    REQUIRE(f.relay.state() == RelayState::RETRY_SCHEDULED);
    REQUIRE(f.camera_events.back().error == "Connection refused");
}

TEST_CASE("MediaRelay: stalled stream fails after the timeout", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();

    f.sched.advance(9000);
    REQUIRE(f.relay.state() == RelayState::STREAMING);

    f.sched.advance(1000);
    REQUIRE(f.relay.state() == RelayState::RETRY_SCHEDULED);
    REQUIRE(f.camera_events.back().error == "Camera stream stalled");
}

TEST_CASE("MediaRelay: steady data keeps the stall watchdog quiet", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();

    for (int i = 0; i < 30; ++i) {
        f.push_frame("jpeg");
        f.sched.advance(1000);
    }
    REQUIRE(f.relay.state() == RelayState::STREAMING);
}

TEST_CASE("MediaRelay: framing error fails the stream", "[media_relay]") {
    RelayFixture f;
    f.config.max_buffer_bytes = 64;
    MediaRelay relay(f.sched, f.source, f.config);
    std::optional<std::string> reason;
    relay.set_camera_status_callback(
        [&reason](bool, const std::optional<std::string>& error) { reason = error; });

    relay.start(CAMERA_URL);
    f.source.respond(200);
    f.sched.run_posted();

    f.source.push("--frame\r\n\r\n" + std::string(200, 'x'));
    f.sched.run_posted();

    REQUIRE(relay.state() == RelayState::RETRY_SCHEDULED);
    REQUIRE(reason.has_value());
    REQUIRE(reason->find("Camera stream protocol error") == 0);
}

TEST_CASE("MediaRelay: callbacks from a superseded fetch are ignored", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);
    MediaSourceCallbacks stale = f.source.fetches.back();

    f.relay.start("http://10.0.0.6:3031/video");
    REQUIRE(f.source.open_calls() == 2);

    stale.on_open(500, "text/plain");
    stale.on_close("late error");
    f.sched.run_posted();

    REQUIRE(f.relay.state() == RelayState::FETCHING);
    REQUIRE(f.camera_events.empty());
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 0);
}

TEST_CASE("MediaRelay: successful open clears the failure streak", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);
    f.fail_fetch(404);
    f.sched.advance(5000);
    f.fail_fetch(404);
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 2);

    f.sched.advance(5000);
    f.source.respond(200);
    f.sched.run_posted();
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 0);

    f.source.close();
    f.sched.run_posted();
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 1);
    REQUIRE(f.fatal_reasons.empty());
}

// ============================================================================
// Fatal restart
// ============================================================================

TEST_CASE("MediaRelay: identical failures reach FATAL_RESTART", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);

    f.fail_fetch(404);
    f.sched.advance(5000);
    f.fail_fetch(404);
    f.sched.advance(5000);
    REQUIRE(f.fatal_reasons.empty());
    f.fail_fetch(404);

    REQUIRE(f.relay.state() == RelayState::FATAL_RESTART);
    REQUIRE(f.fatal_reasons == std::vector<std::string>{"Camera error 404"});
    REQUIRE(f.camera_events.back().error == "Camera error 404");

    SECTION("no further retries") {
        f.sched.advance(60000);
        REQUIRE(f.source.open_calls() == 3);
    }

    SECTION("start and stop are ignored") {
        f.relay.start(CAMERA_URL);
        f.relay.stop();
        REQUIRE(f.relay.state() == RelayState::FATAL_RESTART);
        REQUIRE(f.source.open_calls() == 3);
        REQUIRE(f.fatal_reasons.size() == 1);
    }
}

TEST_CASE("MediaRelay: differing failures never go fatal", "[media_relay]") {
    RelayFixture f;
    f.relay.start(CAMERA_URL);

    for (int status : {404, 500, 404, 500, 404}) {
        f.fail_fetch(status);
        f.sched.advance(5000);
    }

    REQUIRE(f.fatal_reasons.empty());
    REQUIRE(f.relay.state() == RelayState::FETCHING);
    REQUIRE(f.source.open_calls() == 6);
}

// ============================================================================
// Stop
// ============================================================================

TEST_CASE("MediaRelay: stop returns to IDLE and keeps subscribers", "[media_relay]") {
    RelayFixture f;
    f.start_streaming();
    auto sink = f.subscribe();
    f.source.close("boom");
    f.sched.run_posted();
    REQUIRE(f.relay.state() == RelayState::RETRY_SCHEDULED);

    f.relay.stop();
    REQUIRE(f.relay.state() == RelayState::IDLE);
    REQUIRE(f.relay.url().empty());
    REQUIRE(f.relay.failure_tracker().consecutive_count() == 0);
    REQUIRE(f.relay.subscriber_count() == 1);
    REQUIRE_FALSE(f.source.active);

    // Pending retry was cancelled
    f.sched.advance(10000);
    REQUIRE(f.source.open_calls() == 1);
}
