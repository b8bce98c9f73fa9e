/**
 * @file test_frame_timer.cpp
 * @brief Unit tests for FrameTimer statistics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lumen/frame_timer.h>
#include <chrono>
#include <stdexcept>

using namespace lumen;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

TEST_CASE("FrameTimer rejects non-positive targets", "[timer]") {
    REQUIRE_THROWS_AS(FrameTimer(0.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(FrameTimer(-30.0f), std::invalid_argument);
    REQUIRE_NOTHROW(FrameTimer(90.0f));
}

TEST_CASE("FrameTimer statistics", "[timer]") {
    FrameTimer timer(60.0f);

    SECTION("no samples") {
        timer.forceStatsUpdate();
        REQUIRE(timer.stats().sampleCount == 0);
        REQUIRE_FALSE(timer.predictNextFrameTime().has_value());
    }

    SECTION("average, extremes and fps") {
        timer.recordFrame(10ms);
        timer.recordFrame(20ms);
        timer.forceStatsUpdate();

        const auto& stats = timer.stats();
        REQUIRE(stats.sampleCount == 2);
        REQUIRE_THAT(stats.averageFrameTimeMs, WithinRel(15.0f, 0.001f));
        REQUIRE_THAT(stats.minFrameTimeMs, WithinRel(10.0f, 0.001f));
        REQUIRE_THAT(stats.maxFrameTimeMs, WithinRel(20.0f, 0.001f));
        REQUIRE_THAT(stats.frameTimeDeviationMs, WithinRel(5.0f, 0.001f));
        REQUIRE_THAT(stats.fps, WithinRel(1000.0f / 15.0f, 0.001f));
    }

    SECTION("frames slower than the target count as dropped") {
        timer.recordFrame(10ms);
        timer.recordFrame(16ms);
        timer.recordFrame(25ms);
        timer.recordFrame(40ms);
        timer.forceStatsUpdate();
        REQUIRE(timer.stats().droppedFrames == 2);
    }

    SECTION("history is capped") {
        for (size_t i = 0; i < FrameTimer::HISTORY_SIZE + 30; ++i) {
            timer.recordFrame(5ms);
        }
        REQUIRE(timer.historySize() == FrameTimer::HISTORY_SIZE);
        REQUIRE(timer.frameCount() == FrameTimer::HISTORY_SIZE + 30);
        timer.forceStatsUpdate();
        REQUIRE(timer.stats().sampleCount == FrameTimer::HISTORY_SIZE);
        REQUIRE_THAT(timer.stats().frameTimeDeviationMs, WithinAbs(0.0f, 0.001f));
    }
}

TEST_CASE("FrameTimer predicts the next display time", "[timer]") {
    FrameTimer timer(50.0f);
    const auto display = FrameTimer::Clock::now() + 5ms;
    timer.recordFrame(10ms, display);

    const auto next = timer.predictNextFrameTime();
    REQUIRE(next.has_value());
    const auto delta = std::chrono::duration_cast<std::chrono::microseconds>(*next - display);
    REQUIRE(delta.count() == 20000);

    // While a frame is open the prediction follows its display time
    const auto open = display + 100ms;
    timer.beginFrame(open);
    const auto during = std::chrono::duration_cast<std::chrono::microseconds>(*timer.predictNextFrameTime() - open);
    REQUIRE(during.count() == 20000);
    timer.endFrame();
    REQUIRE(timer.frameCount() == 2);
}
