#pragma once

/**
 * @file frame_timer.h
 * @brief CPU frame time history and statistics
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace lumen {

struct FrameTimingStats {
    float averageFrameTimeMs = 0.0f;
    float fps = 0.0f;
    float frameTimeDeviationMs = 0.0f;  ///< Standard deviation
    float maxFrameTimeMs = 0.0f;
    float minFrameTimeMs = 0.0f;
    uint32_t droppedFrames = 0;  ///< Frames slower than the target
    uint32_t sampleCount = 0;
};

class FrameTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;

    static constexpr size_t HISTORY_SIZE = 120;

    explicit FrameTimer(float targetFps);

    /// @name Measurement
    /// @{
    /// `predictedDisplay` is the time the frame is expected to reach the display
    void beginFrame(Clock::time_point predictedDisplay = Clock::now());
    void endFrame();

    /// Record a frame of known duration (no clock involved)
    void recordFrame(Duration frameTime, Clock::time_point predictedDisplay = {});
    /// @}

    /// Statistics refreshed at most once per second by endFrame()
    const FrameTimingStats& stats() const { return m_stats; }
    void forceStatsUpdate();

    /// Display time of the next frame, one target interval after the latest one
    std::optional<Clock::time_point> predictNextFrameTime() const;

    uint64_t frameCount() const { return m_frameCount; }
    Duration targetFrameTime() const { return m_target; }
    size_t historySize() const { return m_history.size(); }

private:
    struct Sample {
        Duration frameTime{0.0};
        Clock::time_point predictedDisplay;
    };

    void push(const Sample& sample);
    void updateStats();

    Duration m_target;
    std::deque<Sample> m_history;
    std::optional<Clock::time_point> m_frameStart;
    Clock::time_point m_currentDisplay;
    Clock::time_point m_lastStatsUpdate;
    FrameTimingStats m_stats;
    uint64_t m_frameCount = 0;
};

} // namespace lumen
