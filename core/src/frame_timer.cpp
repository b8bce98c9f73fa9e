// Lumen - Frame timing

#include <lumen/frame_timer.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lumen {

FrameTimer::FrameTimer(float targetFps)
    : m_lastStatsUpdate(Clock::now()) {
    if (targetFps <= 0.0f) {
        throw std::invalid_argument("target fps must be positive");
    }
    m_target = Duration(1.0 / targetFps);
}

void FrameTimer::beginFrame(Clock::time_point predictedDisplay) {
    m_frameStart = Clock::now();
    m_currentDisplay = predictedDisplay;
}

void FrameTimer::endFrame() {
    if (!m_frameStart) return;
    push({Clock::now() - *m_frameStart, m_currentDisplay});
    m_frameStart.reset();

    if (Clock::now() - m_lastStatsUpdate >= std::chrono::seconds(1)) {
        updateStats();
    }
}

void FrameTimer::recordFrame(Duration frameTime, Clock::time_point predictedDisplay) {
    push({frameTime, predictedDisplay});
}

void FrameTimer::push(const Sample& sample) {
    if (m_history.size() >= HISTORY_SIZE) {
        m_history.pop_front();
    }
    m_history.push_back(sample);
    ++m_frameCount;
}

void FrameTimer::forceStatsUpdate() {
    updateStats();
}

void FrameTimer::updateStats() {
    m_lastStatsUpdate = Clock::now();
    if (m_history.empty()) return;

    double total = 0.0;
    double maxTime = 0.0;
    double minTime = m_history.front().frameTime.count();
    uint32_t dropped = 0;
    for (const auto& s : m_history) {
        const double t = s.frameTime.count();
        total += t;
        maxTime = std::max(maxTime, t);
        minTime = std::min(minTime, t);
        if (s.frameTime > m_target) ++dropped;
    }

    const double n = static_cast<double>(m_history.size());
    const double average = total / n;
    double variance = 0.0;
    for (const auto& s : m_history) {
        const double d = s.frameTime.count() - average;
        variance += d * d;
    }
    variance /= n;

    m_stats.averageFrameTimeMs = static_cast<float>(average * 1000.0);
    m_stats.fps = average > 0.0 ? static_cast<float>(1.0 / average) : 0.0f;
    m_stats.frameTimeDeviationMs = static_cast<float>(std::sqrt(variance) * 1000.0);
    m_stats.maxFrameTimeMs = static_cast<float>(maxTime * 1000.0);
    m_stats.minFrameTimeMs = static_cast<float>(minTime * 1000.0);
    m_stats.droppedFrames = dropped;
    m_stats.sampleCount = static_cast<uint32_t>(m_history.size());
}

std::optional<FrameTimer::Clock::time_point> FrameTimer::predictNextFrameTime() const {
    const auto step = std::chrono::duration_cast<Clock::duration>(m_target);
    if (m_frameStart) return m_currentDisplay + step;
    if (m_history.empty()) return std::nullopt;
    return m_history.back().predictedDisplay + step;
}

} // namespace lumen
