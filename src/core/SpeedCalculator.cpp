/**
 * @file SpeedCalculator.cpp
 * @brief Speed calculation and ETA estimation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/SpeedCalculator.h"

#include <algorithm>

namespace Baresha {

namespace {
    // Floor for the measurement span so the first chunk doesn't read as infinite speed
    constexpr std::chrono::milliseconds MIN_SPAN{100};
}

SpeedCalculator::SpeedCalculator(Duration window, double alpha)
    : m_window(window)
    , m_alpha(alpha)
{
}

void SpeedCalculator::addBytes(ByteCount bytes, Clock::time_point now) {
    std::lock_guard lock(m_mutex);

    if (!m_started) {
        m_started = true;
        m_startTime = now;
    }

    m_samples.push_back({now, bytes});
    m_totalBytes += bytes;
    pruneLocked(now);

    const SpeedBps rolling = rollingSpeedLocked(now);
    if (m_samples.size() == 1 && m_emaSpeed == 0.0) {
        m_emaSpeed = rolling;
    } else {
        m_emaSpeed = m_alpha * rolling + (1.0 - m_alpha) * m_emaSpeed;
    }
}

SpeedBps SpeedCalculator::rollingSpeed(Clock::time_point now) const {
    std::lock_guard lock(m_mutex);
    pruneLocked(now);
    return rollingSpeedLocked(now);
}

SpeedBps SpeedCalculator::smoothedSpeed() const {
    std::lock_guard lock(m_mutex);
    return m_emaSpeed;
}

Duration SpeedCalculator::estimateRemaining(ByteCount remainingBytes) const {
    const SpeedBps speed = smoothedSpeed();
    if (speed <= 0 || remainingBytes <= 0) {
        return Duration{-1};  // Unknown
    }
    const double seconds = static_cast<double>(remainingBytes) / speed;
    return Duration{static_cast<int64_t>(seconds * 1000)};
}

ByteCount SpeedCalculator::totalBytes() const {
    std::lock_guard lock(m_mutex);
    return m_totalBytes;
}

void SpeedCalculator::reset() {
    std::lock_guard lock(m_mutex);
    m_samples.clear();
    m_started = false;
    m_totalBytes = 0;
    m_emaSpeed = 0.0;
}

void SpeedCalculator::pruneLocked(Clock::time_point now) const {
    while (!m_samples.empty() && now - m_samples.front().timestamp > m_window) {
        m_samples.pop_front();
    }
}

SpeedBps SpeedCalculator::rollingSpeedLocked(Clock::time_point now) const {
    if (!m_started || m_samples.empty()) {
        return 0.0;
    }

    ByteCount windowBytes = 0;
    for (const auto& sample : m_samples) {
        windowBytes += sample.bytes;
    }

    auto span = std::min<Clock::duration>(now - m_startTime, m_window);
    span = std::max<Clock::duration>(span, MIN_SPAN);

    const double seconds = std::chrono::duration<double>(span).count();
    return static_cast<double>(windowBytes) / seconds;
}

} // namespace Baresha
