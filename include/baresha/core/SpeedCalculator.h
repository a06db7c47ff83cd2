/**
 * @file SpeedCalculator.h
 * @brief Smoothed speed and ETA calculation for transfers
 *
 * Implements a rolling window average for speed calculation to provide
 * stable readings that don't fluctuate wildly between chunks.
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <chrono>
#include <deque>
#include <mutex>

namespace Baresha {

/**
 * @class SpeedCalculator
 * @brief Rolling-window speed with exponential smoothing
 *
 * Thread-safe. Every method has an overload taking the current time so
 * callers (and tests) can drive it from their own clock.
 */
class SpeedCalculator {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedCalculator(Duration window = Constants::SPEED_SMOOTHING_WINDOW,
                             double alpha = Constants::SPEED_SMOOTHING_FACTOR);

    SpeedCalculator(const SpeedCalculator&) = delete;
    SpeedCalculator& operator=(const SpeedCalculator&) = delete;

    /**
     * @brief Record bytes transferred since the previous call
     */
    void addBytes(ByteCount bytes) { addBytes(bytes, Clock::now()); }
    void addBytes(ByteCount bytes, Clock::time_point now);

    /// @return Bytes/second over the rolling window
    [[nodiscard]] SpeedBps rollingSpeed() const { return rollingSpeed(Clock::now()); }
    [[nodiscard]] SpeedBps rollingSpeed(Clock::time_point now) const;

    /// @return Exponentially smoothed speed, updated on each addBytes()
    [[nodiscard]] SpeedBps smoothedSpeed() const;

    /**
     * @brief Estimate time remaining
     * @return Estimated duration, or Duration{-1} if unknown
     */
    [[nodiscard]] Duration estimateRemaining(ByteCount remainingBytes) const;

    [[nodiscard]] ByteCount totalBytes() const;

    void reset();

private:
    struct Sample {
        Clock::time_point timestamp;
        ByteCount bytes;
    };

    void pruneLocked(Clock::time_point now) const;
    SpeedBps rollingSpeedLocked(Clock::time_point now) const;

    mutable std::mutex m_mutex;
    mutable std::deque<Sample> m_samples;

    Duration m_window;
    double m_alpha;

    bool m_started = false;
    Clock::time_point m_startTime;
    ByteCount m_totalBytes = 0;
    SpeedBps m_emaSpeed = 0.0;
};

} // namespace Baresha
