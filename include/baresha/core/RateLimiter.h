/**
 * @file RateLimiter.h
 * @brief Token-bucket bandwidth ceiling shared by all active transfers
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"
#include "baresha/core/SpeedCalculator.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace Baresha {

/**
 * @class RateLimiter
 * @brief Continuous-refill token bucket
 *
 * Capacity equals one second of the configured rate. Refill is computed
 * from the elapsed time since the previous call, not from fixed ticks.
 * acquire() charges the bucket immediately and returns how long the caller
 * must wait before actually moving the bytes; the balance may go negative
 * and is paid back by the refill during that wait.
 *
 * One instance is created by the owner of the ExecutionController and
 * passed to every consumer. All methods are thread-safe.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws RateLimitConfigError if @p maxBytesPerSecond is negative
    explicit RateLimiter(ByteCount maxBytesPerSecond = 0);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Throttling
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Reserve @p bytes from the bucket
     * @return How long to wait before transferring them (zero if unlimited
     *         or enough tokens were available)
     */
    SleepDuration acquire(ByteCount bytes) { return acquire(bytes, Clock::now()); }
    SleepDuration acquire(ByteCount bytes, Clock::time_point now);

    /**
     * @brief acquire() and sleep the returned duration
     *
     * Sleeps in short slices and gives up early if @p interrupted returns true.
     * @return false if the wait was interrupted
     */
    bool throttle(ByteCount bytes, const std::function<bool()>& interrupted);

    /**
     * @brief Record bytes moved by a transfer that enforces the limit itself
     */
    void account(ByteCount bytes);

    // ───────────────────────────────────────────────────────────────────────
    // Configuration
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Change the ceiling; 0 means unlimited
     *
     * Takes effect on the next acquire(). Tokens already consumed are not
     * adjusted; an overfull bucket is clamped to the new capacity.
     *
     * @throws RateLimitConfigError if @p maxBytesPerSecond is negative
     */
    void setMaxBytesPerSecond(ByteCount maxBytesPerSecond) {
        setMaxBytesPerSecond(maxBytesPerSecond, Clock::now());
    }
    void setMaxBytesPerSecond(ByteCount maxBytesPerSecond, Clock::time_point now);

    [[nodiscard]] ByteCount maxBytesPerSecond() const;
    [[nodiscard]] bool isUnlimited() const { return maxBytesPerSecond() == 0; }
    [[nodiscard]] ByteCount capacity() const { return maxBytesPerSecond(); }

    // ───────────────────────────────────────────────────────────────────────
    // Statistics
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] ByteCount totalBytesConsumed() const {
        return m_totalConsumed.load(std::memory_order_relaxed);
    }
    /// Bytes per second passed through acquire()/account() over the last few seconds
    [[nodiscard]] SpeedBps currentThroughput() const { return currentThroughput(Clock::now()); }
    [[nodiscard]] SpeedBps currentThroughput(Clock::time_point now) const {
        return m_throughput.rollingSpeed(now);
    }

private:
    void refillLocked(Clock::time_point now);
    static void validate(ByteCount maxBytesPerSecond);

    mutable std::mutex m_mutex;
    ByteCount m_rate = 0;
    double m_tokens = 0.0;
    Clock::time_point m_lastRefill;
    bool m_primed = false;

    std::atomic<ByteCount> m_totalConsumed{0};
    SpeedCalculator m_throughput;
};

} // namespace Baresha
