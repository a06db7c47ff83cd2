/**
 * @file RateLimiter.cpp
 * @brief Token-bucket implementation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/RateLimiter.h"
#include "baresha/core/Errors.h"

#include <algorithm>
#include <thread>

#include <QDebug>

namespace Baresha {

RateLimiter::RateLimiter(ByteCount maxBytesPerSecond) {
    validate(maxBytesPerSecond);
    m_rate = maxBytesPerSecond;
    m_tokens = static_cast<double>(maxBytesPerSecond);
}

void RateLimiter::validate(ByteCount maxBytesPerSecond) {
    if (maxBytesPerSecond < 0) {
        throw RateLimitConfigError(QStringLiteral("Speed limit must not be negative (got %1)")
                                       .arg(maxBytesPerSecond));
    }
}

void RateLimiter::refillLocked(Clock::time_point now) {
    if (!m_primed) {
        m_primed = true;
        m_lastRefill = now;
        return;
    }
    if (now <= m_lastRefill) {
        return;
    }

    const double elapsed = std::chrono::duration<double>(now - m_lastRefill).count();
    m_lastRefill = now;
    if (m_rate > 0) {
        m_tokens = std::min(static_cast<double>(m_rate), m_tokens + elapsed * m_rate);
    }
}

SleepDuration RateLimiter::acquire(ByteCount bytes, Clock::time_point now) {
    if (bytes <= 0) {
        return SleepDuration::zero();
    }

    m_totalConsumed.fetch_add(bytes, std::memory_order_relaxed);
    m_throughput.addBytes(bytes, now);

    std::lock_guard lock(m_mutex);
    refillLocked(now);

    if (m_rate == 0) {
        return SleepDuration::zero();
    }

    m_tokens -= static_cast<double>(bytes);
    if (m_tokens >= 0.0) {
        return SleepDuration::zero();
    }

    const double seconds = -m_tokens / static_cast<double>(m_rate);
    return SleepDuration{static_cast<int64_t>(seconds * 1'000'000.0 + 0.5)};
}

bool RateLimiter::throttle(ByteCount bytes, const std::function<bool()>& interrupted) {
    auto remaining = acquire(bytes);
    const SleepDuration slice = Constants::THROTTLE_SLICE;

    while (remaining > SleepDuration::zero()) {
        if (interrupted && interrupted()) {
            return false;
        }
        const auto step = std::min(remaining, slice);
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
    return true;
}

void RateLimiter::account(ByteCount bytes) {
    if (bytes <= 0) {
        return;
    }
    const auto now = Clock::now();
    m_totalConsumed.fetch_add(bytes, std::memory_order_relaxed);
    m_throughput.addBytes(bytes, now);

    std::lock_guard lock(m_mutex);
    refillLocked(now);
    if (m_rate > 0) {
        // Externally throttled; keep the debt bounded to one burst
        m_tokens = std::max(-static_cast<double>(m_rate), m_tokens - static_cast<double>(bytes));
    }
}

void RateLimiter::setMaxBytesPerSecond(ByteCount maxBytesPerSecond, Clock::time_point now) {
    validate(maxBytesPerSecond);

    std::lock_guard lock(m_mutex);
    refillLocked(now);

    const ByteCount previous = m_rate;
    m_rate = maxBytesPerSecond;

    if (previous == 0) {
        m_tokens = static_cast<double>(m_rate);
    } else {
        m_tokens = std::min(m_tokens, static_cast<double>(m_rate));
    }

    qDebug() << "RateLimiter: Limit changed from" << formatSpeed(previous)
             << "to" << (m_rate == 0 ? QStringLiteral("unlimited") : formatSpeed(m_rate));
}

ByteCount RateLimiter::maxBytesPerSecond() const {
    std::lock_guard lock(m_mutex);
    return m_rate;
}

} // namespace Baresha
