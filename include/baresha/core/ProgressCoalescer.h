/**
 * @file ProgressCoalescer.h
 * @brief Bounds the rate of progress events from a fast transfer
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <chrono>

namespace Baresha {

/**
 * @class ProgressCoalescer
 * @brief Lets a progress event through every N bytes or T ms, whichever comes first
 *
 * Not thread-safe; owned by the single transfer it throttles.
 */
class ProgressCoalescer {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressCoalescer(ByteCount byteThreshold = Constants::PROGRESS_EVENT_BYTES,
                               Duration interval = Constants::PROGRESS_EVENT_INTERVAL)
        : m_byteThreshold(byteThreshold)
        , m_interval(interval)
    {}

    void reset(ByteCount baseline, Clock::time_point now) {
        m_lastBytes = baseline;
        m_lastEmit = now;
    }

    /**
     * @brief Decide whether @p bytesReceived warrants an event
     *
     * Returns true at most once per threshold crossing and records the emit.
     */
    bool shouldEmit(ByteCount bytesReceived, Clock::time_point now) {
        if (bytesReceived <= m_lastBytes) {
            return false;
        }
        if (bytesReceived - m_lastBytes < m_byteThreshold && now - m_lastEmit < m_interval) {
            return false;
        }
        m_lastBytes = bytesReceived;
        m_lastEmit = now;
        return true;
    }

private:
    ByteCount m_byteThreshold;
    Duration m_interval;
    ByteCount m_lastBytes = 0;
    Clock::time_point m_lastEmit{};
};

} // namespace Baresha
