/**
 * @file Clocks.hpp
 * @brief IClock implementations: the wall clock and a manually advanced one.
 */

#pragma once

#include <chrono>
#include <mutex>

#include "domain/common/Clock.hpp"

namespace glucosetrail::infrastructure {

class SystemClock : public domain::IClock {
public:
    /// Truncated to milliseconds, the resolution events and audit records are stored at.
    domain::Timestamp now() const override {
        return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }
};

/**
 * @class ManualClock
 * @brief Returns a fixed instant until told otherwise. Used for deterministic runs.
 */
class ManualClock : public domain::IClock {
public:
    explicit ManualClock(domain::Timestamp start) : m_now(start) {}

    domain::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void set(domain::Timestamp value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = value;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += std::chrono::duration_cast<domain::Timestamp::duration>(delta);
    }

private:
    mutable std::mutex m_mutex;
    domain::Timestamp m_now;
};

} // namespace glucosetrail::infrastructure
