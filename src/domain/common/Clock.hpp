/**
 * @file Clock.hpp
 * @brief Injected time source. All time-sensitive domain logic reads "now" through this.
 */

#pragma once

#include <chrono>

namespace glucosetrail::domain {

/// Instants are UTC; local offsets are a presentation concern.
using Timestamp = std::chrono::system_clock::time_point;

class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
};

} // namespace glucosetrail::domain
