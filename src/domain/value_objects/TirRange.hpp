/**
 * @file TirRange.hpp
 * @brief Value Object for a user's target glucose range (mg/dL).
 */

#pragma once

#include <string>

#include "domain/DomainErrors.hpp"

namespace glucosetrail::domain {

/**
 * @class TirRange
 * @brief Inclusive [lower, upper] target band used for time-in-range.
 *
 * Invariant: 0 <= lower < upper <= 1000.
 */
class TirRange {
public:
    static constexpr int kMinBound = 0;
    static constexpr int kMaxBound = 1000;

    static Result<TirRange> create(int lower, int upper) {
        if (lower < kMinBound || lower > kMaxBound || upper < kMinBound || upper > kMaxBound) {
            return errors::InvalidTirRange();
        }
        if (lower >= upper) {
            return errors::InvalidTirRange();
        }
        return TirRange(lower, upper);
    }

    /// The consensus 70-180 mg/dL target.
    static TirRange standard() { return TirRange(70, 180); }

    int lower() const { return m_lower; }
    int upper() const { return m_upper; }

    bool isInRange(int glucoseValue) const { return glucoseValue >= m_lower && glucoseValue <= m_upper; }

    std::string toString() const {
        return std::to_string(m_lower) + "-" + std::to_string(m_upper) + " mg/dL";
    }

    bool operator==(const TirRange& other) const { return m_lower == other.m_lower && m_upper == other.m_upper; }
    bool operator!=(const TirRange& other) const { return !(*this == other); }

private:
    TirRange(int lower, int upper) : m_lower(lower), m_upper(upper) {}

    int m_lower;
    int m_upper;
};

} // namespace glucosetrail::domain
