/**
 * @file TimeInRangeCalculator.hpp
 * @brief Time-in-range statistics over a set of glucose readings.
 */

#pragma once

#include <vector>

#include "domain/glucose/GlucoseReading.hpp"
#include "domain/value_objects/TirRange.hpp"

namespace glucosetrail::domain {

/**
 * @struct TimeInRangeStats
 * Invariant: inRangeCount + belowCount + aboveCount == totalCount.
 */
struct TimeInRangeStats {
    int totalCount = 0;
    int inRangeCount = 0;
    int belowCount = 0;
    int aboveCount = 0;
    double percentage = 0.0; ///< 0 when there are no readings.
    int lowerBound = 0;
    int upperBound = 0;

    /// Percentage rounded to one decimal, half to even.
    double roundedPercentage() const;
};

class TimeInRangeCalculator {
public:
    static TimeInRangeStats calculate(const std::vector<GlucoseReading>& readings, const TirRange& range);
};

} // namespace glucosetrail::domain
