#include "domain/analytics/TimeInRangeCalculator.hpp"

#include <cmath>

namespace glucosetrail::domain {

double TimeInRangeStats::roundedPercentage() const {
    return std::nearbyint(percentage * 10.0) / 10.0;
}

TimeInRangeStats TimeInRangeCalculator::calculate(const std::vector<GlucoseReading>& readings, const TirRange& range) {
    TimeInRangeStats stats;
    stats.lowerBound = range.lower();
    stats.upperBound = range.upper();
    stats.totalCount = static_cast<int>(readings.size());

    for (const auto& reading : readings) {
        if (reading.valueMgDl < range.lower()) {
            ++stats.belowCount;
        } else if (reading.valueMgDl > range.upper()) {
            ++stats.aboveCount;
        } else {
            ++stats.inRangeCount;
        }
    }

    if (stats.totalCount > 0) {
        stats.percentage = 100.0 * stats.inRangeCount / stats.totalCount;
    }
    return stats;
}

} // namespace glucosetrail::domain
