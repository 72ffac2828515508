/**
 * @file OutcomeMatcher.hpp
 * @brief Domain service matching a meal to the glucose reading taken about two hours later.
 */

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "domain/common/Clock.hpp"
#include "domain/glucose/GlucoseReading.hpp"

namespace glucosetrail::domain {

/**
 * @struct OutcomeWindow
 * @brief The instant we want a reading for and the inclusive span searched around it.
 */
struct OutcomeWindow {
    Timestamp target;
    Timestamp start;
    Timestamp end;
};

/**
 * @class OutcomeMatcher
 * @brief Nearest-neighbour selection inside a fixed tolerance window.
 *
 * Every reading inside [target - tolerance, target + tolerance] is a candidate; the one
 * with the smallest absolute distance to the target wins, ties going to the earlier one.
 */
class OutcomeMatcher {
public:
    static constexpr std::chrono::minutes kDefaultOffset{120};
    static constexpr std::chrono::minutes kDefaultTolerance{15};

    explicit OutcomeMatcher(std::chrono::minutes offset = kDefaultOffset,
                            std::chrono::minutes tolerance = kDefaultTolerance);

    OutcomeWindow windowFor(Timestamp eventTime) const;

    /** @return std::nullopt when no reading falls inside the window. */
    std::optional<GlucoseReading> selectNearest(const std::vector<GlucoseReading>& readings,
                                                const OutcomeWindow& window) const;

private:
    std::chrono::minutes m_offset;
    std::chrono::minutes m_tolerance;
};

} // namespace glucosetrail::domain
