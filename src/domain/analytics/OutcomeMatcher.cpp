#include "domain/analytics/OutcomeMatcher.hpp"

namespace glucosetrail::domain {

namespace {
Timestamp::duration distance(Timestamp a, Timestamp b) {
    return a > b ? a - b : b - a;
}
}

OutcomeMatcher::OutcomeMatcher(std::chrono::minutes offset, std::chrono::minutes tolerance)
    : m_offset(offset), m_tolerance(tolerance) {}

OutcomeWindow OutcomeMatcher::windowFor(Timestamp eventTime) const {
    Timestamp target = eventTime + m_offset;
    return OutcomeWindow{target, target - m_tolerance, target + m_tolerance};
}

std::optional<GlucoseReading> OutcomeMatcher::selectNearest(const std::vector<GlucoseReading>& readings,
                                                            const OutcomeWindow& window) const {
    const GlucoseReading* best = nullptr;
    for (const auto& reading : readings) {
        if (reading.systemTime < window.start || reading.systemTime > window.end) {
            continue;
        }
        if (!best) {
            best = &reading;
            continue;
        }
        auto d = distance(reading.systemTime, window.target);
        auto bestD = distance(best->systemTime, window.target);
        if (d < bestD || (d == bestD && reading.systemTime < best->systemTime)) {
            best = &reading;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace glucosetrail::domain
