/**
 * @file ChartResult.hpp
 * @brief Read models returned by the chart and time-in-range queries.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/common/Clock.hpp"
#include "domain/events/EventEnums.hpp"

namespace glucosetrail::application {

using domain::Timestamp;

struct GlucosePoint {
    Timestamp timestamp;
    int value = 0;
    std::optional<std::string> trend;
};

struct EventOverlay {
    std::string eventId;
    domain::EventType eventType;
    Timestamp timestamp;
    std::string tooltip;
};

/// Both series are sorted by time, oldest first.
struct ChartResult {
    std::vector<GlucosePoint> glucose;
    std::vector<EventOverlay> overlays;
    Timestamp startTime;
    Timestamp endTime;
};

struct TirResult {
    int totalReadings = 0;
    int inRangeCount = 0;
    int belowCount = 0;
    int aboveCount = 0;
    double percentage = 0.0;        ///< One decimal place.
    int targetLower = 0;
    int targetUpper = 0;
    Timestamp startTime;
    Timestamp endTime;
};

} // namespace glucosetrail::application
