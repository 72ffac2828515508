/**
 * @file JsonOutput.cpp
 * @brief Implementation of the CLI JSON renderings. Times are ISO-8601 UTC.
 */

#include "app/JsonOutput.hpp"

#include "domain/common/TimeFormat.hpp"
#include "infrastructure/EventJson.hpp"

namespace glucosetrail::app {

using json = nlohmann::json;
using namespace glucosetrail::domain;
using namespace glucosetrail::application;

json ToJson(const Error& error) {
    return {{"error", {
        {"code", error.code},
        {"message", error.message},
        {"kind", ErrorKindToString(error.kind)}
    }}};
}

json ToJson(const OutcomeResult& outcome) {
    return {
        {"eventId", outcome.eventId},
        {"targetTime", FormatIso8601(outcome.targetTime)},
        {"readingTime", FormatIso8601(outcome.readingTime)},
        {"glucoseValue", outcome.glucoseValue ? json(*outcome.glucoseValue) : json(nullptr)},
        {"isApproximate", outcome.isApproximate},
        {"message", outcome.message}
    };
}

json ToJson(const ChartResult& chart) {
    json glucose = json::array();
    for (const auto& point : chart.glucose) {
        glucose.push_back({
            {"timestamp", FormatIso8601(point.timestamp)},
            {"value", point.value},
            {"trend", point.trend ? json(*point.trend) : json(nullptr)}
        });
    }
    json overlays = json::array();
    for (const auto& overlay : chart.overlays) {
        overlays.push_back({
            {"eventId", overlay.eventId},
            {"eventType", EventTypeToString(overlay.eventType)},
            {"timestamp", FormatIso8601(overlay.timestamp)},
            {"tooltip", overlay.tooltip}
        });
    }
    return {
        {"startTime", FormatIso8601(chart.startTime)},
        {"endTime", FormatIso8601(chart.endTime)},
        {"glucoseData", glucose},
        {"eventOverlays", overlays}
    };
}

json ToJson(const TirResult& tir) {
    return {
        {"timeInRangePercentage", tir.percentage},
        {"totalReadings", tir.totalReadings},
        {"readingsInRange", tir.inRangeCount},
        {"readingsBelowRange", tir.belowCount},
        {"readingsAboveRange", tir.aboveCount},
        {"targetLowerBound", tir.targetLower},
        {"targetUpperBound", tir.targetUpper},
        {"startTime", FormatIso8601(tir.startTime)},
        {"endTime", FormatIso8601(tir.endTime)}
    };
}

json ToJson(const PagedResult<EventListItem>& page) {
    json items = json::array();
    for (const auto& item : page.items) {
        items.push_back({
            {"eventId", item.eventId},
            {"eventType", EventTypeToString(item.eventType)},
            {"eventTime", FormatIso8601(item.eventTime)},
            {"summary", item.summary}
        });
    }
    return {
        {"items", items},
        {"page", page.page},
        {"pageSize", page.pageSize},
        {"totalCount", page.totalCount},
        {"totalPages", page.totalPages()},
        {"hasPreviousPage", page.hasPreviousPage()},
        {"hasNextPage", page.hasNextPage()}
    };
}

json ToJson(const Event& event) {
    json j = infrastructure::EventToJson(event);
    j["eventTime"] = FormatIso8601(event.getEventTime());
    j["createdAt"] = FormatIso8601(event.getCreatedAt());
    return j;
}

} // namespace glucosetrail::app
