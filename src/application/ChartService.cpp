/**
 * @file ChartService.cpp
 * @brief Implementation of ChartService.
 */

#include "application/ChartService.hpp"

#include <algorithm>
#include <iostream>

#include "application/JoinBoth.hpp"
#include "application/StoreCall.hpp"
#include "domain/DomainErrors.hpp"
#include "domain/analytics/ChartRange.hpp"
#include "domain/analytics/EventSummaries.hpp"
#include "domain/analytics/TimeInRangeCalculator.hpp"

namespace glucosetrail::application {

using namespace glucosetrail::domain;

ChartService::ChartService(std::shared_ptr<IGlucoseSource> glucose,
                           std::shared_ptr<IEventRepository> events,
                           std::shared_ptr<const IClock> clock,
                           TirRange targetRange)
    : m_glucose(std::move(glucose)),
      m_events(std::move(events)),
      m_clock(std::move(clock)),
      m_targetRange(targetRange) {}

Result<ChartResult> ChartService::assembleChart(const UserId& userId,
                                                const std::string& rangeSelector,
                                                const CancellationToken& token) {
    auto hours = ParseChartRange(rangeSelector);
    if (!hours) {
        return errors::InvalidChartRange();
    }

    Timestamp end = m_clock->now();
    Timestamp start = end - *hours;

    auto fetched = JoinBoth<std::vector<GlucoseReading>, std::vector<Event>>(
        token,
        [&](const CancellationToken& child) {
            return m_glucose->getReadingsInRange(userId, start, end, child);
        },
        [&](const CancellationToken& child) {
            return CallStore(child, [&] {
                return m_events->getByUserId(userId, std::nullopt, start, end, child);
            });
        });
    if (fetched.isFailure()) {
        std::cerr << "[ChartService] Chart fetch failed: " << fetched.error().code << std::endl;
        return fetched.error();
    }

    auto& [readings, events] = fetched.value();

    ChartResult chart;
    chart.startTime = start;
    chart.endTime = end;

    chart.glucose.reserve(readings.size());
    for (const auto& reading : readings) {
        chart.glucose.push_back(GlucosePoint{reading.systemTime, reading.valueMgDl, reading.trend});
    }
    std::stable_sort(chart.glucose.begin(), chart.glucose.end(),
        [](const GlucosePoint& a, const GlucosePoint& b) { return a.timestamp < b.timestamp; });

    chart.overlays.reserve(events.size());
    for (const auto& event : events) {
        chart.overlays.push_back(EventOverlay{event.getId(), event.getType(), event.getEventTime(), ChartTooltip(event)});
    }
    std::stable_sort(chart.overlays.begin(), chart.overlays.end(),
        [](const EventOverlay& a, const EventOverlay& b) { return a.timestamp < b.timestamp; });

    return chart;
}

Result<TirResult> ChartService::computeTimeInRange(const UserId& userId,
                                                   const std::string& rangeSelector,
                                                   const CancellationToken& token) {
    auto hours = ParseChartRange(rangeSelector);
    if (!hours) {
        return errors::InvalidChartRange();
    }
    if (token.isCancellationRequested()) {
        return errors::RequestCancelled();
    }

    Timestamp end = m_clock->now();
    Timestamp start = end - *hours;

    auto readings = m_glucose->getReadingsInRange(userId, start, end, token);
    if (readings.isFailure()) {
        std::cerr << "[ChartService] TIR fetch failed: " << readings.error().code << std::endl;
        return readings.error();
    }
    if (token.isCancellationRequested()) {
        return errors::RequestCancelled();
    }

    TimeInRangeStats stats = TimeInRangeCalculator::calculate(readings.value(), m_targetRange);
    if (stats.totalCount == 0) {
        std::cerr << "[ChartService] No readings in the last " << hours->count() << "h." << std::endl;
    }

    TirResult result;
    result.totalReadings = stats.totalCount;
    result.inRangeCount = stats.inRangeCount;
    result.belowCount = stats.belowCount;
    result.aboveCount = stats.aboveCount;
    result.percentage = stats.roundedPercentage();
    result.targetLower = stats.lowerBound;
    result.targetUpper = stats.upperBound;
    result.startTime = start;
    result.endTime = end;
    return result;
}

} // namespace glucosetrail::application
