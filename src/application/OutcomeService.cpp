/**
 * @file OutcomeService.cpp
 * @brief Implementation of OutcomeService.
 */

#include "application/OutcomeService.hpp"

#include <iostream>

#include "application/StoreCall.hpp"
#include "domain/DomainErrors.hpp"

namespace glucosetrail::application {

using namespace glucosetrail::domain;

OutcomeService::OutcomeService(std::shared_ptr<IEventRepository> events,
                               std::shared_ptr<IGlucoseSource> glucose,
                               OutcomeMatcher matcher)
    : m_events(std::move(events)), m_glucose(std::move(glucose)), m_matcher(matcher) {}

Result<OutcomeResult> OutcomeService::computeOutcome(const std::string& eventId,
                                                     const UserId& callerUserId,
                                                     const CancellationToken& token) {
    auto lookup = CallStore(token, [&] { return m_events->getById(eventId, token); });
    if (lookup.isFailure()) return lookup.error();

    const auto& event = lookup.value();
    if (!event) {
        return errors::EventNotFound();
    }
    if (event->getUserId() != callerUserId) {
        return errors::Forbidden();
    }
    if (event->getType() != EventType::Food) {
        return errors::OutcomeRequiresFoodEvent();
    }

    OutcomeWindow window = m_matcher.windowFor(event->getEventTime());
    auto readings = m_glucose->getReadingsInRange(callerUserId, window.start, window.end, token);
    if (readings.isFailure()) {
        std::cerr << "[OutcomeService] Glucose source failed for event " << eventId
                  << ": " << readings.error().code << std::endl;
        return readings.error();
    }
    if (token.isCancellationRequested()) {
        return errors::RequestCancelled();
    }

    OutcomeResult result;
    result.eventId = event->getId();
    result.targetTime = window.target;

    auto nearest = m_matcher.selectNearest(readings.value(), window);
    if (!nearest) {
        result.readingTime = window.target;
        result.isApproximate = true;
        result.message = "No reading available";
        return result;
    }

    result.readingTime = nearest->systemTime;
    result.glucoseValue = nearest->valueMgDl;
    result.isApproximate = false;
    result.message = "Outcome recorded";
    return result;
}

} // namespace glucosetrail::application
