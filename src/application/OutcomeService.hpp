/**
 * @file OutcomeService.hpp
 * @brief Application Service answering "what was my glucose two hours after this meal?".
 */

#pragma once

#include <memory>
#include <string>

#include "application/dto/OutcomeResult.hpp"
#include "domain/analytics/OutcomeMatcher.hpp"
#include "domain/common/CancellationToken.hpp"
#include "domain/glucose/IGlucoseSource.hpp"
#include "domain/repositories/IEventRepository.hpp"

namespace glucosetrail::application {

class OutcomeService {
public:
    OutcomeService(std::shared_ptr<domain::IEventRepository> events,
                   std::shared_ptr<domain::IGlucoseSource> glucose,
                   domain::OutcomeMatcher matcher = domain::OutcomeMatcher());

    /**
     * @brief Finds the reading nearest to eventTime + 2h for a food event owned by the caller.
     *
     * A window with no readings is a successful, approximate result.
     * Errors: Event.NotFound, Authorization.Forbidden, Event.InvalidType, any glucose
     * source error unchanged, Request.Cancelled.
     */
    domain::Result<OutcomeResult> computeOutcome(const std::string& eventId,
                                                 const domain::UserId& callerUserId,
                                                 const domain::CancellationToken& token = {});

private:
    std::shared_ptr<domain::IEventRepository> m_events;
    std::shared_ptr<domain::IGlucoseSource> m_glucose;
    domain::OutcomeMatcher m_matcher;
};

} // namespace glucosetrail::application
