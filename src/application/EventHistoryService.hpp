/**
 * @file EventHistoryService.hpp
 * @brief Application Service for browsing a user's logged events.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "application/dto/EventListing.hpp"
#include "domain/common/CancellationToken.hpp"
#include "domain/common/Clock.hpp"
#include "domain/repositories/IEventRepository.hpp"

namespace glucosetrail::application {

class EventHistoryService {
public:
    static constexpr std::chrono::hours kDefaultWindow{24 * 30};

    EventHistoryService(std::shared_ptr<domain::IEventRepository> events,
                        std::shared_ptr<const domain::IClock> clock);

    /**
     * @brief One page of the user's events, most recent first, with history summaries.
     *
     * Missing bounds default to [to - 30 days, now]. The type filter applies to both the
     * page and the total count.
     * Errors: Events.InvalidPaging, Events.InvalidDateRange, EventStore.Error, Request.Cancelled.
     */
    domain::Result<PagedResult<EventListItem>> listEvents(const domain::UserId& userId,
                                                          const ListEventsQuery& query,
                                                          const domain::CancellationToken& token = {});

    /// Errors: Event.NotFound, Authorization.Forbidden.
    domain::Result<domain::Event> getEvent(const std::string& eventId,
                                           const domain::UserId& callerUserId,
                                           const domain::CancellationToken& token = {});

private:
    std::shared_ptr<domain::IEventRepository> m_events;
    std::shared_ptr<const domain::IClock> m_clock;
};

} // namespace glucosetrail::application
