/**
 * @file EventHistoryService.cpp
 * @brief Implementation of EventHistoryService.
 */

#include "application/EventHistoryService.hpp"

#include "application/StoreCall.hpp"
#include "domain/DomainErrors.hpp"
#include "domain/analytics/EventSummaries.hpp"

namespace glucosetrail::application {

using namespace glucosetrail::domain;

EventHistoryService::EventHistoryService(std::shared_ptr<IEventRepository> events,
                                         std::shared_ptr<const IClock> clock)
    : m_events(std::move(events)), m_clock(std::move(clock)) {}

Result<PagedResult<EventListItem>> EventHistoryService::listEvents(const UserId& userId,
                                                                   const ListEventsQuery& query,
                                                                   const CancellationToken& token) {
    if (query.page < 1 || query.pageSize < 1 || query.pageSize > ListEventsQuery::kMaxPageSize) {
        return errors::InvalidPaging();
    }

    Timestamp to = query.toDate.value_or(m_clock->now());
    Timestamp from = query.fromDate.value_or(to - kDefaultWindow);
    if (from > to) {
        return errors::InvalidDateRange();
    }

    auto total = CallStore(token, [&] {
        return m_events->countByUserId(userId, from, to, query.eventType, token);
    });
    if (total.isFailure()) return total.error();

    auto page = CallStore(token, [&] {
        return m_events->getPaged(userId, from, to, query.page, query.pageSize, query.eventType, token);
    });
    if (page.isFailure()) return page.error();

    PagedResult<EventListItem> result;
    result.page = query.page;
    result.pageSize = query.pageSize;
    result.totalCount = total.value();
    result.items.reserve(page.value().size());
    for (const auto& event : page.value()) {
        result.items.push_back(EventListItem{event.getId(), event.getType(), event.getEventTime(), HistorySummary(event)});
    }
    return result;
}

Result<Event> EventHistoryService::getEvent(const std::string& eventId,
                                            const UserId& callerUserId,
                                            const CancellationToken& token) {
    auto lookup = CallStore(token, [&] { return m_events->getById(eventId, token); });
    if (lookup.isFailure()) return lookup.error();

    if (!lookup.value()) {
        return errors::EventNotFound();
    }
    if (lookup.value()->getUserId() != callerUserId) {
        return errors::Forbidden();
    }
    return *std::move(lookup).value();
}

} // namespace glucosetrail::application
