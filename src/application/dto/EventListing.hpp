/**
 * @file EventListing.hpp
 * @brief Query and read models for the event history.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/common/Clock.hpp"
#include "domain/events/EventEnums.hpp"

namespace glucosetrail::application {

using domain::Timestamp;

struct ListEventsQuery {
    static constexpr int kMaxPageSize = 100;
    static constexpr int kDefaultPageSize = 20;

    std::optional<domain::EventType> eventType;
    std::optional<Timestamp> fromDate;
    std::optional<Timestamp> toDate;
    int page = 1;
    int pageSize = kDefaultPageSize;
};

struct EventListItem {
    std::string eventId;
    domain::EventType eventType;
    Timestamp eventTime;
    std::string summary;
};

template <typename T>
struct PagedResult {
    std::vector<T> items;
    int page = 1;
    int pageSize = ListEventsQuery::kDefaultPageSize;
    int totalCount = 0;

    int totalPages() const { return pageSize > 0 ? (totalCount + pageSize - 1) / pageSize : 0; }
    bool hasPreviousPage() const { return page > 1; }
    bool hasNextPage() const { return page < totalPages(); }
};

} // namespace glucosetrail::application
