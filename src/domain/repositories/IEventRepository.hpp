/**
 * @file IEventRepository.hpp
 * @brief Interface for storing and querying events.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/common/CancellationToken.hpp"
#include "domain/events/Event.hpp"

namespace glucosetrail::domain {

/**
 * @class IEventRepository
 *
 * Query results are ordered by event time, most recent first. Time bounds are inclusive.
 * Storage failures are reported by throwing std::runtime_error; callers translate them.
 */
class IEventRepository {
public:
    virtual ~IEventRepository() = default;

    virtual std::optional<Event> getById(const std::string& eventId, const CancellationToken& token) = 0;

    virtual std::vector<Event> getByUserId(const UserId& userId,
                                           std::optional<EventType> type,
                                           std::optional<Timestamp> from,
                                           std::optional<Timestamp> to,
                                           const CancellationToken& token) = 0;

    virtual int countByUserId(const UserId& userId,
                              Timestamp from,
                              Timestamp to,
                              std::optional<EventType> type,
                              const CancellationToken& token) = 0;

    /// @param page 1-based. @param pageSize clamped to [1, 100].
    virtual std::vector<Event> getPaged(const UserId& userId,
                                        Timestamp from,
                                        Timestamp to,
                                        int page,
                                        int pageSize,
                                        std::optional<EventType> type,
                                        const CancellationToken& token) = 0;

    /// Events are append-only: there is no update and no delete.
    virtual void add(const Event& event) = 0;
};

} // namespace glucosetrail::domain
