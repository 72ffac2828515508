/**
 * @file InMemoryEventRepository.cpp
 * @brief Implementation of InMemoryEventRepository.
 */

#include "infrastructure/InMemoryEventRepository.hpp"

#include <algorithm>
#include <stdexcept>

namespace glucosetrail::infrastructure {

using namespace glucosetrail::domain;

std::optional<Event> InMemoryEventRepository::getById(const std::string& eventId, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_events.begin(), m_events.end(),
        [&](const Event& e) { return e.getId() == eventId; });
    if (it == m_events.end()) return std::nullopt;
    return *it;
}

std::vector<Event> InMemoryEventRepository::filter(const UserId& userId,
                                                   std::optional<EventType> type,
                                                   std::optional<Timestamp> from,
                                                   std::optional<Timestamp> to) const {
    std::vector<Event> result;
    for (const auto& e : m_events) {
        if (e.getUserId() != userId) continue;
        if (type && e.getType() != *type) continue;
        if (from && e.getEventTime() < *from) continue;
        if (to && e.getEventTime() > *to) continue;
        result.push_back(e);
    }
    // Most recent first; creation order breaks ties so paging is stable.
    std::stable_sort(result.begin(), result.end(), [](const Event& a, const Event& b) {
        if (a.getEventTime() != b.getEventTime()) return a.getEventTime() > b.getEventTime();
        return a.getCreatedAt() > b.getCreatedAt();
    });
    return result;
}

std::vector<Event> InMemoryEventRepository::getByUserId(const UserId& userId,
                                                        std::optional<EventType> type,
                                                        std::optional<Timestamp> from,
                                                        std::optional<Timestamp> to,
                                                        const CancellationToken&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return filter(userId, type, from, to);
}

int InMemoryEventRepository::countByUserId(const UserId& userId,
                                           Timestamp from,
                                           Timestamp to,
                                           std::optional<EventType> type,
                                           const CancellationToken&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(std::count_if(m_events.begin(), m_events.end(), [&](const Event& e) {
        return e.getUserId() == userId
            && (!type || e.getType() == *type)
            && e.getEventTime() >= from
            && e.getEventTime() <= to;
    }));
}

std::vector<Event> InMemoryEventRepository::getPaged(const UserId& userId,
                                                     Timestamp from,
                                                     Timestamp to,
                                                     int page,
                                                     int pageSize,
                                                     std::optional<EventType> type,
                                                     const CancellationToken&) {
    page = std::max(page, 1);
    pageSize = std::clamp(pageSize, 1, kMaxPageSize);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto all = filter(userId, type, from, to);

    std::size_t skip = static_cast<std::size_t>(page - 1) * static_cast<std::size_t>(pageSize);
    if (skip >= all.size()) return {};

    auto first = all.begin() + static_cast<std::ptrdiff_t>(skip);
    auto last = all.size() - skip > static_cast<std::size_t>(pageSize) ? first + pageSize : all.end();
    return std::vector<Event>(first, last);
}

void InMemoryEventRepository::add(const Event& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto exists = std::any_of(m_events.begin(), m_events.end(),
        [&](const Event& e) { return e.getId() == event.getId(); });
    if (exists) {
        throw std::runtime_error("Event already stored: " + event.getId());
    }
    m_events.push_back(event);
}

std::size_t InMemoryEventRepository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

} // namespace glucosetrail::infrastructure
