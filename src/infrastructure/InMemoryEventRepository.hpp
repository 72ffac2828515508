/**
 * @file InMemoryEventRepository.hpp
 * @brief Thread-safe IEventRepository kept entirely in memory.
 */

#pragma once

#include <mutex>
#include <vector>

#include "domain/repositories/IEventRepository.hpp"

namespace glucosetrail::infrastructure {

/**
 * @class InMemoryEventRepository
 * @brief Holds events in a vector; queries filter and sort on every call.
 *
 * Also the read cache behind EventRepositoryFs.
 */
class InMemoryEventRepository : public domain::IEventRepository {
public:
    static constexpr int kMaxPageSize = 100;

    std::optional<domain::Event> getById(const std::string& eventId,
                                         const domain::CancellationToken& token) override;

    std::vector<domain::Event> getByUserId(const domain::UserId& userId,
                                           std::optional<domain::EventType> type,
                                           std::optional<domain::Timestamp> from,
                                           std::optional<domain::Timestamp> to,
                                           const domain::CancellationToken& token) override;

    int countByUserId(const domain::UserId& userId,
                      domain::Timestamp from,
                      domain::Timestamp to,
                      std::optional<domain::EventType> type,
                      const domain::CancellationToken& token) override;

    std::vector<domain::Event> getPaged(const domain::UserId& userId,
                                        domain::Timestamp from,
                                        domain::Timestamp to,
                                        int page,
                                        int pageSize,
                                        std::optional<domain::EventType> type,
                                        const domain::CancellationToken& token) override;

    /// Throws std::runtime_error if an event with the same id is already stored.
    void add(const domain::Event& event) override;

    std::size_t size() const;

private:
    std::vector<domain::Event> filter(const domain::UserId& userId,
                                      std::optional<domain::EventType> type,
                                      std::optional<domain::Timestamp> from,
                                      std::optional<domain::Timestamp> to) const;

    mutable std::mutex m_mutex;
    std::vector<domain::Event> m_events;
};

} // namespace glucosetrail::infrastructure
