/**
 * @file EventRepositoryFs.hpp
 * @brief File-system backed event repository (one ndjson log per user).
 */

#pragma once

#include <memory>
#include <string>

#include "infrastructure/InMemoryEventRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace glucosetrail::infrastructure {

/**
 * @class EventRepositoryFs
 * @brief Appends each event to <dataDir>/events/<user>.ndjson and serves reads from memory.
 *
 * All logs are loaded once at construction. Writes go through PersistenceService, so a
 * process reading the files directly must flush() the service first.
 */
class EventRepositoryFs : public domain::IEventRepository {
public:
    EventRepositoryFs(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

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

    void add(const domain::Event& event) override;

    /** @brief Number of lines skipped while loading because they were not valid events. */
    int skippedLines() const { return m_skippedLines; }

private:
    void loadAll();
    std::string getEventsFilePath(const domain::UserId& userId) const;

    std::string m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;
    InMemoryEventRepository m_cache;
    int m_skippedLines = 0;
};

} // namespace glucosetrail::infrastructure
