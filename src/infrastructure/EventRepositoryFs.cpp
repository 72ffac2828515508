/**
 * @file EventRepositoryFs.cpp
 * @brief Implementation of EventRepositoryFs.
 */

#include "infrastructure/EventRepositoryFs.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/EventJson.hpp"

namespace glucosetrail::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace glucosetrail::domain;

namespace {
// User ids become file names; anything outside [A-Za-z0-9_-] is replaced.
std::string safeFileStem(const std::string& value) {
    std::string stem = value;
    for (char& c : stem) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') c = '_';
    }
    return stem;
}
}

EventRepositoryFs::EventRepositoryFs(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(std::move(dataDir)), m_persistence(std::move(persistence)) {
    loadAll();
}

std::string EventRepositoryFs::getEventsFilePath(const UserId& userId) const {
    // Structure: <root>/events/<user>.ndjson
    return (fs::path(m_dataDir) / "events" / (safeFileStem(userId.value()) + ".ndjson")).string();
}

void EventRepositoryFs::loadAll() {
    fs::path dir = fs::path(m_dataDir) / "events";
    std::error_code ec;
    if (!fs::exists(dir, ec)) return;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".ndjson") continue;

        std::ifstream inFile(entry.path());
        std::string line;
        int lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            if (line.empty()) continue;
            try {
                m_cache.add(EventFromJson(json::parse(line)));
            } catch (const std::exception& e) {
                ++m_skippedLines;
                std::cerr << "[EventRepositoryFs] Skipping " << entry.path().filename().string()
                          << ":" << lineNo << ": " << e.what() << std::endl;
            }
        }
    }
    if (ec) {
        std::cerr << "[EventRepositoryFs] Error listing " << dir << ": " << ec.message() << std::endl;
    }
    std::cerr << "[EventRepositoryFs] Loaded " << m_cache.size() << " events";
    if (m_skippedLines > 0) std::cerr << " (" << m_skippedLines << " skipped)";
    std::cerr << std::endl;
}

std::optional<Event> EventRepositoryFs::getById(const std::string& eventId, const CancellationToken& token) {
    return m_cache.getById(eventId, token);
}

std::vector<Event> EventRepositoryFs::getByUserId(const UserId& userId,
                                                  std::optional<EventType> type,
                                                  std::optional<Timestamp> from,
                                                  std::optional<Timestamp> to,
                                                  const CancellationToken& token) {
    return m_cache.getByUserId(userId, type, from, to, token);
}

int EventRepositoryFs::countByUserId(const UserId& userId,
                                     Timestamp from,
                                     Timestamp to,
                                     std::optional<EventType> type,
                                     const CancellationToken& token) {
    return m_cache.countByUserId(userId, from, to, type, token);
}

std::vector<Event> EventRepositoryFs::getPaged(const UserId& userId,
                                               Timestamp from,
                                               Timestamp to,
                                               int page,
                                               int pageSize,
                                               std::optional<EventType> type,
                                               const CancellationToken& token) {
    return m_cache.getPaged(userId, from, to, page, pageSize, type, token);
}

void EventRepositoryFs::add(const Event& event) {
    m_cache.add(event);
    m_persistence->appendLineAsync(getEventsFilePath(event.getUserId()), EventToJson(event).dump());
}

} // namespace glucosetrail::infrastructure
