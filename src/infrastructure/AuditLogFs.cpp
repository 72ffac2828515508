/**
 * @file AuditLogFs.cpp
 * @brief Implementation of AuditLogFs.
 */

#include "infrastructure/AuditLogFs.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/EventJson.hpp"

namespace glucosetrail::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

AuditLogFs::AuditLogFs(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(std::move(dataDir)), m_persistence(std::move(persistence)) {}

std::string AuditLogFs::getLogFilePath() const {
    return (fs::path(m_dataDir) / "audit" / "audit.ndjson").string();
}

void AuditLogFs::append(const domain::EventAuditRecord& record) {
    m_persistence->appendLineAsync(getLogFilePath(), AuditRecordToJson(record).dump());
}

std::vector<domain::EventAuditRecord> AuditLogFs::readAll() {
    m_persistence->flush();

    std::vector<domain::EventAuditRecord> results;
    std::string filepath = getLogFilePath();
    if (!fs::exists(filepath)) return results;

    std::ifstream inFile(filepath);
    std::string line;
    while (std::getline(inFile, line)) {
        if (line.empty()) continue;
        try {
            results.push_back(AuditRecordFromJson(json::parse(line)));
        } catch (const std::exception& e) {
            std::cerr << "[AuditLogFs] Skipping malformed record: " << e.what() << std::endl;
        }
    }
    return results;
}

} // namespace glucosetrail::infrastructure
