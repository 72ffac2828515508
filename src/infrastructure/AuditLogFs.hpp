/**
 * @file AuditLogFs.hpp
 * @brief Append-only audit log stored as <dataDir>/audit/audit.ndjson.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/repositories/IAuditLog.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace glucosetrail::infrastructure {

class AuditLogFs : public domain::IAuditLog {
public:
    AuditLogFs(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    void append(const domain::EventAuditRecord& record) override;

    /// Flushes pending writes, then reads the whole log. Malformed lines are skipped.
    std::vector<domain::EventAuditRecord> readAll() override;

private:
    std::string getLogFilePath() const;

    std::string m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace glucosetrail::infrastructure
