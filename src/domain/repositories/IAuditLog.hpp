/**
 * @file IAuditLog.hpp
 * @brief Append-only sink for audit records raised by aggregate construction.
 */

#pragma once

#include <vector>

#include "domain/events/EventAuditRecords.hpp"

namespace glucosetrail::domain {

class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    virtual void append(const EventAuditRecord& record) = 0;

    virtual std::vector<EventAuditRecord> readAll() = 0;
};

} // namespace glucosetrail::domain
