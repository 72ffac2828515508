/**
 * @file EventJson.hpp
 * @brief JSON mapping for events and audit records as they are stored on disk.
 *
 * Timestamps are written as Unix epoch milliseconds. Readers throw std::runtime_error
 * on documents that do not describe a valid event.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/events/Event.hpp"
#include "domain/events/EventAuditRecords.hpp"

namespace glucosetrail::infrastructure {

nlohmann::json EventToJson(const domain::Event& event);
domain::Event EventFromJson(const nlohmann::json& j);

/// {"type": "<RecordType>", "data": {...}, "ts": <occurredAt ms>}
nlohmann::json AuditRecordToJson(const domain::EventAuditRecord& record);
domain::EventAuditRecord AuditRecordFromJson(const nlohmann::json& j);

} // namespace glucosetrail::infrastructure
