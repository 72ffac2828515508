/**
 * @file EventAuditRecords.hpp
 * @brief Audit records emitted once per event creation.
 *
 * Each record is a flat snapshot of scalars (ids as strings, enums, numbers, optional text)
 * so it can be serialised or shipped without touching the aggregate again.
 */

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "domain/common/Clock.hpp"
#include "domain/events/EventEnums.hpp"

namespace glucosetrail::domain {

struct FoodEventCreated {
    static constexpr const char* Type = "FoodEventCreated";
    std::string recordId;
    Timestamp occurredAt;
    std::string correlationId;
    std::string causationId;

    std::string eventId;
    std::string userId;
    Timestamp eventTime;
    int carbohydrateGrams = 0;
    int mealTagId = 0;
    AbsorptionHint absorptionHint = AbsorptionHint::Normal;
    std::optional<std::string> note;
};

struct InsulinEventCreated {
    static constexpr const char* Type = "InsulinEventCreated";
    std::string recordId;
    Timestamp occurredAt;
    std::string correlationId;
    std::string causationId;

    std::string eventId;
    std::string userId;
    Timestamp eventTime;
    InsulinType insulinType = InsulinType::Fast;
    double doseUnits = 0.0; // always a multiple of 0.5, exact in binary
    std::optional<std::string> preparation;
    std::optional<std::string> delivery;
    std::optional<std::string> timing;
    std::optional<std::string> note;
};

struct ExerciseEventCreated {
    static constexpr const char* Type = "ExerciseEventCreated";
    std::string recordId;
    Timestamp occurredAt;
    std::string correlationId;
    std::string causationId;

    std::string eventId;
    std::string userId;
    Timestamp eventTime;
    int exerciseTypeId = 0;
    int durationMinutes = 0;
    IntensityType intensity = IntensityType::Moderate;
    std::optional<std::string> note;
};

struct NoteEventCreated {
    static constexpr const char* Type = "NoteEventCreated";
    std::string recordId;
    Timestamp occurredAt;
    std::string correlationId;
    std::string causationId;

    std::string eventId;
    std::string userId;
    Timestamp eventTime;
    std::string text;
};

// variant for generic handling
using EventAuditRecord = std::variant<
    FoodEventCreated,
    InsulinEventCreated,
    ExerciseEventCreated,
    NoteEventCreated
>;

inline const char* AuditRecordType(const EventAuditRecord& record) {
    return std::visit([](const auto& r) { return std::decay_t<decltype(r)>::Type; }, record);
}

inline const std::string& AuditRecordEventId(const EventAuditRecord& record) {
    return std::visit([](const auto& r) -> const std::string& { return r.eventId; }, record);
}

} // namespace glucosetrail::domain
