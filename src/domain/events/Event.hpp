/**
 * @file Event.hpp
 * @brief Aggregate Root for a logged life event (food, insulin, exercise or note).
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "domain/common/Clock.hpp"
#include "domain/common/Result.hpp"
#include "domain/events/EventAuditRecords.hpp"
#include "domain/events/EventEnums.hpp"
#include "domain/value_objects/Carbohydrate.hpp"
#include "domain/value_objects/ExerciseDuration.hpp"
#include "domain/value_objects/InsulinDose.hpp"
#include "domain/value_objects/LookupIds.hpp"
#include "domain/value_objects/NoteText.hpp"
#include "domain/value_objects/UserId.hpp"

namespace glucosetrail::domain {

struct FoodDetails {
    Carbohydrate carbohydrates;
    MealTagId mealTag;
    AbsorptionHint absorptionHint;
};

struct InsulinDetails {
    static constexpr std::size_t kMaxDetailLength = 200;

    InsulinType insulinType;
    InsulinDose dose;
    std::optional<std::string> preparation;
    std::optional<std::string> delivery;
    std::optional<std::string> timing;
};

struct ExerciseDetails {
    ExerciseTypeId exerciseType;
    ExerciseDuration duration;
    IntensityType intensity;
};

struct NoteDetails {
    NoteText text;
};

/// Closed set of variants. Adding one breaks every exhaustive visit at compile time.
using EventDetails = std::variant<FoodDetails, InsulinDetails, ExerciseDetails, NoteDetails>;

struct EventCreation;

/**
 * @class Event
 * @brief Immutable record of something the user did, anchored at an instant.
 *
 * There is no state transition after creation: the aggregate exposes accessors only.
 * Two events are the same event iff their ids match, whatever their payloads.
 */
class Event {
public:
    /// Correlation and causation ids travel into the audit record untouched.
    struct Trace {
        std::string correlationId;
        std::string causationId;
    };

    static Result<EventCreation> createFood(const UserId& userId,
                                            Timestamp eventTime,
                                            Carbohydrate carbohydrates,
                                            MealTagId mealTag,
                                            AbsorptionHint absorptionHint,
                                            std::optional<NoteText> note,
                                            SourceType source,
                                            const IClock& clock,
                                            const Trace& trace);

    static Result<EventCreation> createInsulin(const UserId& userId,
                                               Timestamp eventTime,
                                               InsulinType insulinType,
                                               InsulinDose dose,
                                               std::optional<std::string> preparation,
                                               std::optional<std::string> delivery,
                                               std::optional<std::string> timing,
                                               std::optional<NoteText> note,
                                               SourceType source,
                                               const IClock& clock,
                                               const Trace& trace);

    static Result<EventCreation> createExercise(const UserId& userId,
                                                Timestamp eventTime,
                                                ExerciseTypeId exerciseType,
                                                ExerciseDuration duration,
                                                IntensityType intensity,
                                                std::optional<NoteText> note,
                                                SourceType source,
                                                const IClock& clock,
                                                const Trace& trace);

    /// The note text is the payload; the base note slot stays empty.
    static Result<EventCreation> createNote(const UserId& userId,
                                            Timestamp eventTime,
                                            NoteText text,
                                            SourceType source,
                                            const IClock& clock,
                                            const Trace& trace);

    /**
     * @brief Rebuilds a previously created event from storage.
     *
     * Skips the clock check (the event was valid when created) and emits nothing.
     */
    static Event rehydrate(std::string id,
                           UserId userId,
                           Timestamp eventTime,
                           Timestamp createdAt,
                           SourceType source,
                           std::optional<NoteText> note,
                           EventDetails details);

    // --- Accessors ---
    const std::string& getId() const { return m_id; }
    const UserId& getUserId() const { return m_userId; }
    Timestamp getEventTime() const { return m_eventTime; }
    Timestamp getCreatedAt() const { return m_createdAt; }
    SourceType getSource() const { return m_source; }
    const std::optional<NoteText>& getNote() const { return m_note; }
    const EventDetails& getDetails() const { return m_details; }
    EventType getType() const;

    template <typename T>
    const T* detailsAs() const { return std::get_if<T>(&m_details); }

    bool operator==(const Event& other) const { return m_id == other.m_id; }
    bool operator!=(const Event& other) const { return !(*this == other); }

private:
    Event(std::string id,
          UserId userId,
          Timestamp eventTime,
          Timestamp createdAt,
          SourceType source,
          std::optional<NoteText> note,
          EventDetails details);

    static std::optional<Error> validateEventTime(Timestamp eventTime, const IClock& clock);

    std::string m_id;
    UserId m_userId;
    Timestamp m_eventTime;
    Timestamp m_createdAt;
    SourceType m_source;
    std::optional<NoteText> m_note;
    EventDetails m_details;
};

/**
 * @struct EventCreation
 * @brief What a factory returns: the new aggregate and the single audit record it raised.
 */
struct EventCreation {
    Event event;
    EventAuditRecord audit;
};

/** @brief Builds the flattened audit snapshot for an event. */
EventAuditRecord MakeCreationRecord(const Event& event, Timestamp occurredAt, const Event::Trace& trace);

} // namespace glucosetrail::domain
