/**
 * @file Event.cpp
 * @brief Factories and audit flattening for the Event aggregate.
 */

#include "domain/events/Event.hpp"

#include <type_traits>

#include "domain/DomainErrors.hpp"
#include "domain/common/Text.hpp"
#include "domain/common/Uuid.hpp"

namespace glucosetrail::domain {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

std::optional<std::string> noteTextOf(const std::optional<NoteText>& note) {
    if (!note) return std::nullopt;
    return note->text();
}

bool detailInvalid(const std::optional<std::string>& value) {
    if (!value) return false;
    return !text::IsValidUtf8(*value) || text::Utf8Length(*value) > InsulinDetails::kMaxDetailLength;
}

Result<EventCreation> finishCreation(Event event, Timestamp now, const Event::Trace& trace) {
    EventAuditRecord audit = MakeCreationRecord(event, now, trace);
    return EventCreation{std::move(event), std::move(audit)};
}

} // namespace

Event::Event(std::string id,
             UserId userId,
             Timestamp eventTime,
             Timestamp createdAt,
             SourceType source,
             std::optional<NoteText> note,
             EventDetails details)
    : m_id(std::move(id)),
      m_userId(std::move(userId)),
      m_eventTime(eventTime),
      m_createdAt(createdAt),
      m_source(source),
      m_note(std::move(note)),
      m_details(std::move(details)) {}

std::optional<Error> Event::validateEventTime(Timestamp eventTime, const IClock& clock) {
    if (eventTime > clock.now()) {
        return errors::EventInFuture();
    }
    return std::nullopt;
}

EventType Event::getType() const {
    return std::visit([](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FoodDetails>) return EventType::Food;
        else if constexpr (std::is_same_v<T, InsulinDetails>) return EventType::Insulin;
        else if constexpr (std::is_same_v<T, ExerciseDetails>) return EventType::Exercise;
        else if constexpr (std::is_same_v<T, NoteDetails>) return EventType::Note;
        else static_assert(kAlwaysFalse<T>, "unhandled event variant");
    }, m_details);
}

Result<EventCreation> Event::createFood(const UserId& userId,
                                        Timestamp eventTime,
                                        Carbohydrate carbohydrates,
                                        MealTagId mealTag,
                                        AbsorptionHint absorptionHint,
                                        std::optional<NoteText> note,
                                        SourceType source,
                                        const IClock& clock,
                                        const Trace& trace) {
    if (auto error = validateEventTime(eventTime, clock)) {
        return *error;
    }

    Timestamp now = clock.now();
    Event event(NewUuid(), userId, eventTime, now, source, std::move(note),
                FoodDetails{carbohydrates, mealTag, absorptionHint});
    return finishCreation(std::move(event), now, trace);
}

Result<EventCreation> Event::createInsulin(const UserId& userId,
                                           Timestamp eventTime,
                                           InsulinType insulinType,
                                           InsulinDose dose,
                                           std::optional<std::string> preparation,
                                           std::optional<std::string> delivery,
                                           std::optional<std::string> timing,
                                           std::optional<NoteText> note,
                                           SourceType source,
                                           const IClock& clock,
                                           const Trace& trace) {
    if (auto error = validateEventTime(eventTime, clock)) {
        return *error;
    }
    if (detailInvalid(preparation) || detailInvalid(delivery) || detailInvalid(timing)) {
        return errors::InvalidInsulinDetail();
    }

    Timestamp now = clock.now();
    Event event(NewUuid(), userId, eventTime, now, source, std::move(note),
                InsulinDetails{insulinType, dose, std::move(preparation), std::move(delivery), std::move(timing)});
    return finishCreation(std::move(event), now, trace);
}

Result<EventCreation> Event::createExercise(const UserId& userId,
                                            Timestamp eventTime,
                                            ExerciseTypeId exerciseType,
                                            ExerciseDuration duration,
                                            IntensityType intensity,
                                            std::optional<NoteText> note,
                                            SourceType source,
                                            const IClock& clock,
                                            const Trace& trace) {
    if (auto error = validateEventTime(eventTime, clock)) {
        return *error;
    }

    Timestamp now = clock.now();
    Event event(NewUuid(), userId, eventTime, now, source, std::move(note),
                ExerciseDetails{exerciseType, duration, intensity});
    return finishCreation(std::move(event), now, trace);
}

Result<EventCreation> Event::createNote(const UserId& userId,
                                        Timestamp eventTime,
                                        NoteText text,
                                        SourceType source,
                                        const IClock& clock,
                                        const Trace& trace) {
    if (auto error = validateEventTime(eventTime, clock)) {
        return *error;
    }

    Timestamp now = clock.now();
    Event event(NewUuid(), userId, eventTime, now, source, std::nullopt,
                NoteDetails{std::move(text)});
    return finishCreation(std::move(event), now, trace);
}

Event Event::rehydrate(std::string id,
                       UserId userId,
                       Timestamp eventTime,
                       Timestamp createdAt,
                       SourceType source,
                       std::optional<NoteText> note,
                       EventDetails details) {
    if (std::holds_alternative<NoteDetails>(details)) {
        note.reset();
    }
    return Event(std::move(id), std::move(userId), eventTime, createdAt, source,
                 std::move(note), std::move(details));
}

EventAuditRecord MakeCreationRecord(const Event& event, Timestamp occurredAt, const Event::Trace& trace) {
    return std::visit([&](const auto& d) -> EventAuditRecord {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FoodDetails>) {
            FoodEventCreated r;
            r.carbohydrateGrams = d.carbohydrates.grams();
            r.mealTagId = d.mealTag.value();
            r.absorptionHint = d.absorptionHint;
            r.note = noteTextOf(event.getNote());
            r.recordId = NewUuid();
            r.occurredAt = occurredAt;
            r.correlationId = trace.correlationId;
            r.causationId = trace.causationId;
            r.eventId = event.getId();
            r.userId = event.getUserId().value();
            r.eventTime = event.getEventTime();
            return r;
        }
        else if constexpr (std::is_same_v<T, InsulinDetails>) {
            InsulinEventCreated r;
            r.insulinType = d.insulinType;
            r.doseUnits = d.dose.units();
            r.preparation = d.preparation;
            r.delivery = d.delivery;
            r.timing = d.timing;
            r.note = noteTextOf(event.getNote());
            r.recordId = NewUuid();
            r.occurredAt = occurredAt;
            r.correlationId = trace.correlationId;
            r.causationId = trace.causationId;
            r.eventId = event.getId();
            r.userId = event.getUserId().value();
            r.eventTime = event.getEventTime();
            return r;
        }
        else if constexpr (std::is_same_v<T, ExerciseDetails>) {
            ExerciseEventCreated r;
            r.exerciseTypeId = d.exerciseType.value();
            r.durationMinutes = d.duration.minutes();
            r.intensity = d.intensity;
            r.note = noteTextOf(event.getNote());
            r.recordId = NewUuid();
            r.occurredAt = occurredAt;
            r.correlationId = trace.correlationId;
            r.causationId = trace.causationId;
            r.eventId = event.getId();
            r.userId = event.getUserId().value();
            r.eventTime = event.getEventTime();
            return r;
        }
        else if constexpr (std::is_same_v<T, NoteDetails>) {
            NoteEventCreated r;
            r.text = d.text.text();
            r.recordId = NewUuid();
            r.occurredAt = occurredAt;
            r.correlationId = trace.correlationId;
            r.causationId = trace.causationId;
            r.eventId = event.getId();
            r.userId = event.getUserId().value();
            r.eventTime = event.getEventTime();
            return r;
        }
        else {
            static_assert(kAlwaysFalse<T>, "unhandled event variant");
        }
    }, event.getDetails());
}

} // namespace glucosetrail::domain
