/**
 * @file EventLoggingService.cpp
 * @brief Implementation of EventLoggingService.
 */

#include "application/EventLoggingService.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

#include "domain/DomainErrors.hpp"
#include "domain/common/Uuid.hpp"

namespace glucosetrail::application {

using namespace glucosetrail::domain;

namespace {

Event::Trace resolveTrace(const CommandTrace& trace) {
    std::string correlation = trace.correlationId.value_or(NewUuid());
    std::string causation = trace.causationId.value_or(correlation);
    return Event::Trace{correlation, causation};
}

Result<UserId> resolveUser(const std::string& userId) {
    if (userId.empty()) {
        return errors::InvalidReference("User id is required.");
    }
    return UserId::create(userId);
}

/// A note that was typed must be valid; an empty or blank one is simply absent.
Result<std::optional<NoteText>> resolveNote(const std::optional<std::string>& raw) {
    if (!raw) {
        return std::optional<NoteText>();
    }
    return NoteText::createOptional(*raw);
}

} // namespace

EventLoggingService::EventLoggingService(std::shared_ptr<IEventRepository> events,
                                         std::shared_ptr<IAuditLog> auditLog,
                                         std::shared_ptr<const IClock> clock,
                                         SourceType source)
    : m_events(std::move(events)),
      m_auditLog(std::move(auditLog)),
      m_clock(std::move(clock)),
      m_source(source) {}

Result<std::string> EventLoggingService::addFood(const AddFoodCommand& command) {
    auto user = resolveUser(command.userId);
    if (user.isFailure()) return user.error();

    auto carbs = Carbohydrate::create(command.carbohydrateGrams);
    if (carbs.isFailure()) return carbs.error();

    if (command.mealTagId <= 0) {
        return errors::InvalidReference("Meal tag id must be positive.");
    }

    auto note = resolveNote(command.note);
    if (note.isFailure()) return note.error();

    auto created = Event::createFood(user.value(), command.eventTime, carbs.value(),
                                     MealTagId::create(command.mealTagId), command.absorptionHint,
                                     note.value(), m_source, *m_clock, resolveTrace(command.trace));
    if (created.isFailure()) return created.error();
    return commit(created.value());
}

Result<std::string> EventLoggingService::addInsulin(const AddInsulinCommand& command) {
    auto user = resolveUser(command.userId);
    if (user.isFailure()) return user.error();

    auto dose = InsulinDose::parse(command.insulinUnits);
    if (dose.isFailure()) return dose.error();

    auto note = resolveNote(command.note);
    if (note.isFailure()) return note.error();

    auto created = Event::createInsulin(user.value(), command.eventTime, command.insulinType, dose.value(),
                                        command.preparation, command.delivery, command.timing,
                                        note.value(), m_source, *m_clock, resolveTrace(command.trace));
    if (created.isFailure()) return created.error();
    return commit(created.value());
}

Result<std::string> EventLoggingService::addExercise(const AddExerciseCommand& command) {
    auto user = resolveUser(command.userId);
    if (user.isFailure()) return user.error();

    auto duration = ExerciseDuration::create(command.durationMinutes);
    if (duration.isFailure()) return duration.error();

    if (command.exerciseTypeId <= 0) {
        return errors::InvalidReference("Exercise type id must be positive.");
    }

    auto note = resolveNote(command.note);
    if (note.isFailure()) return note.error();

    auto created = Event::createExercise(user.value(), command.eventTime,
                                         ExerciseTypeId::create(command.exerciseTypeId), duration.value(),
                                         command.intensity, note.value(), m_source, *m_clock,
                                         resolveTrace(command.trace));
    if (created.isFailure()) return created.error();
    return commit(created.value());
}

Result<std::string> EventLoggingService::addNote(const AddNoteCommand& command) {
    auto user = resolveUser(command.userId);
    if (user.isFailure()) return user.error();

    auto text = NoteText::create(command.text);
    if (text.isFailure()) return text.error();

    auto created = Event::createNote(user.value(), command.eventTime, text.value(), m_source, *m_clock,
                                     resolveTrace(command.trace));
    if (created.isFailure()) return created.error();
    return commit(created.value());
}

Result<std::string> EventLoggingService::commit(const EventCreation& creation) {
    const Event& event = creation.event;
    try {
        m_events->add(event);
        m_auditLog->append(creation.audit);
    } catch (const std::exception& e) {
        std::cerr << "[EventLoggingService] Failed to store event " << event.getId() << ": " << e.what() << std::endl;
        return errors::EventStoreFailure(e.what());
    }
    std::cerr << "[EventLoggingService] Logged " << EventTypeToString(event.getType())
              << " event " << event.getId() << std::endl;
    return event.getId();
}

} // namespace glucosetrail::application
