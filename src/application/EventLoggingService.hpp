/**
 * @file EventLoggingService.hpp
 * @brief Application Service turning raw user input into stored, audited events.
 */

#pragma once

#include <memory>
#include <string>

#include "application/dto/EventCommands.hpp"
#include "domain/common/Clock.hpp"
#include "domain/repositories/IAuditLog.hpp"
#include "domain/repositories/IEventRepository.hpp"

namespace glucosetrail::application {

/**
 * @class EventLoggingService
 *
 * Each command validates its inputs into value objects, creates the event through the
 * aggregate factory, stores it and appends the single audit record it raised.
 * On success the new event id is returned.
 */
class EventLoggingService {
public:
    EventLoggingService(std::shared_ptr<domain::IEventRepository> events,
                        std::shared_ptr<domain::IAuditLog> auditLog,
                        std::shared_ptr<const domain::IClock> clock,
                        domain::SourceType source = domain::SourceType::Manual);

    domain::Result<std::string> addFood(const AddFoodCommand& command);
    domain::Result<std::string> addInsulin(const AddInsulinCommand& command);
    domain::Result<std::string> addExercise(const AddExerciseCommand& command);
    domain::Result<std::string> addNote(const AddNoteCommand& command);

private:
    domain::Result<std::string> commit(const domain::EventCreation& creation);

    std::shared_ptr<domain::IEventRepository> m_events;
    std::shared_ptr<domain::IAuditLog> m_auditLog;
    std::shared_ptr<const domain::IClock> m_clock;
    domain::SourceType m_source;
};

} // namespace glucosetrail::application
