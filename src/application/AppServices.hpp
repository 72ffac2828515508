/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ChartService.hpp"
#include "application/EventHistoryService.hpp"
#include "application/EventLoggingService.hpp"
#include "application/OutcomeService.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace glucosetrail::application {

struct AppServices {
    std::unique_ptr<EventLoggingService> loggingService;
    std::unique_ptr<EventHistoryService> historyService;
    std::unique_ptr<OutcomeService> outcomeService;
    std::unique_ptr<ChartService> chartService;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
};

} // namespace glucosetrail::application
