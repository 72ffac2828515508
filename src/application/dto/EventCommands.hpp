/**
 * @file EventCommands.hpp
 * @brief Raw inputs for logging events, validated by EventLoggingService.
 *
 * Correlation and causation ids are optional; fresh ones are generated when absent.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/common/Clock.hpp"
#include "domain/events/EventEnums.hpp"

namespace glucosetrail::application {

using domain::Timestamp;

struct CommandTrace {
    std::optional<std::string> correlationId;
    std::optional<std::string> causationId;
};

struct AddFoodCommand {
    std::string userId;
    Timestamp eventTime;
    int carbohydrateGrams = 0;
    int mealTagId = 0;
    domain::AbsorptionHint absorptionHint = domain::AbsorptionHint::Normal;
    std::optional<std::string> note;
    CommandTrace trace;
};

struct AddInsulinCommand {
    std::string userId;
    Timestamp eventTime;
    domain::InsulinType insulinType = domain::InsulinType::Fast;
    std::string insulinUnits;       ///< Decimal literal, e.g. "4.5".
    std::optional<std::string> preparation;
    std::optional<std::string> delivery;
    std::optional<std::string> timing;
    std::optional<std::string> note;
    CommandTrace trace;
};

struct AddExerciseCommand {
    std::string userId;
    Timestamp eventTime;
    int exerciseTypeId = 0;
    int durationMinutes = 0;
    domain::IntensityType intensity = domain::IntensityType::Moderate;
    std::optional<std::string> note;
    CommandTrace trace;
};

struct AddNoteCommand {
    std::string userId;
    Timestamp eventTime;
    std::string text;
    CommandTrace trace;
};

} // namespace glucosetrail::application
