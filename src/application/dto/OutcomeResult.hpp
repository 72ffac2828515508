/**
 * @file OutcomeResult.hpp
 * @brief Result of matching a food event with its two-hour glucose reading.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/common/Clock.hpp"

namespace glucosetrail::application {

using domain::Timestamp;

struct OutcomeResult {
    std::string eventId;
    Timestamp targetTime;
    Timestamp readingTime;          ///< Equals targetTime when no reading was found.
    std::optional<int> glucoseValue;
    bool isApproximate = false;     ///< True iff no reading was found.
    std::string message;
};

} // namespace glucosetrail::application
