/**
 * @file DomainErrors.hpp
 * @brief Catalogue of the errors the domain and its query services can return.
 *
 * Codes are stable identifiers; callers branch on them (or on ErrorKind), never on messages.
 */

#pragma once

#include "domain/common/Result.hpp"

namespace glucosetrail::domain::errors {

// --- Value objects and event construction ---

inline Error EventInFuture() {
    return {"Event.EventInFuture", "Event time cannot be in the future.", ErrorKind::FutureTimestamp};
}

inline Error InvalidCarbohydrates() {
    return {"Event.InvalidCarbohydrates", "Carbohydrates must be between 0 and 300 grams.", ErrorKind::InvalidInput};
}

inline Error InvalidInsulinDose() {
    return {"Event.InvalidInsulinDose", "Insulin dose must be between 0 and 100 units in 0.5 increments.", ErrorKind::InvalidInput};
}

inline Error InvalidExerciseDuration() {
    return {"Event.InvalidExerciseDuration", "Exercise duration must be between 1 and 300 minutes.", ErrorKind::InvalidInput};
}

inline Error InvalidNoteText() {
    return {"Event.InvalidNoteText", "Note text must be between 1 and 500 characters.", ErrorKind::InvalidInput};
}

inline Error InvalidInsulinDetail() {
    return {"Event.InvalidInsulinDetail", "Insulin preparation, delivery and timing must be at most 200 characters.", ErrorKind::InvalidInput};
}

/// Lookup ids (meal tag, exercise type) and user ids must be present and positive.
inline Error InvalidReference(const std::string& detail) {
    return {"Event.InvalidReference", detail, ErrorKind::InvalidInput};
}

inline Error InvalidTirRange() {
    return {"User.InvalidTirRange",
            "TIR range lower bound must be less than upper bound, and both must be between 0 and 1000.",
            ErrorKind::InvalidInput};
}

// --- Queries ---

inline Error EventNotFound() {
    return {"Event.NotFound", "Event not found.", ErrorKind::NotFound};
}

inline Error Forbidden() {
    return {"Authorization.Forbidden", "User does not own this event.", ErrorKind::Forbidden};
}

inline Error OutcomeRequiresFoodEvent() {
    return {"Event.InvalidType", "Event outcome is only available for food events.", ErrorKind::InvalidType};
}

inline Error InvalidChartRange() {
    return {"Chart.InvalidRange", "Range must be one of: 1, 3, 5, 8, 12, 24 hours.", ErrorKind::InvalidRange};
}

inline Error InvalidPaging() {
    return {"Events.InvalidPaging", "Page must be at least 1 and page size between 1 and 100.", ErrorKind::InvalidInput};
}

inline Error InvalidDateRange() {
    return {"Events.InvalidDateRange", "From date must be before or equal to To date.", ErrorKind::InvalidInput};
}

inline Error RequestCancelled() {
    return {"Request.Cancelled", "The request was cancelled.", ErrorKind::Cancelled};
}

inline Error EventStoreFailure(const std::string& detail) {
    return {"EventStore.Error", "Event store failure: " + detail, ErrorKind::UpstreamFailure};
}

} // namespace glucosetrail::domain::errors
