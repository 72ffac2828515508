/**
 * @file ExerciseDuration.hpp
 * @brief Value Object for the length of an exercise session.
 */

#pragma once

#include <string>

#include "domain/DomainErrors.hpp"

namespace glucosetrail::domain {

/**
 * @class ExerciseDuration
 * Invariant: 1 <= minutes <= 300.
 */
class ExerciseDuration {
public:
    static constexpr int kMinMinutes = 1;
    static constexpr int kMaxMinutes = 300;

    static Result<ExerciseDuration> create(int minutes) {
        if (minutes < kMinMinutes || minutes > kMaxMinutes) {
            return errors::InvalidExerciseDuration();
        }
        return ExerciseDuration(minutes);
    }

    int minutes() const { return m_minutes; }

    std::string toString() const { return std::to_string(m_minutes) + " min"; }

    bool operator==(const ExerciseDuration& other) const { return m_minutes == other.m_minutes; }
    bool operator!=(const ExerciseDuration& other) const { return !(*this == other); }

private:
    explicit ExerciseDuration(int minutes) : m_minutes(minutes) {}

    int m_minutes;
};

} // namespace glucosetrail::domain
