/**
 * @file LookupIds.hpp
 * @brief References into lookup tables owned outside the event model (meal tags, exercise types).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace glucosetrail::domain {

/**
 * @class MealTagId
 * @brief Positive id of a meal tag (breakfast, lunch, ...).
 *
 * A non-positive id is a caller bug, not user input, so it throws.
 */
class MealTagId {
public:
    static MealTagId create(int value) {
        if (value <= 0) {
            throw std::invalid_argument("MealTagId: Meal tag ID must be positive.");
        }
        return MealTagId(value);
    }

    int value() const { return m_value; }
    std::string toString() const { return std::to_string(m_value); }

    bool operator==(const MealTagId& other) const { return m_value == other.m_value; }
    bool operator!=(const MealTagId& other) const { return !(*this == other); }

private:
    explicit MealTagId(int value) : m_value(value) {}
    int m_value;
};

/**
 * @class ExerciseTypeId
 * @brief Positive id of an exercise type (running, cycling, ...).
 */
class ExerciseTypeId {
public:
    static ExerciseTypeId create(int value) {
        if (value <= 0) {
            throw std::invalid_argument("ExerciseTypeId: Exercise type ID must be positive.");
        }
        return ExerciseTypeId(value);
    }

    int value() const { return m_value; }
    std::string toString() const { return std::to_string(m_value); }

    bool operator==(const ExerciseTypeId& other) const { return m_value == other.m_value; }
    bool operator!=(const ExerciseTypeId& other) const { return !(*this == other); }

private:
    explicit ExerciseTypeId(int value) : m_value(value) {}
    int m_value;
};

} // namespace glucosetrail::domain
