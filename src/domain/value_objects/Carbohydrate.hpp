/**
 * @file Carbohydrate.hpp
 * @brief Value Object for the carbohydrate content of a meal.
 */

#pragma once

#include <string>

#include "domain/DomainErrors.hpp"

namespace glucosetrail::domain {

/**
 * @class Carbohydrate
 * @brief Whole grams of carbohydrate.
 *
 * Invariant: 0 <= grams <= 300.
 */
class Carbohydrate {
public:
    static constexpr int kMinGrams = 0;
    static constexpr int kMaxGrams = 300;

    static Result<Carbohydrate> create(int grams) {
        if (grams < kMinGrams || grams > kMaxGrams) {
            return errors::InvalidCarbohydrates();
        }
        return Carbohydrate(grams);
    }

    int grams() const { return m_grams; }

    std::string toString() const { return std::to_string(m_grams) + "g"; }

    bool operator==(const Carbohydrate& other) const { return m_grams == other.m_grams; }
    bool operator!=(const Carbohydrate& other) const { return !(*this == other); }

private:
    explicit Carbohydrate(int grams) : m_grams(grams) {}

    int m_grams;
};

} // namespace glucosetrail::domain
