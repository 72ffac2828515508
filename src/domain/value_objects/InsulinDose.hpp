/**
 * @file InsulinDose.hpp
 * @brief Value Object for an insulin dose in units.
 */

#pragma once

#include <string>

#include "domain/DomainErrors.hpp"

namespace glucosetrail::domain {

/**
 * @class InsulinDose
 * @brief Dose in 0.5 U steps between 0 and 100 U inclusive.
 *
 * Stored as an integer count of half units so comparisons and formatting are exact.
 */
class InsulinDose {
public:
    static constexpr int kMaxHalfUnits = 200;

    /**
     * @brief Validates a decimal literal such as "4.5", "10", "10.50".
     *
     * Parsing is done on the digits, never through floating point, so "10.25" is
     * rejected and "100.0" accepted regardless of binary representation.
     */
    static Result<InsulinDose> parse(const std::string& units);

    int halfUnits() const { return m_halfUnits; }
    double units() const { return m_halfUnits / 2.0; }

    /// "4.5", "10", "0".
    std::string formatUnits() const;

    /// "4.5U".
    std::string toString() const { return formatUnits() + "U"; }

    bool operator==(const InsulinDose& other) const { return m_halfUnits == other.m_halfUnits; }
    bool operator!=(const InsulinDose& other) const { return !(*this == other); }

private:
    explicit InsulinDose(int halfUnits) : m_halfUnits(halfUnits) {}

    int m_halfUnits;
};

} // namespace glucosetrail::domain
