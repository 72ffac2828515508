/**
 * @file InsulinDose.cpp
 * @brief Exact validation of insulin doses.
 */

#include "domain/value_objects/InsulinDose.hpp"

#include <cctype>

#include "domain/common/Text.hpp"

namespace glucosetrail::domain {

Result<InsulinDose> InsulinDose::parse(const std::string& units) {
    const std::string literal = text::Trim(units);
    std::size_t pos = 0;
    if (pos < literal.size() && literal[pos] == '+') {
        ++pos;
    }

    // Integer part. More than three significant digits is out of range anyway.
    long integerPart = 0;
    std::size_t integerDigits = 0;
    while (pos < literal.size() && std::isdigit(static_cast<unsigned char>(literal[pos]))) {
        if (integerPart <= 1000) {
            integerPart = integerPart * 10 + (literal[pos] - '0');
        }
        ++integerDigits;
        ++pos;
    }

    std::string fraction;
    if (pos < literal.size() && literal[pos] == '.') {
        ++pos;
        while (pos < literal.size() && std::isdigit(static_cast<unsigned char>(literal[pos]))) {
            fraction.push_back(literal[pos]);
            ++pos;
        }
    }

    if (pos != literal.size() || (integerDigits == 0 && fraction.empty())) {
        return errors::InvalidInsulinDose();
    }

    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    // (units * 2) mod 1 == 0  <=>  the significant fraction is empty or exactly "5".
    int half = 0;
    if (fraction == "5") {
        half = 1;
    } else if (!fraction.empty()) {
        return errors::InvalidInsulinDose();
    }

    if (integerPart > 100 || (integerPart == 100 && half != 0)) {
        return errors::InvalidInsulinDose();
    }

    return InsulinDose(static_cast<int>(integerPart) * 2 + half);
}

std::string InsulinDose::formatUnits() const {
    std::string whole = std::to_string(m_halfUnits / 2);
    return (m_halfUnits % 2 == 0) ? whole : whole + ".5";
}

} // namespace glucosetrail::domain
