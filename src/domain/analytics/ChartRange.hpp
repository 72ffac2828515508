/**
 * @file ChartRange.hpp
 * @brief The canonical set of chart/TIR durations and its parser.
 */

#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>

namespace glucosetrail::domain {

/// The only accepted duration selectors, in hours.
constexpr std::array<int, 6> kAllowedChartRangeHours = {1, 3, 5, 8, 12, 24};

/**
 * @brief Parses a selector such as "3" or " 12 ".
 *
 * Surrounding whitespace and a leading '+' are tolerated; anything that is not an
 * integer from the allow-list yields std::nullopt.
 */
std::optional<std::chrono::hours> ParseChartRange(const std::string& selector);

} // namespace glucosetrail::domain
