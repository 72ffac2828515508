/**
 * @file TimeFormat.hpp
 * @brief ISO-8601 conversions for timestamps crossing a process boundary (files, HTTP, CLI).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/common/Clock.hpp"

namespace glucosetrail::domain {

/** @brief Formats as "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds). */
std::string FormatIso8601(Timestamp ts);

/** @brief Formats as "YYYY-MM-DDTHH:MM:SS" in UTC without a zone suffix (Dexcom query style). */
std::string FormatIso8601NoZone(Timestamp ts);

/**
 * @brief Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm|-hh:mm]".
 *
 * A missing zone designator is read as UTC.
 * @return std::nullopt if the text is malformed.
 */
std::optional<Timestamp> ParseIso8601(const std::string& text);

std::int64_t ToEpochMillis(Timestamp ts);
Timestamp FromEpochMillis(std::int64_t millis);

} // namespace glucosetrail::domain
