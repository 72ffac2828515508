/**
 * @file Text.hpp
 * @brief Small string helpers shared by value objects and summaries.
 *
 * Lengths are measured in Unicode code points of UTF-8 input, so a note written in
 * Portuguese or with emoji is limited by what the user typed rather than by bytes.
 */

#pragma once

#include <cstddef>
#include <string>

namespace glucosetrail::domain::text {

/** @brief Removes leading and trailing whitespace, including Unicode spaces such as U+00A0. */
std::string Trim(const std::string& value);

/** @brief True if @p value is empty or only whitespace. */
bool IsBlank(const std::string& value);

/** @brief True if @p value is well-formed UTF-8 (no stray, truncated or overlong sequences). */
bool IsValidUtf8(const std::string& value);

/**
 * @brief Number of code points in a UTF-8 string (continuation bytes are not counted).
 *
 * Only meaningful for input that passed IsValidUtf8.
 */
std::size_t Utf8Length(const std::string& value);

/** @brief The first @p count code points of @p value. */
std::string Utf8Prefix(const std::string& value, std::size_t count);

/**
 * @brief Shortens @p value to @p keep code points plus "..." when it is longer than @p threshold.
 * @return The original string when it fits.
 */
std::string Ellipsize(const std::string& value, std::size_t threshold, std::size_t keep);

} // namespace glucosetrail::domain::text
