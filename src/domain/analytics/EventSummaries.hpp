/**
 * @file EventSummaries.hpp
 * @brief Short per-variant text shown next to an event.
 *
 * Chart tooltips and history rows have different space budgets, so they are two
 * separate functions with their own note thresholds and exercise wording.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/events/Event.hpp"

namespace glucosetrail::domain {

/// Chart overlay: notes over 30 code points become 27 + "...".
constexpr std::size_t kTooltipNoteThreshold = 30;
constexpr std::size_t kTooltipNoteKeep = 27;

/// History list: notes over 50 code points become 47 + "...".
constexpr std::size_t kHistoryNoteThreshold = 50;
constexpr std::size_t kHistoryNoteKeep = 47;

/** @brief "45g carbs", "4.5U Fast", "30min exercise", or the (shortened) note. */
std::string ChartTooltip(const Event& event);

/** @brief "45g carbs", "4.5U Fast", "30min", or the (shortened) note. */
std::string HistorySummary(const Event& event);

} // namespace glucosetrail::domain
