/**
 * @file EventSummaries.cpp
 * @brief Implementation of the tooltip and history summarisers.
 */

#include "domain/analytics/EventSummaries.hpp"

#include <type_traits>

#include "domain/common/Text.hpp"

namespace glucosetrail::domain {

namespace {
template <typename>
inline constexpr bool kAlwaysFalse = false;

std::string insulinLabel(const InsulinDetails& d) {
    return d.dose.formatUnits() + "U " + InsulinTypeToString(d.insulinType);
}
}

std::string ChartTooltip(const Event& event) {
    return std::visit([](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FoodDetails>) {
            return std::to_string(d.carbohydrates.grams()) + "g carbs";
        } else if constexpr (std::is_same_v<T, InsulinDetails>) {
            return insulinLabel(d);
        } else if constexpr (std::is_same_v<T, ExerciseDetails>) {
            return std::to_string(d.duration.minutes()) + "min exercise";
        } else if constexpr (std::is_same_v<T, NoteDetails>) {
            return text::Ellipsize(d.text.text(), kTooltipNoteThreshold, kTooltipNoteKeep);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled event variant");
        }
    }, event.getDetails());
}

std::string HistorySummary(const Event& event) {
    return std::visit([](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FoodDetails>) {
            return std::to_string(d.carbohydrates.grams()) + "g carbs";
        } else if constexpr (std::is_same_v<T, InsulinDetails>) {
            return insulinLabel(d);
        } else if constexpr (std::is_same_v<T, ExerciseDetails>) {
            return std::to_string(d.duration.minutes()) + "min";
        } else if constexpr (std::is_same_v<T, NoteDetails>) {
            return text::Ellipsize(d.text.text(), kHistoryNoteThreshold, kHistoryNoteKeep);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled event variant");
        }
    }, event.getDetails());
}

} // namespace glucosetrail::domain
