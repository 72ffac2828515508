#include "domain/analytics/ChartRange.hpp"

#include <algorithm>
#include <cctype>

#include "domain/common/Text.hpp"

namespace glucosetrail::domain {

std::optional<std::chrono::hours> ParseChartRange(const std::string& selector) {
    std::string digits = text::Trim(selector);
    if (!digits.empty() && digits.front() == '+') {
        digits.erase(0, 1);
    }
    if (digits.empty() || digits.size() > 4) {
        return std::nullopt;
    }
    int hours = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hours = hours * 10 + (c - '0');
    }
    if (std::find(kAllowedChartRangeHours.begin(), kAllowedChartRangeHours.end(), hours) == kAllowedChartRangeHours.end()) {
        return std::nullopt;
    }
    return std::chrono::hours(hours);
}

} // namespace glucosetrail::domain
