/**
 * @file GlucoseReading.hpp
 * @brief One CGM sample. Owned by the glucose source, never persisted by this system.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/common/Clock.hpp"

namespace glucosetrail::domain {

struct GlucoseReading {
    Timestamp systemTime;
    int valueMgDl = 0;
    std::optional<std::string> trend; ///< e.g. "flat", "singleUp"; absent on some devices.
};

} // namespace glucosetrail::domain
