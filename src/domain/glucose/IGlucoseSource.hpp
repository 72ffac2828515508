/**
 * @file IGlucoseSource.hpp
 * @brief Interface to the external CGM data provider.
 */

#pragma once

#include <vector>

#include "domain/common/CancellationToken.hpp"
#include "domain/common/Result.hpp"
#include "domain/glucose/GlucoseReading.hpp"
#include "domain/value_objects/UserId.hpp"

namespace glucosetrail::domain {

class IGlucoseSource {
public:
    virtual ~IGlucoseSource() = default;

    /**
     * @brief Readings with start <= systemTime <= end, in any order.
     *
     * Implementations own retries and timeouts. Errors are returned as-is to the caller;
     * a user without a linked device yields an empty list, not an error.
     */
    virtual Result<std::vector<GlucoseReading>> getReadingsInRange(const UserId& userId,
                                                                   Timestamp start,
                                                                   Timestamp end,
                                                                   const CancellationToken& token) = 0;
};

} // namespace glucosetrail::domain
