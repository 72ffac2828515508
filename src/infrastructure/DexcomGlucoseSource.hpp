/**
 * @file DexcomGlucoseSource.hpp
 * @brief IGlucoseSource backed by the Dexcom v3 EGV REST endpoint.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/glucose/IGlucoseSource.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace glucosetrail::infrastructure {

/**
 * @class DexcomGlucoseSource
 * @brief GET /v3/users/self/egvs with a bearer token.
 *
 * An empty access token means the user has not linked a device: the source returns an
 * empty list instead of an error. HTTP failures map to Dexcom.* error codes.
 * https base URLs need cpp-httplib built with OpenSSL support.
 *
 * Cancelling the token aborts a transfer in flight as soon as more data arrives; a peer
 * that sends nothing at all is bounded by timeout_seconds.
 */
class DexcomGlucoseSource : public domain::IGlucoseSource {
public:
    explicit DexcomGlucoseSource(DexcomSettings settings);

    domain::Result<std::vector<domain::GlucoseReading>> getReadingsInRange(const domain::UserId& userId,
                                                                           domain::Timestamp start,
                                                                           domain::Timestamp end,
                                                                           const domain::CancellationToken& token) override;

    /**
     * @brief Parses an EGV response body ({"records": [{systemTime, value, trend, ...}]}).
     *
     * Records without a numeric value are dropped.
     * @return Dexcom.InvalidResponse if the body is not the expected shape.
     */
    static domain::Result<std::vector<domain::GlucoseReading>> ParseReadings(const std::string& body);

    /** @brief Request path for a window, e.g. /v3/users/self/egvs?startDate=...&endDate=... */
    static std::string BuildRequestPath(domain::Timestamp start, domain::Timestamp end);

private:
    DexcomSettings m_settings;
};

} // namespace glucosetrail::infrastructure
