/**
 * @file DexcomGlucoseSource.cpp
 * @brief Implementation of DexcomGlucoseSource.
 */

#include "infrastructure/DexcomGlucoseSource.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include "domain/DomainErrors.hpp"
#include "domain/common/TimeFormat.hpp"

namespace glucosetrail::infrastructure {

using json = nlohmann::json;
using namespace glucosetrail::domain;

namespace {

constexpr const char* kEgvPath = "/v3/users/self/egvs";

Error dexcomError(const std::string& code, const std::string& message) {
    return {"Dexcom." + code, message, ErrorKind::UpstreamFailure};
}

} // namespace

DexcomGlucoseSource::DexcomGlucoseSource(DexcomSettings settings)
    : m_settings(std::move(settings)) {}

std::string DexcomGlucoseSource::BuildRequestPath(Timestamp start, Timestamp end) {
    return std::string(kEgvPath) + "?startDate=" + FormatIso8601NoZone(start)
         + "&endDate=" + FormatIso8601NoZone(end);
}

Result<std::vector<GlucoseReading>> DexcomGlucoseSource::ParseReadings(const std::string& body) {
    std::vector<GlucoseReading> readings;
    try {
        auto j = json::parse(body);
        if (!j.contains("records") || !j["records"].is_array()) {
            return dexcomError("InvalidResponse", "Response has no records array.");
        }
        for (const auto& item : j["records"]) {
            if (!item.contains("value") || !item["value"].is_number()) continue;

            auto systemTime = ParseIso8601(item.at("systemTime").get<std::string>());
            if (!systemTime) {
                return dexcomError("InvalidResponse", "Unreadable systemTime in response.");
            }

            GlucoseReading reading;
            reading.systemTime = *systemTime;
            reading.valueMgDl = item["value"].get<int>();
            if (item.contains("trend") && item["trend"].is_string()) {
                reading.trend = item["trend"].get<std::string>();
            }
            readings.push_back(std::move(reading));
        }
    } catch (const json::exception& e) {
        std::cerr << "[DexcomGlucoseSource] JSON Parse Error: " << e.what() << std::endl;
        return dexcomError("InvalidResponse", "Failed to deserialize API response.");
    }
    return readings;
}

Result<std::vector<GlucoseReading>> DexcomGlucoseSource::getReadingsInRange(const UserId& userId,
                                                                           Timestamp start,
                                                                           Timestamp end,
                                                                           const CancellationToken& token) {
    if (m_settings.accessToken.empty()) {
        std::cerr << "[DexcomGlucoseSource] No Dexcom link for user " << userId.value() << std::endl;
        return std::vector<GlucoseReading>{};
    }
    if (start >= end) {
        return dexcomError("InvalidDateRange", "Start time must be before end time.");
    }
    if (token.isCancellationRequested()) {
        return errors::RequestCancelled();
    }

    httplib::Client cli(m_settings.baseUrl);
    if (!cli.is_valid()) {
        std::cerr << "[DexcomGlucoseSource] Unsupported base URL: " << m_settings.baseUrl << std::endl;
        return dexcomError("NetworkError", "Failed to connect to Dexcom API.");
    }
    cli.set_connection_timeout(m_settings.timeoutSeconds);
    cli.set_read_timeout(m_settings.timeoutSeconds);

    httplib::Headers headers = {{"Authorization", "Bearer " + m_settings.accessToken}};

    // Returning false from either callback aborts the transfer with Error::Canceled.
    std::string body;
    auto res = cli.Get(
        BuildRequestPath(start, end), headers,
        [&](const char* data, size_t length) {
            body.append(data, length);
            return !token.isCancellationRequested();
        },
        [&](uint64_t, uint64_t) { return !token.isCancellationRequested(); });

    if (token.isCancellationRequested() || (!res && res.error() == httplib::Error::Canceled)) {
        std::cerr << "[DexcomGlucoseSource] Request cancelled." << std::endl;
        return errors::RequestCancelled();
    }
    if (!res) {
        std::cerr << "[DexcomGlucoseSource] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return dexcomError("NetworkError", "Failed to connect to Dexcom API.");
    }
    if (res->status == 429) {
        std::string retryAfter = res->has_header("Retry-After") ? res->get_header_value("Retry-After") : "60";
        std::cerr << "[DexcomGlucoseSource] Rate limited, retry after " << retryAfter << "s" << std::endl;
        return dexcomError("RateLimited", "Rate limit exceeded. Retry after " + retryAfter + " seconds.");
    }
    if (res->status == 401) {
        std::cerr << "[DexcomGlucoseSource] Unauthorized. Token may be expired." << std::endl;
        return dexcomError("Unauthorized", "Access token is invalid or expired.");
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[DexcomGlucoseSource] HTTP Error " << res->status << ": " << body << std::endl;
        return dexcomError("ApiError", "API returned status " + std::to_string(res->status) + ".");
    }

    auto parsed = ParseReadings(body);
    if (parsed.isFailure()) return parsed;

    std::vector<GlucoseReading> inWindow;
    for (auto& reading : parsed.value()) {
        if (reading.systemTime >= start && reading.systemTime <= end) {
            inWindow.push_back(std::move(reading));
        }
    }
    std::cerr << "[DexcomGlucoseSource] Retrieved " << inWindow.size() << " readings." << std::endl;
    return inWindow;
}

} // namespace glucosetrail::infrastructure
