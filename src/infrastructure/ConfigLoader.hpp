/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access the data directory, the Dexcom connection and the
 * user's target range without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/value_objects/TirRange.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace glucosetrail::infrastructure {

struct DexcomSettings {
    std::string baseUrl = "https://sandbox-api.dexcom.com";
    std::string accessToken;    ///< Empty means no linked device.
    int timeoutSeconds = 30;
};

struct AppConfig {
    std::string dataDir = "glucosetrail-data";
    DexcomSettings dexcom;
    domain::TirRange tirRange = domain::TirRange::standard();
    int historyPageSize = 20;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p projectRoot.
     * @return Defaults when the file is missing or unreadable; invalid values fall back key by key.
     */
    static AppConfig Load(const std::string& projectRoot);

    /** @brief Builds a config from a parsed document. Unknown keys are ignored. */
    static AppConfig FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const AppConfig& config);

    /**
     * @brief Queues settings.json for an atomic replace, preserving keys this loader does not know about.
     *
     * The file is written by @p persistence's worker; flush() it before reading back.
     */
    static void Save(const std::string& projectRoot, const AppConfig& config, PersistenceService& persistence);
};

} // namespace glucosetrail::infrastructure
