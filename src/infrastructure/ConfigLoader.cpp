/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace glucosetrail::infrastructure {

using json = nlohmann::json;

namespace {
constexpr const char* kSettingsFile = "settings.json";
constexpr int kMaxPageSize = 100;

// A present key of the wrong JSON type keeps the default and is reported; siblings still load.
bool readString(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key)) return false;
    if (!obj[key].is_string()) {
        std::cerr << "[ConfigLoader] '" << key << "' must be a string, ignoring." << std::endl;
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

bool readInt(const json& obj, const char* key, int& out) {
    if (!obj.contains(key)) return false;
    if (!obj[key].is_number_integer()) {
        std::cerr << "[ConfigLoader] '" << key << "' must be an integer, ignoring." << std::endl;
        return false;
    }
    out = obj[key].get<int>();
    return true;
}
}

AppConfig ConfigLoader::FromJson(const json& j) {
    AppConfig config;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults." << std::endl;
        return config;
    }

    readString(j, "data_dir", config.dataDir);

    if (j.contains("dexcom") && j["dexcom"].is_object()) {
        const auto& d = j["dexcom"];
        readString(d, "base_url", config.dexcom.baseUrl);
        readString(d, "access_token", config.dexcom.accessToken);
        int timeout = config.dexcom.timeoutSeconds;
        if (readInt(d, "timeout_seconds", timeout)) {
            if (timeout > 0) {
                config.dexcom.timeoutSeconds = timeout;
            } else {
                std::cerr << "[ConfigLoader] Invalid timeout_seconds " << timeout << ", using "
                          << config.dexcom.timeoutSeconds << std::endl;
            }
        }
    }

    if (j.contains("tir") && j["tir"].is_object()) {
        int lower = config.tirRange.lower();
        int upper = config.tirRange.upper();
        readInt(j["tir"], "lower", lower);
        readInt(j["tir"], "upper", upper);
        auto range = domain::TirRange::create(lower, upper);
        if (range) {
            config.tirRange = range.value();
        } else {
            std::cerr << "[ConfigLoader] Invalid TIR range " << lower << "-" << upper
                      << ", using " << config.tirRange.toString() << std::endl;
        }
    }

    int pageSize = config.historyPageSize;
    if (readInt(j, "history_page_size", pageSize)) {
        if (pageSize >= 1 && pageSize <= kMaxPageSize) {
            config.historyPageSize = pageSize;
        } else {
            std::cerr << "[ConfigLoader] Invalid history_page_size " << pageSize << ", using "
                      << config.historyPageSize << std::endl;
        }
    }

    return config;
}

json ConfigLoader::ToJson(const AppConfig& config) {
    return json{
        {"data_dir", config.dataDir},
        {"dexcom", {
            {"base_url", config.dexcom.baseUrl},
            {"access_token", config.dexcom.accessToken},
            {"timeout_seconds", config.dexcom.timeoutSeconds}
        }},
        {"tir", {
            {"lower", config.tirRange.lower()},
            {"upper", config.tirRange.upper()}
        }},
        {"history_page_size", config.historyPageSize}
    };
}

AppConfig ConfigLoader::Load(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / kSettingsFile;
    if (!std::filesystem::exists(configPath)) {
        return AppConfig{};
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return AppConfig{};
}

void ConfigLoader::Save(const std::string& projectRoot, const AppConfig& config, PersistenceService& persistence) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / kSettingsFile;
    json j = json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, overwriting: " << e.what() << std::endl;
            j = json::object();
        }
    }

    if (!j.is_object()) {
        j = json::object();
    }
    j.update(ToJson(config));

    persistence.saveTextAsync(configPath.string(), j.dump(4));
}

} // namespace glucosetrail::infrastructure
