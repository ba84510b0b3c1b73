/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <set>

namespace healthiq::infrastructure {

using healthiq::domain::AnalyticsConfig;
using healthiq::domain::ConfigurationError;

namespace {

template <typename T>
void ReadField(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void ReadHours(const nlohmann::json& section, const char* key, std::chrono::hours& target) {
    if (section.contains(key)) {
        target = std::chrono::hours(section.at(key).get<long>());
    }
}

const std::set<std::string>& KnownKeys() {
    static const std::set<std::string> keys = {
        "coOccurrenceWindowHours", "defaultTopN", "maxTopN", "hsiWindowDays",
        "regularityWeight", "consistencyWeight", "trajectoryWeight",
        "hsiDropThreshold", "newSymptomMinimum", "newSymptomRecentDays", "newSymptomLookbackDays",
        "adherenceFloorPct", "adherenceSampleMinimum", "adherenceWindowDays",
        "engagementMinimumEvents", "loggingGapDays", "escalationRun", "coOccurrenceSpikeWeight",
        "coldStartMinEvents", "coldStartMinDays", "alertDedupWindowHours",
    };
    return keys;
}

AnalyticsConfig FromSection(const nlohmann::json& section) {
    AnalyticsConfig config;
    ReadHours(section, "coOccurrenceWindowHours", config.coOccurrenceWindow);
    ReadField(section, "defaultTopN", config.defaultTopN);
    ReadField(section, "maxTopN", config.maxTopN);
    ReadField(section, "hsiWindowDays", config.hsiWindowDays);
    ReadField(section, "regularityWeight", config.regularityWeight);
    ReadField(section, "consistencyWeight", config.consistencyWeight);
    ReadField(section, "trajectoryWeight", config.trajectoryWeight);
    ReadField(section, "hsiDropThreshold", config.hsiDropThreshold);
    ReadField(section, "newSymptomMinimum", config.newSymptomMinimum);
    ReadField(section, "newSymptomRecentDays", config.newSymptomRecentDays);
    ReadField(section, "newSymptomLookbackDays", config.newSymptomLookbackDays);
    ReadField(section, "adherenceFloorPct", config.adherenceFloorPct);
    ReadField(section, "adherenceSampleMinimum", config.adherenceSampleMinimum);
    ReadField(section, "adherenceWindowDays", config.adherenceWindowDays);
    ReadField(section, "engagementMinimumEvents", config.engagementMinimumEvents);
    ReadField(section, "loggingGapDays", config.loggingGapDays);
    ReadField(section, "escalationRun", config.escalationRun);
    ReadField(section, "coOccurrenceSpikeWeight", config.coOccurrenceSpikeWeight);
    ReadField(section, "coldStartMinEvents", config.coldStartMinEvents);
    ReadField(section, "coldStartMinDays", config.coldStartMinDays);
    ReadHours(section, "alertDedupWindowHours", config.alertDedupWindow);

    for (const auto& item : section.items()) {
        if (!KnownKeys().count(item.key())) {
            std::cerr << "[ConfigLoader] Ignoring unknown analytics setting: " << item.key() << std::endl;
        }
    }
    return config;
}

} // namespace

AnalyticsConfig ConfigLoader::LoadAnalyticsConfig(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return AnalyticsConfig{};
    }
    return LoadAnalyticsConfigFile(configPath.string());
}

AnalyticsConfig ConfigLoader::LoadAnalyticsConfigFile(const std::string& settingsPath) {
    std::ifstream f(settingsPath);
    if (!f.is_open()) {
        throw ConfigurationError("Cannot open settings file: " + settingsPath);
    }

    AnalyticsConfig config;
    try {
        nlohmann::json j;
        f >> j;
        if (j.contains("analytics")) {
            const auto& section = j.at("analytics");
            if (!section.is_object()) {
                throw ConfigurationError("\"analytics\" in " + settingsPath + " must be an object");
            }
            config = FromSection(section);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        throw ConfigurationError("Invalid settings file " + settingsPath + ": " + e.what());
    }

    config.validate();
    return config;
}

} // namespace healthiq::infrastructure
