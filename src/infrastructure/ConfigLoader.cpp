/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <climits>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "domain/DomainErrors.hpp"

namespace metriclens::infrastructure {

namespace {

constexpr const char* kSection = "correlation";

[[noreturn]] void rejectField(const char* name, const char* expected) {
    throw domain::ConfigError(std::string(kSection) + "." + name + " must be " + expected);
}

// Floats such as 7.9 are rejected rather than truncated.
int readInt(const nlohmann::json& section, const char* name, int fallback) {
    if (!section.contains(name)) return fallback;
    const auto& value = section.at(name);
    if (!value.is_number_integer()) rejectField(name, "an integer");
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(INT_MAX)) {
        rejectField(name, "within int range");
    }
    const auto wide = value.get<std::int64_t>();
    if (wide < INT_MIN || wide > INT_MAX) rejectField(name, "within int range");
    return static_cast<int>(wide);
}

std::vector<int> readIntList(const nlohmann::json& section, const char* name, std::vector<int> fallback) {
    if (!section.contains(name)) return fallback;
    const auto& value = section.at(name);
    if (!value.is_array()) rejectField(name, "an array of integers");
    std::vector<int> out;
    for (const auto& item : value) {
        if (!item.is_number_integer()) rejectField(name, "an array of integers");
        const auto wide = item.get<std::int64_t>();
        if (wide < INT_MIN || wide > INT_MAX) rejectField(name, "an array of integers");
        out.push_back(static_cast<int>(wide));
    }
    return out;
}

bool readBool(const nlohmann::json& section, const char* name, bool fallback) {
    if (!section.contains(name)) return fallback;
    const auto& value = section.at(name);
    if (!value.is_boolean()) rejectField(name, "a boolean");
    return value.get<bool>();
}

} // namespace

std::string ConfigLoader::SettingsPath(const std::string& projectRoot) {
    return (std::filesystem::path(projectRoot) / "settings.json").string();
}

application::EngineConfig ConfigLoader::LoadEngineConfig(const std::string& projectRoot) {
    application::EngineConfig config;
    std::filesystem::path configPath = SettingsPath(projectRoot);
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot access " << configPath << ": " << ec.message() << std::endl;
        }
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return config;
    }

    if (!j.is_object() || !j.contains(kSection)) {
        return config;
    }
    const nlohmann::json& section = j[kSection];
    if (!section.is_object()) {
        throw domain::ConfigError(std::string(kSection) + " must be an object");
    }

    const int minSamples = readInt(section, "minimumSampleSize", static_cast<int>(config.minimumSampleSize));
    if (minSamples < 0) {
        throw domain::ConfigError("minimumSampleSize must be non-negative");
    }
    config.minimumSampleSize = static_cast<std::size_t>(minSamples);
    config.lagOffsets = readIntList(section, "lagOffsets", config.lagOffsets);
    config.defaultAnalysisDays = readInt(section, "defaultAnalysisDays", config.defaultAnalysisDays);
    const int workers = readInt(section, "maxWorkers", static_cast<int>(config.maxWorkers));
    if (workers < 0) {
        throw domain::ConfigError("maxWorkers must be non-negative");
    }
    config.maxWorkers = static_cast<unsigned>(workers);
    config.verbose = readBool(section, "verbose", config.verbose);

    return application::ValidatedConfig(config);
}

bool ConfigLoader::SaveEngineConfig(const std::string& projectRoot, const application::EngineConfig& config) {
    std::filesystem::path configPath = SettingsPath(projectRoot);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, rewriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j[kSection] = {
        {"minimumSampleSize", config.minimumSampleSize},
        {"lagOffsets", config.lagOffsets},
        {"defaultAnalysisDays", config.defaultAnalysisDays},
        {"maxWorkers", config.maxWorkers},
        {"verbose", config.verbose}
    };

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace metriclens::infrastructure
