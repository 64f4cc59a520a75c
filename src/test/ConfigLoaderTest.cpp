#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"
#include "domain/DomainErrors.hpp"

using namespace metriclens;
using infrastructure::ConfigLoader;
namespace fs = std::filesystem;

static fs::path makeRoot(const std::string& name) {
    fs::path root = fs::temp_directory_path() / ("metriclens_config_" + name);
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

static void writeSettings(const fs::path& root, const std::string& text) {
    std::ofstream f(root / "settings.json");
    f << text;
}

static bool throwsConfigError(const fs::path& root) {
    try {
        ConfigLoader::LoadEngineConfig(root.string());
    } catch (const domain::ConfigError&) {
        return true;
    }
    return false;
}

static void testDefaults() {
    fs::path root = makeRoot("defaults");
    auto config = ConfigLoader::LoadEngineConfig(root.string());
    assert(config.minimumSampleSize == 7);
    assert((config.lagOffsets == std::vector<int>{0, 1, 2, 3}));
    assert(config.defaultAnalysisDays == 90);
    assert(config.maxWorkers == 0);
    assert(!config.verbose);

    // Unrelated settings only
    writeSettings(root, R"({"ollama_model": "qwen"})");
    config = ConfigLoader::LoadEngineConfig(root.string());
    assert(config.minimumSampleSize == 7);

    // Unparsable file falls back to defaults
    writeSettings(root, "{ not json");
    config = ConfigLoader::LoadEngineConfig(root.string());
    assert(config.defaultAnalysisDays == 90);

    // A path the filesystem refuses to stat is reported, not thrown
    const std::string unreachable = (root / std::string(300, 'x')).string();
    config = ConfigLoader::LoadEngineConfig(unreachable);
    assert(config.minimumSampleSize == 7);
    assert(!ConfigLoader::SaveEngineConfig(unreachable, config));
    fs::remove_all(root);
}

static void testLoadSection() {
    fs::path root = makeRoot("load");
    writeSettings(root, R"({
        "correlation": {
            "minimumSampleSize": 14,
            "lagOffsets": [3, 0, 1, 1],
            "maxWorkers": 2,
            "verbose": true
        }
    })");
    auto config = ConfigLoader::LoadEngineConfig(root.string());
    assert(config.minimumSampleSize == 14);
    assert((config.lagOffsets == std::vector<int>{0, 1, 3}) && "Lags are sorted and de-duplicated.");
    assert(config.defaultAnalysisDays == 90);
    assert(config.maxWorkers == 2);
    assert(config.verbose);
    fs::remove_all(root);
}

static void testInvalidValues() {
    fs::path root = makeRoot("invalid");

    writeSettings(root, R"({"correlation": {"minimumSampleSize": 2}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"minimumSampleSize": "seven"}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"lagOffsets": []}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"lagOffsets": [0, -1]}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"defaultAnalysisDays": 0}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"maxWorkers": -4}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": 5})");
    assert(throwsConfigError(root));

    // Fractional numbers are rejected, not truncated
    writeSettings(root, R"({"correlation": {"minimumSampleSize": 7.9}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"maxWorkers": 2.5}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"lagOffsets": [0, 1.5]}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"defaultAnalysisDays": 1e20}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"maxWorkers": 99999999999}})");
    assert(throwsConfigError(root));

    writeSettings(root, R"({"correlation": {"verbose": 1}})");
    assert(throwsConfigError(root));

    fs::remove_all(root);
}

static void testSavePreservesOtherKeys() {
    fs::path root = makeRoot("save");
    writeSettings(root, R"({"ollama_model": "qwen", "correlation": {"minimumSampleSize": 9}})");

    application::EngineConfig config;
    config.minimumSampleSize = 21;
    config.lagOffsets = {0, 7};
    config.defaultAnalysisDays = 30;
    assert(ConfigLoader::SaveEngineConfig(root.string(), config));

    std::ifstream f(ConfigLoader::SettingsPath(root.string()));
    nlohmann::json j;
    f >> j;
    assert(j["ollama_model"] == "qwen");
    assert(j["correlation"]["minimumSampleSize"] == 21);

    auto reloaded = ConfigLoader::LoadEngineConfig(root.string());
    assert(reloaded.minimumSampleSize == 21);
    assert((reloaded.lagOffsets == std::vector<int>{0, 7}));
    assert(reloaded.defaultAnalysisDays == 30);
    fs::remove_all(root);
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    testDefaults();
    testLoadSection();
    testInvalidValues();
    testSavePreservesOtherKeys();

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
