/**
 * @file EngineConfig.hpp
 * @brief Tunables for a correlation engine instance.
 */

#pragma once
#include <vector>
#include <cstddef>
#include <algorithm>
#include <string>
#include "domain/DomainErrors.hpp"

namespace metriclens::application {

/**
 * @struct EngineConfig
 * @brief Constructed once per process (usually by ConfigLoader) and handed to the engine.
 */
struct EngineConfig {
    std::size_t minimumSampleSize = 7;    ///< Fewer aligned days yield no result.
    std::vector<int> lagOffsets{0, 1, 2, 3}; ///< Days Y may trail X.
    int defaultAnalysisDays = 90;         ///< Window for analyzeRelationship without an explicit range.
    unsigned maxWorkers = 0;              ///< 0 = hardware concurrency.
    bool verbose = false;                 ///< Informational console output.
};

/**
 * @brief Checks the values and normalizes the lag set (sorted, unique).
 * @throws domain::ConfigError on out-of-range values.
 */
inline EngineConfig ValidatedConfig(EngineConfig config) {
    if (config.minimumSampleSize < 3) {
        throw domain::ConfigError("minimumSampleSize must be at least 3 (got " +
                                  std::to_string(config.minimumSampleSize) + ")");
    }
    if (config.defaultAnalysisDays <= 0) {
        throw domain::ConfigError("defaultAnalysisDays must be positive");
    }
    if (config.lagOffsets.empty()) {
        throw domain::ConfigError("lagOffsets must not be empty");
    }
    for (int lag : config.lagOffsets) {
        if (lag < 0) throw domain::ConfigError("lagOffsets must be non-negative");
    }
    std::sort(config.lagOffsets.begin(), config.lagOffsets.end());
    config.lagOffsets.erase(std::unique(config.lagOffsets.begin(), config.lagOffsets.end()),
                            config.lagOffsets.end());
    return config;
}

} // namespace metriclens::application
