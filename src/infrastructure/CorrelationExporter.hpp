/**
 * @file CorrelationExporter.hpp
 * @brief JSON export of scan results and suggestions for reports and dashboards.
 */

#pragma once
#include <string>
#include <vector>
#include "application/CorrelationEngine.hpp"
#include "domain/CorrelationSuggestion.hpp"

namespace metriclens::infrastructure {

/**
 * @class CorrelationExporter
 * @brief Serializes engine output; the engine itself never persists anything.
 */
class CorrelationExporter {
public:
    /**
     * @brief Serializes a scan and its suggestions.
     * @return Pretty-printed JSON document with "range", "results", "failures" and "suggestions".
     */
    static std::string ToJson(const application::CorrelationScan& scan,
                              const std::vector<domain::CorrelationSuggestion>& suggestions);

    /** @brief Serializes the aligned points behind one relationship. */
    static std::string ToJson(const domain::MetricRelationship& relationship);

    /**
     * @brief Writes content via a temporary file and rename, so readers never see a partial file.
     * @return False if any step failed (details on stderr).
     */
    static bool WriteAtomically(const std::string& path, const std::string& content);
};

} // namespace metriclens::infrastructure
