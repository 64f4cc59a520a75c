/**
 * @file SuggestionGenerator.hpp
 * @brief Turns ranked correlation results into prioritized, human-readable suggestions.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/CorrelationResult.hpp"
#include "domain/CorrelationSuggestion.hpp"

namespace metriclens::application {

/**
 * @class SuggestionGenerator
 * @brief Pure mapping from results to suggestions. Only moderate and strong results qualify.
 */
class SuggestionGenerator {
public:
    /**
     * @brief Builds one suggestion per moderate/strong result.
     * @param results Ranked results, typically CorrelationScan::results.
     * @return Suggestions by priority descending; ties keep input order.
     */
    std::vector<domain::CorrelationSuggestion> generateSuggestions(const std::vector<domain::CorrelationResult>& results) const;

    /** @brief round(1 + 4 * confidence * |r|), clamped to [1, 5]. */
    static int PriorityFor(const domain::CorrelationResult& result);

    /** @brief True for significance moderate or strong. */
    static bool Qualifies(const domain::CorrelationResult& result);

private:
    static std::string insightFor(const domain::CorrelationResult& result);
    static std::string changeFor(const domain::CorrelationResult& result);
    static std::string impactFor(const domain::CorrelationResult& result);
};

} // namespace metriclens::application
