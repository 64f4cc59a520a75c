/**
 * @file CorrelationSuggestion.hpp
 * @brief Actionable suggestion derived from a correlation result.
 */

#pragma once
#include <string>
#include "CorrelationResult.hpp"

namespace metriclens::domain {

/**
 * @struct CorrelationSuggestion
 * @brief Human-readable advice backed by exactly one CorrelationResult.
 */
struct CorrelationSuggestion {
    std::string id;
    CorrelationResult result;
    std::string insight;         ///< e.g. "Higher Sleep Hours goes with higher Focus Minutes."
    std::string suggestedChange;
    std::string expectedImpact;
    int priority = 1;            ///< 1..5, 5 is the highest.
};

} // namespace metriclens::domain
