/**
 * @file SuggestionGenerator.cpp
 * @brief Implementation of SuggestionGenerator.
 */

#include "application/SuggestionGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "domain/Identifiers.hpp"

namespace metriclens::application {

namespace {

std::string laterPhrase(int lag) {
    if (lag <= 0) return "";
    if (lag == 1) return " the next day";
    return " " + std::to_string(lag) + " days later";
}

std::string lowerFirst(std::string text) {
    if (!text.empty()) text[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    return text;
}

} // namespace

std::vector<domain::CorrelationSuggestion> SuggestionGenerator::generateSuggestions(
    const std::vector<domain::CorrelationResult>& results) const {
    std::vector<domain::CorrelationSuggestion> suggestions;
    for (const auto& result : results) {
        if (!Qualifies(result)) continue;

        domain::CorrelationSuggestion suggestion;
        suggestion.id = domain::NameBasedUuid("suggestion:" + result.id);
        suggestion.result = result;
        suggestion.insight = insightFor(result);
        suggestion.suggestedChange = changeFor(result);
        suggestion.expectedImpact = impactFor(result);
        suggestion.priority = PriorityFor(result);
        suggestions.push_back(std::move(suggestion));
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const auto& a, const auto& b) { return a.priority > b.priority; });
    return suggestions;
}

int SuggestionGenerator::PriorityFor(const domain::CorrelationResult& result) {
    const long raw = std::lround(1.0 + 4.0 * result.strength());
    return static_cast<int>(std::clamp<long>(raw, 1, 5));
}

bool SuggestionGenerator::Qualifies(const domain::CorrelationResult& result) {
    return result.significance == domain::Significance::Moderate ||
           result.significance == domain::Significance::Strong;
}

std::string SuggestionGenerator::insightFor(const domain::CorrelationResult& result) {
    const bool positive = result.correlationCoefficient >= 0;
    std::ostringstream ss;
    ss << "Days with higher " << result.metricX.displayName << " tend to come with "
       << (positive ? "higher " : "lower ") << result.metricY.displayName << laterPhrase(result.lag) << ".";
    return ss.str();
}

std::string SuggestionGenerator::changeFor(const domain::CorrelationResult& result) {
    const bool positive = result.correlationCoefficient >= 0;
    const std::string& x = result.metricX.displayName;
    const std::string y = lowerFirst(result.metricY.displayName);

    switch (result.metricX.category) {
        case domain::MetricCategory::Sleep:
            return positive ? "Protect your sleep routine; nights with more " + lowerFirst(x) + " are followed by better " + y + "."
                            : "Keep " + lowerFirst(x) + " within a steady range; longer stretches have come with lower " + y + ".";
        case domain::MetricCategory::Activity:
            return positive ? "Build more movement into your day; " + lowerFirst(x) + " lines up with higher " + y + "."
                            : "Balance demanding " + lowerFirst(x) + " days with recovery; they have come with lower " + y + ".";
        case domain::MetricCategory::PhoneUsage:
            return positive ? "Notice what drives your " + lowerFirst(x) + "; it has moved together with " + y + "."
                            : "Try cutting back on " + lowerFirst(x) + "; days with less of it show higher " + y + ".";
        case domain::MetricCategory::Mood:
            return positive ? "Make room for activities that lift your " + lowerFirst(x) + "; " + y + " tends to follow."
                            : "On days when " + lowerFirst(x) + " runs high, plan around lower " + y + ".";
        case domain::MetricCategory::Productivity:
            return positive ? "Schedule focused work when you can; more " + lowerFirst(x) + " has come with higher " + y + "."
                            : "Watch for overload; heavy " + lowerFirst(x) + " has come with lower " + y + ".";
        case domain::MetricCategory::Health:
            return positive ? "Keep an eye on " + lowerFirst(x) + "; improving it may support your " + y + "."
                            : "Aim to bring " + lowerFirst(x) + " down; higher readings have come with lower " + y + ".";
    }
    return "Track " + lowerFirst(x) + " and " + y + " together to confirm the pattern.";
}

std::string SuggestionGenerator::impactFor(const domain::CorrelationResult& result) {
    std::ostringstream ss;
    ss << "Based on " << result.sampleSize << " days of data, this is a "
       << domain::SignificanceToString(result.significance)
       << (result.correlationCoefficient >= 0 ? " positive" : " negative")
       << " relationship (r = " << std::fixed << std::setprecision(2) << result.correlationCoefficient
       << ", confidence " << std::setprecision(0) << result.confidenceScore * 100.0 << "%). "
       << "Changes in " << result.metricX.displayName << " are likely to be reflected in "
       << result.metricY.displayName << laterPhrase(result.lag) << ".";
    return ss.str();
}

} // namespace metriclens::application
