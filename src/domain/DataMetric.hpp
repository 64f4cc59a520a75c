/**
 * @file DataMetric.hpp
 * @brief Domain entity describing a named, dated metric series.
 */

#pragma once
#include <string>
#include <optional>

namespace metriclens::domain {

/**
 * @enum MetricCategory
 * @brief Source domain of a metric. Drives suggestion templates.
 */
enum class MetricCategory {
    Health,
    Sleep,
    Activity,
    PhoneUsage,
    Mood,
    Productivity
};

inline std::string CategoryToString(MetricCategory category) {
    switch (category) {
        case MetricCategory::Health: return "health";
        case MetricCategory::Sleep: return "sleep";
        case MetricCategory::Activity: return "activity";
        case MetricCategory::PhoneUsage: return "phoneUsage";
        case MetricCategory::Mood: return "mood";
        case MetricCategory::Productivity: return "productivity";
    }
    return "health";
}

/**
 * @brief Parses the serialized category name (as produced by CategoryToString).
 * @return nullopt for unknown names.
 */
inline std::optional<MetricCategory> CategoryFromString(const std::string& name) {
    if (name == "health") return MetricCategory::Health;
    if (name == "sleep") return MetricCategory::Sleep;
    if (name == "activity") return MetricCategory::Activity;
    if (name == "phoneUsage") return MetricCategory::PhoneUsage;
    if (name == "mood") return MetricCategory::Mood;
    if (name == "productivity") return MetricCategory::Productivity;
    return std::nullopt;
}

/**
 * @struct DataMetric
 * @brief Identity and presentation attributes of one metric.
 *
 * The value-extraction capability is not part of the value; it is bound
 * when the metric is registered in the MetricCatalog.
 */
struct DataMetric {
    std::string key;                 ///< Stable identity, e.g. "sleepHours".
    std::string displayName;         ///< Human-readable name, e.g. "Sleep Hours".
    MetricCategory category = MetricCategory::Health;
    std::optional<std::string> unit; ///< e.g. "h", "min", "steps".

    bool operator==(const DataMetric& other) const { return key == other.key; }
    bool operator!=(const DataMetric& other) const { return key != other.key; }
};

} // namespace metriclens::domain
