/**
 * @file JsonMetricStore.hpp
 * @brief In-memory snapshot of daily metric records loaded from a JSON dataset.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "application/MetricCatalog.hpp"
#include "domain/CalendarDay.hpp"
#include "domain/DataMetric.hpp"
#include "domain/ValueProvider.hpp"

namespace metriclens::infrastructure {

/**
 * @class JsonMetricStore
 * @brief Loads health, phone-usage and journal records and serves them as ValueProviders.
 *
 * The store is immutable after loading, so its providers are safe for
 * concurrent reads during a scan.
 */
class JsonMetricStore {
public:
    /** @brief Key of the metric derived from journal entries. */
    static constexpr const char* kJournalMoodKey = "journalMood";

    /**
     * @brief Parses a dataset file.
     * @throws domain::DatasetError if the file cannot be read or is malformed.
     */
    static JsonMetricStore LoadFromFile(const std::string& path);

    /** @brief Parses a dataset document held in memory. */
    static JsonMetricStore LoadFromString(const std::string& text);

    /** @brief Metric definitions in file order (journal mood last, if present). */
    std::vector<domain::DataMetric> metrics() const;

    /**
     * @brief Provider over one metric's values.
     * @return nullptr for unknown keys.
     */
    std::shared_ptr<const domain::ValueProvider> providerFor(const std::string& key) const;

    /**
     * @brief Registers every metric of the store.
     * @throws domain::DuplicateMetricError if the catalog already has one of the keys.
     */
    void registerAll(application::MetricCatalog& catalog) const;

    /** @brief Most recent day with any observation. */
    std::optional<domain::CalendarDay> latestDay() const;

    /** @brief Number of observed days for a key (0 for unknown keys). */
    std::size_t observationCount(const std::string& key) const;

private:
    using DailyValues = std::map<long, double>;

    struct Series {
        domain::DataMetric metric;
        std::shared_ptr<const DailyValues> values;
    };

    void parseDocument(const nlohmann::json& root);
    void addSeries(domain::DataMetric metric, DailyValues values);

    std::vector<Series> m_series;
};

} // namespace metriclens::infrastructure
