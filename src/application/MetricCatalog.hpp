/**
 * @file MetricCatalog.hpp
 * @brief Registry of known metrics and their value providers.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/DataMetric.hpp"
#include "domain/ValueProvider.hpp"

namespace metriclens::application {

/**
 * @class MetricCatalog
 * @brief Owns the metric definitions for the lifetime of the process.
 *
 * Registration and lookup are thread-safe. Providers are called outside the
 * catalog lock, so a provider must tolerate concurrent reads.
 */
class MetricCatalog {
public:
    MetricCatalog() = default;
    MetricCatalog(const MetricCatalog&) = delete;
    MetricCatalog& operator=(const MetricCatalog&) = delete;

    /**
     * @brief Registers a metric with its value provider.
     * @throws domain::DuplicateMetricError if the key is already registered.
     * @throws std::invalid_argument for an empty key or a null provider.
     */
    void registerMetric(const domain::DataMetric& metric, std::shared_ptr<const domain::ValueProvider> provider);

    /** @brief Convenience overload binding a callable. */
    void registerMetric(const domain::DataMetric& metric, domain::FunctionValueProvider::Function fn);

    /** @brief All registered metrics, sorted by key. */
    std::vector<domain::DataMetric> listAvailable() const;

    /** @brief Registered definition for a key, if any. */
    std::optional<domain::DataMetric> find(const std::string& key) const;

    bool contains(const std::string& key) const;
    std::size_t size() const;

    /**
     * @brief Provider bound to a key.
     * @throws domain::UnknownMetricError if the key is not registered.
     */
    std::shared_ptr<const domain::ValueProvider> providerFor(const std::string& key) const;

    /**
     * @brief Observation of a metric on a day. Absent when nothing was recorded.
     * @throws domain::UnknownMetricError, domain::ProviderUnavailableError
     */
    std::optional<double> valueFor(const domain::DataMetric& metric, const domain::CalendarDay& day) const;

    /** @brief Drops non-finite readings (NaN, inf) so they count as missing. */
    static std::optional<double> Sanitize(std::optional<double> value);

private:
    struct Entry {
        domain::DataMetric metric;
        std::shared_ptr<const domain::ValueProvider> provider;
    };

    std::map<std::string, Entry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace metriclens::application
