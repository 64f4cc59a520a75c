/**
 * @file MetricCatalog.cpp
 * @brief Implementation of MetricCatalog.
 */

#include "application/MetricCatalog.hpp"
#include <cmath>
#include <stdexcept>
#include "domain/DomainErrors.hpp"

namespace metriclens::application {

void MetricCatalog::registerMetric(const domain::DataMetric& metric, std::shared_ptr<const domain::ValueProvider> provider) {
    if (metric.key.empty()) {
        throw std::invalid_argument("Metric key must not be empty");
    }
    if (!provider) {
        throw std::invalid_argument("Metric '" + metric.key + "' registered without a value provider");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(metric.key) > 0) {
        throw domain::DuplicateMetricError(metric.key);
    }
    m_entries.emplace(metric.key, Entry{metric, std::move(provider)});
}

void MetricCatalog::registerMetric(const domain::DataMetric& metric, domain::FunctionValueProvider::Function fn) {
    registerMetric(metric, std::make_shared<domain::FunctionValueProvider>(std::move(fn)));
}

std::vector<domain::DataMetric> MetricCatalog::listAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::DataMetric> metrics;
    metrics.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        metrics.push_back(entry.metric);
    }
    return metrics;
}

std::optional<domain::DataMetric> MetricCatalog::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.metric;
}

bool MetricCatalog::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(key) > 0;
}

std::size_t MetricCatalog::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::shared_ptr<const domain::ValueProvider> MetricCatalog::providerFor(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        throw domain::UnknownMetricError(key);
    }
    return it->second.provider;
}

std::optional<double> MetricCatalog::valueFor(const domain::DataMetric& metric, const domain::CalendarDay& day) const {
    auto provider = providerFor(metric.key);
    return Sanitize(provider->valueFor(day));
}

std::optional<double> MetricCatalog::Sanitize(std::optional<double> value) {
    if (value && !std::isfinite(*value)) return std::nullopt;
    return value;
}

} // namespace metriclens::application
