/**
 * @file DomainErrors.hpp
 * @brief Exception hierarchy for the correlation engine.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace metriclens::domain {

/** @brief Base of every error raised by the engine and its collaborators. */
class MetricLensError : public std::runtime_error {
public:
    explicit MetricLensError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A metric key was registered twice. */
class DuplicateMetricError : public MetricLensError {
public:
    explicit DuplicateMetricError(const std::string& key)
        : MetricLensError("Metric already registered: " + key), m_key(key) {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

/** @brief A metric key is not known to the catalog. */
class UnknownMetricError : public MetricLensError {
public:
    explicit UnknownMetricError(const std::string& key)
        : MetricLensError("Unknown metric: " + key), m_key(key) {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

/** @brief A value provider could not reach its backing store. */
class ProviderUnavailableError : public MetricLensError {
public:
    explicit ProviderUnavailableError(const std::string& message)
        : MetricLensError("Provider unavailable: " + message) {}
};

/** @brief Invalid engine settings. */
class ConfigError : public MetricLensError {
public:
    explicit ConfigError(const std::string& message) : MetricLensError("Config Error: " + message) {}
};

/** @brief Unreadable or malformed dataset file. */
class DatasetError : public MetricLensError {
public:
    explicit DatasetError(const std::string& message) : MetricLensError("Dataset Error: " + message) {}
};

} // namespace metriclens::domain
