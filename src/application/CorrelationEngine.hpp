/**
 * @file CorrelationEngine.hpp
 * @brief Orchestrates pairwise correlation scans over registered metrics.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "application/CorrelationComputer.hpp"
#include "application/EngineConfig.hpp"
#include "application/MetricCatalog.hpp"
#include "application/ScanControl.hpp"
#include "application/SeriesAligner.hpp"
#include "domain/CalendarDay.hpp"
#include "domain/CorrelationResult.hpp"
#include "domain/MetricRelationship.hpp"

namespace metriclens::application {

/**
 * @struct PairFailure
 * @brief A pair skipped because one of its providers was unavailable.
 */
struct PairFailure {
    domain::DataMetric metricX;
    domain::DataMetric metricY;
    std::string message;
};

/**
 * @struct CorrelationScan
 * @brief Output of one findCorrelations call.
 */
struct CorrelationScan {
    domain::DateRange range;
    std::vector<domain::CorrelationResult> results; ///< Ranked, strongest first.
    std::vector<PairFailure> failures;              ///< In pair order.
    std::size_t pairsTotal = 0;
    std::size_t pairsEvaluated = 0;
    bool cancelled = false;
};

/**
 * @class CorrelationEngine
 * @brief Stateless pair scanner: same provider data in, same scan out.
 *
 * Pairs are evaluated on a bounded worker pool; the final order never
 * depends on completion order.
 */
class CorrelationEngine {
public:
    /**
     * @param catalog Metric registry; must outlive the engine.
     * @param config Tunables, validated on construction.
     * @param clock Source of "today" for day-count based scans.
     * @throws domain::ConfigError for invalid config values.
     */
    CorrelationEngine(const MetricCatalog& catalog, EngineConfig config,
                      domain::DayClock clock = &domain::CalendarDay::Today);

    /** @brief All metrics known to the catalog, sorted by key. */
    std::vector<domain::DataMetric> listAvailableMetrics() const;

    /**
     * @brief Scans every unordered pair over [today - minimumDays, today].
     * @param metrics Metrics to pair; empty means all registered metrics.
     * @param minimumDays Look-back window in days (>= 0).
     * @throws domain::UnknownMetricError if a metric is not registered.
     * @throws std::invalid_argument for a negative window.
     */
    CorrelationScan findCorrelations(const std::vector<domain::DataMetric>& metrics,
                                     int minimumDays,
                                     const ScanControl& control = {}) const;

    /** @brief Same as above over an explicit range. */
    CorrelationScan findCorrelations(const std::vector<domain::DataMetric>& metrics,
                                     const domain::DateRange& range,
                                     const ScanControl& control = {}) const;

    /**
     * @brief Aligned points at the best lag over the default analysis window.
     *
     * The argument order does not matter: the returned metricX is the leading
     * metric, exactly as in the matching findCorrelations result.
     * @return nullopt when the sample is under-powered or degenerate.
     * @throws domain::ProviderUnavailableError, domain::UnknownMetricError
     */
    std::optional<domain::MetricRelationship> analyzeRelationship(const domain::DataMetric& metricX,
                                                                  const domain::DataMetric& metricY) const;

    std::optional<domain::MetricRelationship> analyzeRelationship(const domain::DataMetric& metricX,
                                                                  const domain::DataMetric& metricY,
                                                                  const domain::DateRange& range) const;

    const EngineConfig& config() const { return m_computer.config(); }

private:
    struct PairOutcome {
        std::optional<domain::CorrelationResult> result;
        std::optional<std::string> failure;
        bool evaluated = false;
    };

    std::vector<domain::DataMetric> resolveMetrics(const std::vector<domain::DataMetric>& metrics) const;
    domain::DataMetric resolve(const domain::DataMetric& metric) const;
    PairOutcome evaluatePair(const domain::DataMetric& metricX, const domain::DataMetric& metricY,
                             const domain::DateRange& range) const;
    unsigned workerCount(std::size_t pairs) const;

    static domain::CorrelationResult MakeResult(const domain::DateRange& range, const LaggedScore& scored);
    static std::string Describe(const domain::CorrelationResult& result);

    const MetricCatalog& m_catalog;
    CorrelationComputer m_computer;
    domain::DayClock m_clock;
};

} // namespace metriclens::application
