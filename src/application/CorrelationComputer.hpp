/**
 * @file CorrelationComputer.hpp
 * @brief Scores aligned samples and searches lag offsets for the strongest relationship.
 */

#pragma once
#include <optional>
#include <vector>
#include "application/EngineConfig.hpp"
#include "application/SeriesAligner.hpp"
#include "domain/CorrelationResult.hpp"
#include "domain/MetricRelationship.hpp"

namespace metriclens::application {

/**
 * @struct CorrelationScore
 * @brief Numeric outcome of scoring one aligned sample set.
 */
struct CorrelationScore {
    double coefficient = 0.0; ///< Pearson r.
    double confidence = 0.0;  ///< 1 - p of the t test for rho = 0.
    std::size_t sampleSize = 0;
};

/**
 * @struct LaggedScore
 * @brief Winner of a lag search, with the points it was scored on.
 *
 * The follower is observed lag days after the leader; points carry the
 * leader's value as x and the leader's day as date.
 */
struct LaggedScore {
    domain::DataMetric leader;
    domain::DataMetric follower;
    int lag = 0;
    std::vector<domain::DataPoint> points;
    CorrelationScore score;
};

/**
 * @class CorrelationComputer
 * @brief Pearson correlation, confidence and significance for aligned series.
 */
class CorrelationComputer {
public:
    CorrelationComputer(SeriesAligner aligner, EngineConfig config);

    /**
     * @brief Scores an aligned sample set.
     * @return nullopt for fewer than minimumSampleSize points or zero variance on either side.
     */
    std::optional<CorrelationScore> score(const std::vector<domain::DataPoint>& points) const;

    /** @brief Significance bucket of a coefficient. */
    static domain::Significance classify(double coefficient) { return domain::ClassifySignificance(coefficient); }

    /**
     * @brief Confidence in [0,1]; non-decreasing in both sample size and |r|.
     */
    static double confidenceFor(double coefficient, std::size_t sampleSize);

    /**
     * @brief Aligns and scores the pair at every configured lag, in both directions.
     *
     * Either metric may lead. Ties go to the smaller lag, then to metricA leading.
     * @return The strongest |r|, or nullopt if no lag could be scored.
     * @throws domain::ProviderUnavailableError from the underlying providers.
     */
    std::optional<LaggedScore> bestLag(const domain::DataMetric& metricA,
                                       const domain::DataMetric& metricB,
                                       const domain::DateRange& range) const;

    const EngineConfig& config() const { return m_config; }

private:
    SeriesAligner m_aligner;
    EngineConfig m_config;
};

} // namespace metriclens::application
