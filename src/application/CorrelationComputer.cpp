/**
 * @file CorrelationComputer.cpp
 * @brief Implementation of CorrelationComputer.
 */

#include "application/CorrelationComputer.hpp"
#include <cmath>
#include <utility>
#include "application/CorrelationMath.hpp"

namespace metriclens::application {

namespace {
// Coefficients closer than this are treated as tied, so float noise cannot favour a longer lag.
constexpr double kLagTieTolerance = 1e-12;
}

CorrelationComputer::CorrelationComputer(SeriesAligner aligner, EngineConfig config)
    : m_aligner(aligner), m_config(ValidatedConfig(std::move(config))) {}

std::optional<CorrelationScore> CorrelationComputer::score(const std::vector<domain::DataPoint>& points) const {
    if (points.size() < m_config.minimumSampleSize) return std::nullopt;

    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.valueX);
        ys.push_back(p.valueY);
    }

    auto r = CorrelationMath::Pearson(xs, ys);
    if (!r) return std::nullopt;

    CorrelationScore out;
    out.coefficient = *r;
    out.confidence = confidenceFor(*r, points.size());
    out.sampleSize = points.size();
    return out;
}

double CorrelationComputer::confidenceFor(double coefficient, std::size_t sampleSize) {
    return 1.0 - CorrelationMath::CorrelationPValue(coefficient, sampleSize);
}

std::optional<LaggedScore> CorrelationComputer::bestLag(const domain::DataMetric& metricA,
                                                        const domain::DataMetric& metricB,
                                                        const domain::DateRange& range) const {
    std::optional<LaggedScore> best;

    auto consider = [&](const domain::DataMetric& leader, const domain::DataMetric& follower, int lag) {
        auto points = m_aligner.align(leader, follower, range, lag);
        auto scored = score(points);
        if (!scored) return;
        // Candidates arrive in tie-break order, so only a strict improvement replaces the current best.
        if (!best || std::abs(scored->coefficient) > std::abs(best->score.coefficient) + kLagTieTolerance) {
            best = LaggedScore{leader, follower, lag, std::move(points), *scored};
        }
    };

    for (int lag : m_config.lagOffsets) {
        consider(metricA, metricB, lag);
        if (lag > 0) consider(metricB, metricA, lag);
    }
    return best;
}

} // namespace metriclens::application
