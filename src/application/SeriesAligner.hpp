/**
 * @file SeriesAligner.hpp
 * @brief Inner-joins two metric series by day, optionally shifting the Y side.
 */

#pragma once
#include <vector>
#include "application/MetricCatalog.hpp"
#include "domain/MetricRelationship.hpp"

namespace metriclens::application {

/**
 * @class SeriesAligner
 * @brief Builds (date, x, y) triples for days where both metrics were observed.
 */
class SeriesAligner {
public:
    explicit SeriesAligner(const MetricCatalog& catalog) : m_catalog(&catalog) {}

    /**
     * @brief Aligns X on each day d of the range with Y on day d + lag.
     * @param metricX Leading metric.
     * @param metricY Trailing metric.
     * @param range Days over which X is read. Empty range gives an empty result.
     * @param lag Days Y is read after X (0 = same day).
     * @return Points in ascending date order. Missing days are skipped, never interpolated.
     * @throws domain::UnknownMetricError, domain::ProviderUnavailableError
     */
    std::vector<domain::DataPoint> align(const domain::DataMetric& metricX,
                                         const domain::DataMetric& metricY,
                                         const domain::DateRange& range,
                                         int lag = 0) const;

private:
    const MetricCatalog* m_catalog;
};

} // namespace metriclens::application
