/**
 * @file SeriesAligner.cpp
 * @brief Implementation of SeriesAligner.
 */

#include "application/SeriesAligner.hpp"

namespace metriclens::application {

std::vector<domain::DataPoint> SeriesAligner::align(const domain::DataMetric& metricX,
                                                    const domain::DataMetric& metricY,
                                                    const domain::DateRange& range,
                                                    int lag) const {
    std::vector<domain::DataPoint> points;
    if (range.empty()) return points;

    // Resolve once; the catalog lock is not held while providers run.
    auto providerX = m_catalog->providerFor(metricX.key);
    auto providerY = m_catalog->providerFor(metricY.key);

    points.reserve(static_cast<size_t>(range.dayCount()));
    for (domain::CalendarDay day = range.first; day <= range.last; ++day) {
        auto x = MetricCatalog::Sanitize(providerX->valueFor(day));
        if (!x) continue;
        auto y = MetricCatalog::Sanitize(providerY->valueFor(day + lag));
        if (!y) continue;
        points.push_back(domain::DataPoint{day, *x, *y});
    }
    return points;
}

} // namespace metriclens::application
