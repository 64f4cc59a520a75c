/**
 * @file MetricRelationship.hpp
 * @brief Aligned samples for one metric pair.
 */

#pragma once
#include <vector>
#include "CalendarDay.hpp"
#include "DataMetric.hpp"

namespace metriclens::domain {

/**
 * @struct DataPoint
 * @brief One aligned day: X observed on `date`, Y observed on `date + lag`.
 */
struct DataPoint {
    CalendarDay date;
    double valueX = 0.0;
    double valueY = 0.0;
};

/**
 * @struct MetricRelationship
 * @brief Full aligned sample set for a pair, as shown by detail views.
 */
struct MetricRelationship {
    DataMetric metricX;
    DataMetric metricY;
    DateRange range;              ///< Range the X side was read over.
    int lag = 0;                  ///< Days Y is shifted after X.
    std::vector<DataPoint> points; ///< Ascending by date.
};

} // namespace metriclens::domain
