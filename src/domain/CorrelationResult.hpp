/**
 * @file CorrelationResult.hpp
 * @brief Scored relationship between two metrics.
 */

#pragma once
#include <string>
#include <cmath>
#include <cstddef>
#include "DataMetric.hpp"

namespace metriclens::domain {

/**
 * @enum Significance
 * @brief Strength bucket derived solely from the coefficient magnitude.
 */
enum class Significance {
    None,
    Weak,
    Moderate,
    Strong
};

inline std::string SignificanceToString(Significance s) {
    switch (s) {
        case Significance::None: return "none";
        case Significance::Weak: return "weak";
        case Significance::Moderate: return "moderate";
        case Significance::Strong: return "strong";
    }
    return "none";
}

/**
 * @brief |r| >= 0.7 strong, >= 0.4 moderate, >= 0.2 weak, otherwise none.
 */
inline Significance ClassifySignificance(double coefficient) {
    const double magnitude = std::abs(coefficient);
    if (magnitude >= 0.7) return Significance::Strong;
    if (magnitude >= 0.4) return Significance::Moderate;
    if (magnitude >= 0.2) return Significance::Weak;
    return Significance::None;
}

/**
 * @struct CorrelationResult
 * @brief Immutable outcome of evaluating one metric pair.
 */
struct CorrelationResult {
    std::string id;                     ///< Name-based UUID of (pair, lag, range).
    DataMetric metricX;
    DataMetric metricY;
    double correlationCoefficient = 0.0; ///< Pearson r in [-1, 1].
    double confidenceScore = 0.0;        ///< [0, 1].
    std::size_t sampleSize = 0;          ///< Aligned days used.
    int lag = 0;                         ///< Days Y trails X.
    std::string description;
    Significance significance = Significance::None;

    /** @brief Ranking strength: confidence x |r|. */
    double strength() const { return confidenceScore * std::abs(correlationCoefficient); }

    /** @brief "<keyX>|<keyY>". */
    std::string pairKey() const { return metricX.key + "|" + metricY.key; }
};

} // namespace metriclens::domain
