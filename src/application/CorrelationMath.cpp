/**
 * @file CorrelationMath.cpp
 * @brief Implementation of the correlation numeric kernels.
 */

#include "application/CorrelationMath.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace metriclens::application::CorrelationMath {

namespace {
constexpr double kNearOneCorrelation = 1.0 - 1e-12;
constexpr double kVeryLargeT = 1e10;

double clamp01(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

constexpr int kMaxFractionTerms = 600;
constexpr double kFractionTolerance = 1e-14;
constexpr double kTinyDenominator = 1e-290;

double avoidZero(double v) {
    return std::abs(v) < kTinyDenominator ? kTinyDenominator : v;
}

// k-th partial numerator of the continued fraction for I_x(a, b); odd and even terms alternate.
double fractionTerm(int k, double a, double b, double x) {
    const double m = static_cast<double>(k / 2);
    if (k % 2 == 1) {
        return -(a + m) * (a + b + m) * x / ((a + 2.0 * m) * (a + 2.0 * m + 1.0));
    }
    return m * (b - m) * x / ((a + 2.0 * m - 1.0) * (a + 2.0 * m));
}

// Evaluates 1 + t1 / (1 + t2 / (1 + ...)) front to back (modified Lentz).
double fractionDenominator(double a, double b, double x) {
    double value = 1.0;
    double c = 1.0;
    double d = 0.0;
    for (int k = 1; k <= kMaxFractionTerms; ++k) {
        const double t = fractionTerm(k, a, b, x);
        d = 1.0 / avoidZero(1.0 + t * d);
        c = avoidZero(1.0 + t / c);
        const double step = c * d;
        value *= step;
        if (std::abs(step - 1.0) < kFractionTolerance) break;
    }
    return value;
}

bool hasZeroVariance(const std::vector<double>& values) {
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    return *lo == *hi;
}
} // namespace

std::optional<double> Pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;
    // Checked on the raw values: rounding in the mean would otherwise leave tiny non-zero deviations.
    if (hasZeroVariance(x) || hasZeroVariance(y)) return std::nullopt;

    const double n = static_cast<double>(x.size());
    const double meanX = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double meanY = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - meanX;
        const double dy = y[i] - meanY;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    const double denom = std::sqrt(sxx * syy);
    if (!(denom > 0.0) || !std::isfinite(denom)) return std::nullopt;

    const double r = sxy / denom;
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

double RegularizedIncompleteBeta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    if (a <= 0.0 || b <= 0.0 || !std::isfinite(a) || !std::isfinite(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // x^a (1-x)^b / B(a, b), shared by both branches of the symmetry relation.
    const double lnBeta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double front = std::exp(a * std::log(x) + b * std::log1p(-x) - lnBeta);

    if (x < (a + 1.0) / (a + b + 2.0)) {
        return clamp01(front / (a * fractionDenominator(a, b, x)));
    }
    return clamp01(1.0 - front / (b * fractionDenominator(b, a, 1.0 - x)));
}

double TwoTailedPValue(double t, std::size_t df) {
    if (df == 0) return 1.0;
    const double nu = static_cast<double>(df);
    const double tAbs = std::abs(t);
    if (!std::isfinite(tAbs) || tAbs > kVeryLargeT) return 0.0;

    const double x = nu / (nu + tAbs * tAbs);
    return clamp01(RegularizedIncompleteBeta(nu / 2.0, 0.5, x));
}

double CorrelationPValue(double r, std::size_t n) {
    if (n <= 2 || !std::isfinite(r)) return 1.0;
    if (std::abs(r) >= kNearOneCorrelation) return 0.0;

    const std::size_t df = n - 2;
    const double t = r * std::sqrt(static_cast<double>(df) / (1.0 - r * r));
    return TwoTailedPValue(t, df);
}

} // namespace metriclens::application::CorrelationMath
