/**
 * @file CorrelationMath.hpp
 * @brief Numeric kernels: Pearson correlation and its Student-t significance.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace metriclens::application::CorrelationMath {

/**
 * @brief Pearson product-moment correlation of two equally sized series.
 * @post Returns nullopt when sizes differ, fewer than 2 values, or either series has zero variance.
 * @post A returned value is clamped to [-1, 1].
 */
std::optional<double> Pearson(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Regularized incomplete beta function I_x(a, b).
 * @pre a > 0, b > 0, 0 <= x <= 1.
 */
double RegularizedIncompleteBeta(double a, double b, double x);

/** @brief Two-tailed p-value of a Student t statistic with df degrees of freedom. */
double TwoTailedPValue(double t, std::size_t df);

/**
 * @brief Two-tailed p-value of H0: rho = 0 for a sample correlation r over n pairs.
 * @post Returns 1.0 for n <= 2 and 0.0 for |r| == 1.
 */
double CorrelationPValue(double r, std::size_t n);

} // namespace metriclens::application::CorrelationMath
