#ifndef IVLAB_MATH_UTILS_HPP
#define IVLAB_MATH_UTILS_HPP

/**
 * @file math_utils.hpp
 * @brief Core numerical helpers shared by the pricing and solver layers
 *
 * Provides:
 * - Statistical functions (mean, variance, standard deviation)
 * - Standard normal CDF / PDF
 * - Decimal rounding used when comparing quoted prices
 */

#include <cmath>
#include <vector>
#include <numeric>
#include <stdexcept>

namespace ivlab {

/**
 * @brief Compute the mean of a vector
 * @param data Input vector
 * @return Arithmetic mean
 */
double mean(const std::vector<double>& data);

/**
 * @brief Compute the variance of a vector
 * @param data Input vector
 * @param ddof Delta degrees of freedom (default 1 for sample variance)
 * @return Sample variance
 */
double variance(const std::vector<double>& data, int ddof = 1);

/**
 * @brief Compute the standard deviation of a vector
 * @param data Input vector
 * @param ddof Delta degrees of freedom (default 1 for sample std)
 * @return Sample standard deviation
 */
double std_dev(const std::vector<double>& data, int ddof = 1);

/**
 * @brief Standard normal cumulative distribution function
 * @param x Point at which to evaluate
 * @return P(Z <= x) where Z ~ N(0,1)
 */
double norm_cdf(double x);

/**
 * @brief Standard normal probability density function
 * @param x Point at which to evaluate
 * @return PDF value at x
 */
double norm_pdf(double x);

/**
 * @brief Round to a fixed number of decimal places (half away from zero)
 *
 * Quoted option prices are compared at cent precision, so round_to(x, 2)
 * is the comparison key for a price.
 *
 * @param x Value to round
 * @param decimals Number of decimal places (>= 0)
 * @return Rounded value
 * @throws std::invalid_argument if decimals is negative
 */
double round_to(double x, int decimals);

} // namespace ivlab

#endif // IVLAB_MATH_UTILS_HPP
