// include/quanttrade/statistics/descriptive.hpp
#pragma once

#include <vector>

namespace quanttrade {
namespace statistics {

/**
 * @brief Arithmetic mean; 0 for an empty sample
 */
double mean(const std::vector<double>& data);

/**
 * @brief Variance with the given delta degrees of freedom
 * @param ddof 1 for the sample variance, 0 for the population variance
 * @return 0 when the sample has no more than ddof observations
 */
double variance(const std::vector<double>& data, int ddof = 1);

/**
 * @brief Sample standard deviation (ddof = 1)
 */
double sample_std(const std::vector<double>& data);

/**
 * @brief Population standard deviation (ddof = 0)
 */
double population_std(const std::vector<double>& data);

/**
 * @brief Quantile with linear interpolation between closest ranks
 * @param q Probability in [0, 1]
 * @return 0 for an empty sample
 */
double quantile(std::vector<double> data, double q);

double median(const std::vector<double>& data);

/**
 * @brief Bias-corrected sample skewness (adjusted Fisher-Pearson G1)
 * @return 0 for fewer than 3 observations or zero variance
 */
double skewness(const std::vector<double>& data);

/**
 * @brief Bias-corrected sample excess kurtosis (G2)
 * @return 0 for fewer than 4 observations or zero variance
 */
double kurtosis(const std::vector<double>& data);

/**
 * @brief Sample covariance of two equally sized series
 */
double covariance(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Pearson correlation; 0 when either series is constant
 */
double correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Rolling mean over a fixed window
 *
 * The first window - 1 entries, and any window containing a NaN, are NaN.
 */
std::vector<double> rolling_mean(const std::vector<double>& data, int window);

/**
 * @brief Rolling sample standard deviation over a fixed window (NaN where undefined)
 */
std::vector<double> rolling_std(const std::vector<double>& data, int window);

/**
 * @brief Fractional change over the given number of periods (NaN where undefined)
 */
std::vector<double> pct_change(const std::vector<double>& data, int periods = 1);

}  // namespace statistics
}  // namespace quanttrade
