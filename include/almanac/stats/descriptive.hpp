#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace almanac::stats {

/// Arithmetic mean; NaN for an empty sample.
double mean(const std::vector<double> &values);

/// Unbiased sample variance (n - 1 denominator); NaN with fewer than two values.
double sampleVariance(const std::vector<double> &values);

double sampleStdDev(const std::vector<double> &values);

/// Median; NaN for an empty sample.
double median(std::vector<double> values);

/// Quantile with linear interpolation between order statistics (q in [0, 1]).
double quantile(std::vector<double> values, double q);

/// Pearson correlation; NaN when either sample is constant.
double correlation(const std::vector<double> &x, const std::vector<double> &y);

/**
 * @struct TTestResult
 * @brief One-sample t-test of a mean against a reference value.
 */
struct TTestResult {
	double statistic = std::numeric_limits<double>::quiet_NaN();
	double p_value = std::numeric_limits<double>::quiet_NaN();
	/// Cohen's d: (mean - reference) / standard deviation.
	double effect_size = std::numeric_limits<double>::quiet_NaN();
	double degrees_of_freedom = 0.0;
};

/**
 * @brief Two-sided one-sample t-test.
 *
 * A sample with zero variance yields p = 1 when its mean equals the reference
 * and p = 0 otherwise. A single observation yields NaN.
 */
TTestResult oneSampleTTest(const std::vector<double> &values, double reference);

/**
 * @brief Two-sided confidence interval of the mean.
 *
 * Uses the normal quantile, or the Student's t quantile with n - 1 degrees of
 * freedom when fewer than @p small_sample observations are available.
 */
struct ConfidenceInterval {
	double lower = std::numeric_limits<double>::quiet_NaN();
	double upper = std::numeric_limits<double>::quiet_NaN();
};

ConfidenceInterval meanConfidenceInterval(const std::vector<double> &values, double level,
                                          std::size_t small_sample = 10);

} // namespace almanac::stats
