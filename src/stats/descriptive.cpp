#include "almanac/stats/descriptive.hpp"
#include "almanac/stats/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace almanac::stats {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kVarianceEpsilon = 1e-24;

} // namespace

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return kNaN;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double sampleVariance(const std::vector<double> &values) {
	if (values.size() < 2) {
		return kNaN;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double value : values) {
		const double diff = value - m;
		accum += diff * diff;
	}
	return accum / static_cast<double>(values.size() - 1);
}

double sampleStdDev(const std::vector<double> &values) {
	const double variance = sampleVariance(values);
	return std::isnan(variance) ? kNaN : std::sqrt(variance);
}

double median(std::vector<double> values) {
	return quantile(std::move(values), 0.5);
}

double quantile(std::vector<double> values, double q) {
	if (values.empty()) {
		return kNaN;
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile level must lie in [0, 1].");
	}
	std::sort(values.begin(), values.end());
	const double position = q * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, values.size() - 1);
	const double weight = position - static_cast<double>(lower);
	return values[lower] + weight * (values[upper] - values[lower]);
}

double correlation(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("Correlation requires samples of equal length.");
	}
	if (x.size() < 2) {
		return kNaN;
	}
	const double mx = mean(x);
	const double my = mean(y);
	double sxy = 0.0;
	double sxx = 0.0;
	double syy = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double dx = x[i] - mx;
		const double dy = y[i] - my;
		sxy += dx * dy;
		sxx += dx * dx;
		syy += dy * dy;
	}
	if (sxx <= kVarianceEpsilon || syy <= kVarianceEpsilon) {
		return kNaN;
	}
	return sxy / std::sqrt(sxx * syy);
}

TTestResult oneSampleTTest(const std::vector<double> &values, double reference) {
	TTestResult result;
	if (values.size() < 2) {
		return result;
	}
	const double n = static_cast<double>(values.size());
	const double m = mean(values);
	const double variance = sampleVariance(values);
	result.degrees_of_freedom = n - 1.0;

	if (variance <= kVarianceEpsilon) {
		const bool equal = std::abs(m - reference) <= 1e-12;
		result.statistic = equal ? 0.0 : std::copysign(std::numeric_limits<double>::infinity(), m - reference);
		result.p_value = equal ? 1.0 : 0.0;
		result.effect_size = equal ? 0.0 : result.statistic;
		return result;
	}

	const double sd = std::sqrt(variance);
	result.statistic = (m - reference) / (sd / std::sqrt(n));
	result.p_value = studentTTwoSidedPValue(result.statistic, result.degrees_of_freedom);
	result.effect_size = (m - reference) / sd;
	return result;
}

ConfidenceInterval meanConfidenceInterval(const std::vector<double> &values, double level,
                                          std::size_t small_sample) {
	if (level <= 0.0 || level >= 1.0) {
		throw std::invalid_argument("Confidence level must lie in (0, 1).");
	}
	ConfidenceInterval interval;
	if (values.empty()) {
		return interval;
	}
	const double m = mean(values);
	if (values.size() < 2) {
		interval.lower = m;
		interval.upper = m;
		return interval;
	}
	const double n = static_cast<double>(values.size());
	const double se = sampleStdDev(values) / std::sqrt(n);
	const double p = 0.5 + level / 2.0;
	const double critical = values.size() < small_sample ? studentTQuantile(p, n - 1.0) : normalQuantile(p);
	interval.lower = m - critical * se;
	interval.upper = m + critical * se;
	return interval;
}

} // namespace almanac::stats
