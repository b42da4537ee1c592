#include "almanac/utils/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace almanac::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return std::sqrt(sum / static_cast<double>(actual.size()));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	size_t count = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double denom = std::abs(actual[i]);
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0)
		return std::nullopt;
	return (sum / static_cast<double>(count)) * 100.0;
}

std::optional<double> Metrics::directionalAccuracy(double origin, const std::vector<double> &actual,
                                                   const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	size_t hits = 0;
	size_t count = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double realised = actual[i] - origin;
		if (realised == 0.0) {
			continue;
		}
		const double forecast = predicted[i] - origin;
		++count;
		if ((realised > 0.0) == (forecast > 0.0)) {
			++hits;
		}
	}
	if (count == 0)
		return std::nullopt;
	return static_cast<double>(hits) / static_cast<double>(count);
}

double Metrics::coverage(const std::vector<double> &actual, const std::vector<double> &lower,
                         const std::vector<double> &upper) {
	const auto n = actual.size();
	if (n == 0) {
		throw std::invalid_argument("Metrics::coverage: Arrays must not be empty");
	}
	if (lower.size() != n || upper.size() != n) {
		throw std::invalid_argument("Metrics::coverage: Arrays must have the same length");
	}
	size_t inside = 0;
	for (size_t i = 0; i < n; ++i) {
		if (actual[i] >= lower[i] && actual[i] <= upper[i]) {
			++inside;
		}
	}
	return static_cast<double>(inside) / static_cast<double>(n);
}

} // namespace almanac::utils
