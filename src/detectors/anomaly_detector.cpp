#include "almanac/detectors/anomaly_detector.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/detectors/isolation_forest.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/stats/descriptive.hpp"
#include "almanac/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace almanac::detectors {

namespace {

constexpr double kFullReliabilityRows = 1000.0;
constexpr double kMinStdDev = 1e-12;

/// Summed daily return per (year, month).
std::map<std::pair<int, unsigned>, double> monthlyAggregates(const core::ReturnSeries &returns) {
	std::map<std::pair<int, unsigned>, double> aggregates;
	for (const auto &point : returns) {
		aggregates[{point.year, point.month}] += point.daily_return;
	}
	return aggregates;
}

} // namespace

AnomalyDetector::AnomalyDetector(AnomalyDetectorConfig config) : config_(config) {
	if (config_.percentile <= 0.0 || config_.percentile >= 1.0) {
		throw std::invalid_argument("Anomaly percentile must lie in (0, 1).");
	}
	if (config_.min_rows < 2) {
		throw std::invalid_argument("Anomaly detection needs at least two rows.");
	}
}

AnomalyDetection AnomalyDetector::detect(const features::FeatureMatrix &matrix,
                                         const core::ReturnSeries &returns) const {
	if (matrix.size() < config_.min_rows) {
		throw core::ModelTrainingError("Anomaly detection needs at least " + std::to_string(config_.min_rows) +
		                               " feature rows, got " + std::to_string(matrix.size()) + ".");
	}

	const auto &columns = features::FeatureSchema::continuousIndices();
	const auto X = matrix.values(0, matrix.size(), columns);

	auto forest = IsolationForestBuilder()
	                  .withTrees(config_.trees)
	                  .withSubsample(config_.subsample)
	                  .withSeed(config_.seed)
	                  .build();
	forest->fit(X);
	const auto scores = forest->score(X);

	const std::vector<double> history(scores.begin(), scores.end() - 1);
	const double current = scores.back();

	AnomalyDetection detection;
	auto &summary = detection.summary;
	summary.evaluated_date = matrix.rows().back().date;
	summary.current_score = current;
	summary.threshold = stats::quantile(history, config_.percentile);
	summary.is_anomalous = current > summary.threshold;

	// Most deviating feature of the evaluated row relative to the history.
	const auto &names = matrix.featureNames();
	for (std::size_t c = 0; c < columns.size(); ++c) {
		std::vector<double> past;
		past.reserve(X.size() - 1);
		for (std::size_t r = 0; r + 1 < X.size(); ++r) {
			past.push_back(X[r][c]);
		}
		const double sd = stats::sampleStdDev(past);
		if (!(sd > kMinStdDev)) {
			continue;
		}
		const double z = (X.back()[c] - stats::mean(past)) / sd;
		if (std::isnan(summary.dominant_feature_z) || std::abs(z) > std::abs(summary.dominant_feature_z)) {
			summary.dominant_feature_z = z;
			summary.dominant_feature = names[columns[c]];
		}
	}

	const auto &latest = matrix.rows().back().date;
	const double month_to_date = monthToDateDeviation(returns, latest);
	summary.magnitude = std::isnan(month_to_date) ? summary.dominant_feature_z : month_to_date;

	summary.seasonal_anomalies = seasonalAnomalies(returns);

	if (summary.is_anomalous) {
		const auto below = std::count_if(history.begin(), history.end(), [&](double s) { return s < current; });

		insight::ConfidenceEvidence evidence;
		evidence.significance = static_cast<double>(below) / static_cast<double>(history.size());
		evidence.reliability = std::min(1.0, static_cast<double>(history.size()) / kFullReliabilityRows);

		core::PatternFinding finding;
		finding.label = "Unusual market behaviour on " + latest.toString();
		finding.description = fmt::format(
		    "Isolation score {:.3f} exceeds the {:.0f}th percentile of the history ({:.3f}); {} deviates by {:.2f} "
		    "standard deviations",
		    current, config_.percentile * 100.0, summary.threshold,
		    summary.dominant_feature.empty() ? std::string("no single feature") : summary.dominant_feature,
		    std::isnan(summary.dominant_feature_z) ? 0.0 : summary.dominant_feature_z);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"score", current}, {"threshold", summary.threshold}, {"magnitude", summary.magnitude}};
		finding.category = core::FindingCategory::Anomaly;
		finding.source = "anomaly_detection";
		finding.scope = core::FindingScope::dated(core::DateRange{latest, latest});
		detection.findings.push_back(std::move(finding));
	}

	ALMANAC_INFO("Anomaly detection: latest score {:.4f} vs threshold {:.4f}{}", current, summary.threshold,
	             summary.is_anomalous ? " (anomalous)" : "");
	return detection;
}

double AnomalyDetector::monthToDateDeviation(const core::ReturnSeries &returns, const core::Date &date) const {
	// Session returns per year of date's month, in date order.
	std::map<int, std::vector<double>> by_year;
	for (const auto &point : returns) {
		if (point.month != date.month || (point.year == date.year && date < point.date)) {
			continue;
		}
		by_year[point.year].push_back(point.daily_return);
	}
	const auto current = by_year.find(date.year);
	if (current == by_year.end()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const std::size_t sessions = current->second.size();
	const double current_sum = std::accumulate(current->second.begin(), current->second.end(), 0.0);

	std::vector<double> same_span;
	for (const auto &entry : by_year) {
		if (entry.first == date.year || entry.second.size() < sessions) {
			continue;
		}
		same_span.push_back(std::accumulate(entry.second.begin(), entry.second.begin() + sessions, 0.0));
	}
	if (same_span.size() < 2) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double sd = stats::sampleStdDev(same_span);
	if (!(sd > kMinStdDev)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return (current_sum - stats::mean(same_span)) / sd;
}

std::vector<core::SeasonalAnomaly> AnomalyDetector::seasonalAnomalies(const core::ReturnSeries &returns) const {
	const auto aggregates = monthlyAggregates(returns);
	std::vector<core::SeasonalAnomaly> anomalies;

	for (unsigned month = 1; month <= 12; ++month) {
		std::vector<int> years;
		features::Matrix values;
		for (const auto &entry : aggregates) {
			if (entry.first.second == month) {
				years.push_back(entry.first.first);
				values.push_back({entry.second});
			}
		}
		if (values.size() < config_.seasonal_min_years) {
			continue;
		}

		auto forest = IsolationForestBuilder()
		                  .withTrees(config_.trees)
		                  .withSubsample(config_.subsample)
		                  .withSeed(config_.seed)
		                  .build();
		forest->fit(values);
		const auto scores = forest->score(values);
		for (auto index : forest->outliers(values, config_.seasonal_contamination)) {
			anomalies.push_back(core::SeasonalAnomaly{years[index], month, values[index][0], scores[index]});
		}
	}
	return anomalies;
}

} // namespace almanac::detectors
