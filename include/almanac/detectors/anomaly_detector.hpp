#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/features/feature_engineering.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace almanac::detectors {

struct AnomalyDetectorConfig {
	/// Percentile of the historical score distribution the latest score must exceed.
	double percentile = 0.95;
	int trees = 100;
	std::size_t subsample = 256;
	std::uint64_t seed = 42;
	/// Rows needed before the latest session is scored.
	std::size_t min_rows = 30;
	/// Years of history a month needs before its yearly aggregates are screened.
	std::size_t seasonal_min_years = 5;
	double seasonal_contamination = 0.1;
};

struct AnomalyDetection {
	core::AnomalySummary summary;
	core::Findings findings;
};

/**
 * @class AnomalyDetector
 * @brief Scores the latest session against the history with an isolation forest.
 */
class AnomalyDetector {
public:
	explicit AnomalyDetector(AnomalyDetectorConfig config = {});

	/**
	 * @brief Fits on the continuous features and evaluates the most recent row.
	 * @throws core::ModelTrainingError when the matrix has fewer than min_rows rows.
	 */
	AnomalyDetection detect(const features::FeatureMatrix &matrix, const core::ReturnSeries &returns) const;

	/**
	 * @brief Standard deviations of the month-to-date return at @p date from the
	 * same number of opening sessions of that month in other years.
	 *
	 * Years with fewer sessions in the month are skipped. NaN when fewer than two
	 * comparable years remain or their spread is zero.
	 */
	double monthToDateDeviation(const core::ReturnSeries &returns, const core::Date &date) const;

	/// Years whose aggregate return in a month was isolated from that month's other years.
	std::vector<core::SeasonalAnomaly> seasonalAnomalies(const core::ReturnSeries &returns) const;

	const AnomalyDetectorConfig &config() const {
		return config_;
	}

private:
	AnomalyDetectorConfig config_;
};

} // namespace almanac::detectors
