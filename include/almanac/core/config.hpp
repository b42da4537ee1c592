#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace almanac::core {

/**
 * @struct AnalysisConfig
 * @brief Tuning knobs of one analysis run.
 *
 * Every field carries its default. Call validate() before using a config that
 * was assembled from user input; the engine does so before any computation.
 */
struct AnalysisConfig {
	/// Findings below this blended confidence are not reported. Must lie in [0.5, 0.99].
	double confidence_threshold = 0.75;

	bool enable_forecast = true;
	/// Forecast horizons in days, each positive.
	std::set<int> forecast_horizons = {30, 60, 90, 180, 365};

	bool enable_anomaly_detection = true;

	/// Minimum number of calendar years behind a surfaced seasonal finding.
	int min_sample_years = 3;

	/// z-threshold of the structural break tests.
	double structural_break_sensitivity = 2.0;

	/// Run the independent modules concurrently.
	bool parallel_modules = true;

	// Series preparation
	std::size_t min_observations = 50;
	std::size_t recommended_observations = 500;
	std::size_t max_fill_gap = 3;
	std::size_t volatility_window = 20;

	// Seasonal statistics
	double p_value_threshold = 0.05;
	double ci_level = 0.95;
	/// Calendar years per rolling window of the seasonal stability check.
	int stability_window_years = 5;

	// Risk metrics
	double risk_free_rate = 0.02;
	/// Maximum drawdown at or below which a risk finding is raised.
	double severe_drawdown = -0.20;

	// Pattern detection
	std::size_t min_training_rows = 100;
	double validation_fraction = 0.3;
	std::size_t importance_top_k = 5;
	double min_validation_accuracy = 0.55;
	int forest_trees = 100;
	int forest_max_depth = 8;
	std::uint64_t random_seed = 42;

	// Anomaly detection
	double anomaly_percentile = 0.95;
	int isolation_trees = 100;
	std::size_t isolation_subsample = 256;
	std::size_t seasonal_anomaly_min_years = 5;
	double seasonal_anomaly_contamination = 0.1;

	// Decomposition and structural breaks
	std::size_t decomposition_period = 252;
	std::size_t decomposition_fallback_period = 21;
	int ljung_box_lags = 10;
	std::size_t break_window = 63;

	// Regimes
	std::size_t regime_window = 20;
	double high_vol_percentile = 0.70;
	double trend_threshold = 0.001;
	std::size_t min_regime_run = 10;

	// Forecast
	std::vector<double> forecast_confidence_levels = {0.80, 0.95};
	int cv_max_folds = 5;
	int changepoint_count = 25;
	double changepoint_range = 0.8;

	/// @throws ConfigurationError when a field lies outside its domain.
	void validate() const;
};

} // namespace almanac::core
