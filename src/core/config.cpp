#include "almanac/core/config.hpp"
#include "almanac/core/errors.hpp"

#include <string>

namespace almanac::core {

namespace {

void require(bool condition, const std::string &message) {
	if (!condition) {
		throw ConfigurationError(message);
	}
}

} // namespace

void AnalysisConfig::validate() const {
	require(confidence_threshold >= 0.5 && confidence_threshold <= 0.99,
	        "confidence_threshold must lie in [0.5, 0.99].");
	for (int horizon : forecast_horizons) {
		require(horizon > 0, "forecast_horizons must contain positive day counts.");
	}
	require(min_sample_years >= 1, "min_sample_years must be at least 1.");
	require(structural_break_sensitivity > 0.0, "structural_break_sensitivity must be positive.");

	require(min_observations >= 2, "min_observations must be at least 2.");
	require(recommended_observations >= min_observations,
	        "recommended_observations must not be below min_observations.");
	require(volatility_window >= 2, "volatility_window must be at least 2.");

	require(p_value_threshold > 0.0 && p_value_threshold < 1.0, "p_value_threshold must lie in (0, 1).");
	require(ci_level > 0.0 && ci_level < 1.0, "ci_level must lie in (0, 1).");
	require(stability_window_years >= 1, "stability_window_years must be at least 1.");
	require(severe_drawdown > -1.0 && severe_drawdown < 0.0, "severe_drawdown must lie in (-1, 0).");

	require(min_training_rows >= 10, "min_training_rows must be at least 10.");
	require(validation_fraction > 0.0 && validation_fraction < 1.0, "validation_fraction must lie in (0, 1).");
	require(importance_top_k >= 1, "importance_top_k must be at least 1.");
	require(min_validation_accuracy >= 0.0 && min_validation_accuracy <= 1.0,
	        "min_validation_accuracy must lie in [0, 1].");
	require(forest_trees >= 1, "forest_trees must be at least 1.");
	require(forest_max_depth >= 1, "forest_max_depth must be at least 1.");

	require(anomaly_percentile > 0.0 && anomaly_percentile < 1.0, "anomaly_percentile must lie in (0, 1).");
	require(isolation_trees >= 1, "isolation_trees must be at least 1.");
	require(isolation_subsample >= 2, "isolation_subsample must be at least 2.");
	require(seasonal_anomaly_min_years >= 2, "seasonal_anomaly_min_years must be at least 2.");
	require(seasonal_anomaly_contamination > 0.0 && seasonal_anomaly_contamination < 0.5,
	        "seasonal_anomaly_contamination must lie in (0, 0.5).");

	require(decomposition_fallback_period >= 2, "decomposition_fallback_period must be at least 2.");
	require(decomposition_period >= decomposition_fallback_period,
	        "decomposition_period must not be below decomposition_fallback_period.");
	require(ljung_box_lags >= 1, "ljung_box_lags must be at least 1.");
	require(break_window >= 20, "break_window must be at least 20.");

	require(regime_window >= 2, "regime_window must be at least 2.");
	require(high_vol_percentile > 0.0 && high_vol_percentile < 1.0, "high_vol_percentile must lie in (0, 1).");
	require(trend_threshold >= 0.0, "trend_threshold must not be negative.");
	require(min_regime_run >= 1, "min_regime_run must be at least 1.");

	for (double level : forecast_confidence_levels) {
		require(level > 0.0 && level < 1.0, "forecast_confidence_levels must lie in (0, 1).");
	}
	require(cv_max_folds >= 1, "cv_max_folds must be at least 1.");
	require(changepoint_count >= 0, "changepoint_count must not be negative.");
	require(changepoint_range > 0.0 && changepoint_range <= 1.0, "changepoint_range must lie in (0, 1].");
}

} // namespace almanac::core
