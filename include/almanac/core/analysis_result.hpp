#pragma once

#include "almanac/core/calendar.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/forecast.hpp"
#include "almanac/core/market_state.hpp"
#include "almanac/core/module_result.hpp"
#include "almanac/core/seasonal_stat.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace almanac::core {

enum class DecompositionModel {
	Additive,
	Multiplicative
};

std::string toString(DecompositionModel model);

/**
 * @struct DecompositionSummary
 * @brief Seasonal decomposition of the price level and its residual diagnostics.
 */
struct DecompositionSummary {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	std::size_t period = 0;
	DecompositionModel model = DecompositionModel::Additive;

	/// Strength of seasonality and trend in [0, 1].
	double seasonal_strength = kNaN;
	double trend_strength = kNaN;
	/// Least-squares slope of the trend component per session, relative to its mean level.
	double trend_slope = kNaN;
	/// Peak-to-trough range of one seasonal cycle.
	double seasonal_amplitude = kNaN;

	/// Augmented Dickey-Fuller test on the price level (model selection).
	double level_adf_statistic = kNaN;
	double level_adf_p_value = kNaN;

	/// Augmented Dickey-Fuller test on the residual.
	double residual_adf_statistic = kNaN;
	double residual_adf_p_value = kNaN;
	bool residual_stationary = false;

	/// Ljung-Box portmanteau test on the residual.
	int ljung_box_lags = 10;
	double ljung_box_statistic = kNaN;
	double ljung_box_p_value = kNaN;
	bool residual_white_noise = false;
};

/**
 * @struct SeasonalAnomaly
 * @brief A calendar year in which one month's aggregate return was isolated from its history.
 */
struct SeasonalAnomaly {
	int year = 0;
	unsigned month = 1;
	double aggregate_return = 0.0;
	double score = 0.0;
};

/**
 * @struct AnomalySummary
 * @brief Outcome of scoring the most recent session against the history.
 */
struct AnomalySummary {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	Date evaluated_date;
	double current_score = kNaN;
	/// Score at the configured percentile of the historical distribution.
	double threshold = kNaN;
	bool is_anomalous = false;
	/// Standard deviations of the current month-to-date return from the same sessions in earlier years.
	double magnitude = kNaN;
	/// Feature with the largest absolute z-score on the evaluated row.
	std::string dominant_feature;
	double dominant_feature_z = kNaN;
	std::vector<SeasonalAnomaly> seasonal_anomalies;
};

struct FeatureImportance {
	std::string feature;
	double importance = 0.0;
};

/**
 * @struct PatternModelSummary
 * @brief The model selected by pattern detection and its out-of-sample quality.
 */
struct PatternModelSummary {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	std::string model;
	std::size_t training_rows = 0;
	std::size_t validation_rows = 0;
	double validation_accuracy = kNaN;
	/// Accuracy of always predicting the majority training class.
	double baseline_accuracy = kNaN;
	/// Validation mean absolute error of the forward-return magnitude regressor.
	double magnitude_mae = kNaN;
	/// Normalised importances, descending.
	std::vector<FeatureImportance> importances;
};

/**
 * @struct PatternStrength
 * @brief Overall assessment of how dependable the monthly pattern is.
 */
struct PatternStrength {
	double consistency = 0.0;
	double win_rate_quality = 0.0;
	double reliability = 0.0;
	double return_magnitude = 0.0;
	double overall = 0.0;
	std::string interpretation;
};

/**
 * @struct ValueAtRisk
 * @brief One-session loss quantile of the daily returns at one tail probability.
 */
struct ValueAtRisk {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	/// Tail probability, e.g. 0.05 for the 95% VaR.
	double level = 0.05;
	/// Empirical quantile of the returns.
	double historical = kNaN;
	/// Normal quantile from the mean and population standard deviation.
	double parametric = kNaN;
	/// Normal quantile adjusted for skewness and excess kurtosis.
	double cornish_fisher = kNaN;
	/// Mean of the returns at or below the historical VaR (CVaR).
	double expected_shortfall = kNaN;
};

/**
 * @struct DrawdownSummary
 * @brief Deepest peak-to-trough decline of the closing price.
 */
struct DrawdownSummary {
	/// Relative decline from the peak, <= 0.
	double max_drawdown = 0.0;
	Date peak;
	Date trough;
	/// First session back at the peak close; empty while still under water.
	std::optional<Date> recovery;
	/// Calendar days from peak to trough.
	std::int64_t duration_days = 0;
};

/**
 * @struct RiskMetrics
 * @brief Series-level return and risk profile over the whole history.
 */
struct RiskMetrics {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	double annual_return = kNaN;
	double annual_volatility = kNaN;
	double sharpe_ratio = kNaN;
	double sortino_ratio = kNaN;
	double calmar_ratio = kNaN;
	double skewness = kNaN;
	double excess_kurtosis = kNaN;
	double jarque_bera_statistic = kNaN;
	double jarque_bera_p_value = kNaN;
	DrawdownSummary drawdown;
	std::vector<ValueAtRisk> value_at_risk;
};

/**
 * @struct RegimeSummary
 * @brief Regime segmentation plus the regime in force on the latest date.
 */
struct RegimeSummary {
	std::vector<RegimeSegment> segments;
	std::optional<Regime> current_volatility;
	std::optional<Regime> current_trend;
	double volatility_threshold = std::numeric_limits<double>::quiet_NaN();
};

/**
 * @struct AnalysisResult
 * @brief Everything one analysis run produced for one symbol.
 *
 * The value is owned by the caller; the engine keeps no reference to it.
 */
struct AnalysisResult {
	std::string symbol;
	DateRange range;
	std::size_t observation_count = 0;
	bool reduced_history = false;

	SeasonalStats monthly_stats;
	SeasonalStats quarterly_stats;
	SeasonalStats weekday_stats;

	/// Findings above the confidence threshold, most confident first.
	Findings findings;

	std::vector<ForecastResult> forecasts;
	std::vector<RegimeSegment> regimes;
	std::optional<Regime> current_volatility_regime;
	std::optional<Regime> current_trend_regime;
	std::vector<StructuralBreak> structural_breaks;

	std::optional<DecompositionSummary> decomposition;
	std::optional<AnomalySummary> anomaly;
	std::optional<PatternModelSummary> pattern_model;
	std::optional<PatternStrength> pattern_strength;
	std::optional<RiskMetrics> risk_metrics;

	std::vector<UnavailableSection> unavailable;

	bool isUnavailable(const std::string &module) const {
		for (const auto &section : unavailable) {
			if (section.module == module) {
				return true;
			}
		}
		return false;
	}

	const ForecastResult *forecastFor(int horizon) const {
		for (const auto &result : forecasts) {
			if (result.horizon_days == horizon) {
				return &result;
			}
		}
		return nullptr;
	}
};

} // namespace almanac::core
