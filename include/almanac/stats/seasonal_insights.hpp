#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/seasonal_stat.hpp"

namespace almanac::stats {

/**
 * @struct SeasonalInsightsConfig
 * @brief Thresholds of the rule-based risk and strategy screens over monthly statistics.
 *
 * Returns are per-month aggregates (summed daily returns of the month in one year).
 */
struct SeasonalInsightsConfig {
	/// Fraction of months with a negative average above which risk is concentrated.
	double risk_concentration = 0.5;
	/// Worst single-month aggregate return below which drawdown risk is severe.
	double severe_drawdown = -0.15;
	/// A month is high-volatility above this multiple of the mean monthly volatility.
	double volatility_cluster_multiple = 1.5;
	std::size_t volatility_cluster_months = 3;

	double momentum_return = 0.02;
	double momentum_win_rate = 0.6;
	double contrarian_return = -0.01;
	double contrarian_win_rate = 0.4;
	double volatility_timing_multiple = 1.3;
	double calendar_spread = 0.05;

	/// Normalisers of the pattern-strength components.
	double strength_volatility_range = 0.20;
	double strength_win_rate = 0.7;
	double strength_years = 10.0;
	double strength_return = 0.05;
};

/**
 * @class SeasonalInsights
 * @brief Derives risk and strategy findings and a pattern-strength score from monthly statistics.
 */
class SeasonalInsights {
public:
	explicit SeasonalInsights(SeasonalInsightsConfig config = {});

	/**
	 * @brief Averages consistency, win-rate quality, reliability and return magnitude.
	 *
	 * Each component is normalised to [0, 1]; an empty input scores zero.
	 */
	core::PatternStrength assessStrength(const core::SeasonalStats &monthly) const;

	core::Findings riskFindings(const core::SeasonalStats &monthly) const;

	core::Findings strategyFindings(const core::SeasonalStats &monthly) const;

	static std::string interpretStrength(double overall);

	const SeasonalInsightsConfig &config() const {
		return config_;
	}

private:
	double reliability(const core::SeasonalStats &monthly) const;

	SeasonalInsightsConfig config_;
};

} // namespace almanac::stats
