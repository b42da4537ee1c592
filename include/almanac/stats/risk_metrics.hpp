#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <vector>

namespace almanac::stats {

struct RiskMetricsConfig {
	/// Tail probabilities of the value-at-risk estimates.
	std::vector<double> var_levels = {0.01, 0.05, 0.10};
	/// Annual risk-free rate subtracted in the Sharpe and Sortino ratios.
	double risk_free_rate = 0.02;
	double sessions_per_year = 252.0;
	/// Maximum drawdown at or below which a risk finding is raised.
	double severe_drawdown = -0.20;
	/// Excess kurtosis above which returns count as fat-tailed.
	double fat_tail_kurtosis = 3.0;
	/// Jarque-Bera significance level of the fat-tail finding.
	double normality_p_value = 0.05;
	/// Sessions at which a risk finding counts as fully reliable.
	double full_reliability_sessions = 1260.0;
};

/**
 * @class RiskAnalyzer
 * @brief Whole-history return and risk profile of a prepared series.
 *
 * Annualised figures scale the daily mean by sessions_per_year and the sample
 * standard deviation by its square root. Skewness and excess kurtosis are the
 * biased moment estimators.
 */
class RiskAnalyzer {
public:
	explicit RiskAnalyzer(RiskMetricsConfig config = {});

	/// @throws std::invalid_argument when @p series has fewer than two returns.
	core::RiskMetrics compute(const core::PreparedSeries &series) const;

	/**
	 * @brief Historical, parametric and Cornish-Fisher VaR plus expected shortfall
	 * for each tail probability in @p levels.
	 */
	static std::vector<core::ValueAtRisk> valueAtRisk(const std::vector<double> &returns,
	                                                  const std::vector<double> &levels);

	/// Deepest decline of the close from its running peak.
	static core::DrawdownSummary drawdown(const std::vector<core::PriceObservation> &observations);

	/// Severe-drawdown and fat-tail risk findings.
	core::Findings findings(const core::RiskMetrics &metrics, std::size_t sessions) const;

	const RiskMetricsConfig &config() const {
		return config_;
	}

private:
	RiskMetricsConfig config_;
};

} // namespace almanac::stats
