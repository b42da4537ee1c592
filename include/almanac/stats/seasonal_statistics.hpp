#pragma once

#include "almanac/core/finding.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/core/seasonal_stat.hpp"

#include <cstddef>

namespace almanac::stats {

struct SeasonalStatisticsConfig {
	/// Level of the confidence interval of the daily mean.
	double ci_level = 0.95;
	/// Below this many returns the interval uses Student's t instead of the normal quantile.
	std::size_t small_sample = 10;
	/// Significance level a month must reach to become a finding.
	double p_value_threshold = 0.05;
	/// Calendar years a month must cover to become a finding.
	int min_sample_years = 3;
	/// Years of history at which a seasonal finding counts as fully reliable.
	double full_reliability_years = 10.0;
	/// Length in calendar years of the rolling windows behind SeasonalStat::stability.
	int stability_window_years = 5;
};

/**
 * @class SeasonalStatistics
 * @brief Groups daily returns by calendar period and tests each group.
 *
 * For every period value present in the series (month 1-12, quarter 1-4 or
 * weekday 0-6) the daily returns are summarised and tested twice with a
 * one-sample t-test: against zero and against the mean of the whole series.
 */
class SeasonalStatistics {
public:
	explicit SeasonalStatistics(SeasonalStatisticsConfig config = {});

	/**
	 * @brief Computes one SeasonalStat per period value present in @p returns.
	 * @return Stats ordered by period value; empty for an empty series.
	 */
	core::SeasonalStats compute(const core::ReturnSeries &returns, core::CalendarPeriod kind) const;

	/**
	 * @brief Fills SeasonalStat::stability for every stat in @p stats.
	 *
	 * Windows of stability_window_years consecutive calendar years slide one year
	 * at a time over the years present in @p returns. A window counts for a
	 * period when it contains returns of that period; the stat's stability is the
	 * share of those windows whose mean daily return has the sign of the stat's
	 * mean. Left NaN when the history is shorter than one window.
	 */
	void rollingStability(const core::ReturnSeries &returns, core::SeasonalStats &stats) const;

	/// True when @p stat passes the significance and history requirements.
	bool isSignificant(const core::SeasonalStat &stat) const;

	/// Turns the significant stats into seasonal findings.
	core::Findings findings(const core::SeasonalStats &stats) const;

	const SeasonalStatisticsConfig &config() const {
		return config_;
	}

private:
	core::PatternFinding makeFinding(const core::SeasonalStat &stat) const;

	SeasonalStatisticsConfig config_;
};

} // namespace almanac::stats
