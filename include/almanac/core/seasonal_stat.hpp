#pragma once

#include "almanac/core/calendar.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace almanac::core {

/**
 * @struct SeasonalStat
 * @brief Return statistics of one calendar period (a month, quarter or weekday).
 *
 * Daily-level figures (mean, median, standard deviation, tests) are computed
 * over every daily return that falls into the period. Aggregate figures use
 * one value per calendar year: the summed daily returns of the period in that
 * year. For weekdays the aggregate unit is the single session.
 */
struct SeasonalStat {
	static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

	CalendarPeriod kind = CalendarPeriod::Month;
	int period = 1;
	std::string label;

	std::size_t sample_count = 0;
	std::size_t year_count = 0;

	double mean_return = kNaN;
	double median_return = kNaN;
	double std_dev = kNaN;

	/// Fraction of aggregate units (years, or sessions for weekdays) with a positive return.
	double win_rate = kNaN;

	/// Two-sided p-value of a one-sample t-test of the daily mean against zero.
	double p_value = kNaN;
	/// Two-sided p-value of a one-sample t-test against the series-wide mean.
	double p_value_vs_baseline = kNaN;
	/// 1 - p_value.
	double significance_score = kNaN;

	/// Cohen's d of the daily mean against zero and against the series-wide mean.
	double effect_size = kNaN;
	double effect_size_vs_baseline = kNaN;

	/// Two-sided confidence interval of the daily mean.
	double ci_lower = kNaN;
	double ci_upper = kNaN;

	double mean_aggregate_return = kNaN;
	double best_aggregate_return = kNaN;
	double worst_aggregate_return = kNaN;
	/// Standard deviation of the aggregate returns; NaN with fewer than two units.
	double aggregate_volatility = kNaN;

	/// Share of rolling multi-year windows whose daily mean has the sign of the full-sample mean.
	double stability = kNaN;
	std::size_t stability_windows = 0;
};

using SeasonalStats = std::vector<SeasonalStat>;

} // namespace almanac::core
