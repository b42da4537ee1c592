#include "almanac/stats/seasonal_statistics.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/stats/descriptive.hpp"
#include "almanac/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

namespace almanac::stats {

namespace {

struct PeriodGroup {
	std::vector<double> returns;
	/// Aggregate unit key (year, or running index for weekdays) -> summed return.
	std::map<long, double> aggregates;
	std::set<int> years;
};

int periodOf(const core::ReturnPoint &point, core::CalendarPeriod kind) {
	switch (kind) {
	case core::CalendarPeriod::Month:
		return static_cast<int>(point.month);
	case core::CalendarPeriod::Quarter:
		return static_cast<int>(point.quarter);
	case core::CalendarPeriod::Weekday:
		return static_cast<int>(point.weekday);
	}
	throw std::invalid_argument("Unknown calendar period.");
}

} // namespace

SeasonalStatistics::SeasonalStatistics(SeasonalStatisticsConfig config) : config_(config) {
	if (config_.ci_level <= 0.0 || config_.ci_level >= 1.0) {
		throw std::invalid_argument("ci_level must lie in (0, 1).");
	}
	if (config_.min_sample_years < 1) {
		throw std::invalid_argument("min_sample_years must be at least 1.");
	}
	if (config_.stability_window_years < 1) {
		throw std::invalid_argument("stability_window_years must be at least 1.");
	}
}

core::SeasonalStats SeasonalStatistics::compute(const core::ReturnSeries &returns, core::CalendarPeriod kind) const {
	core::SeasonalStats stats;
	if (returns.empty()) {
		return stats;
	}

	std::map<int, PeriodGroup> groups;
	double total = 0.0;
	long session = 0;
	for (const auto &point : returns) {
		auto &group = groups[periodOf(point, kind)];
		group.returns.push_back(point.daily_return);
		group.years.insert(point.year);
		const long key = kind == core::CalendarPeriod::Weekday ? session : static_cast<long>(point.year);
		group.aggregates[key] += point.daily_return;
		total += point.daily_return;
		++session;
	}
	const double baseline = total / static_cast<double>(returns.size());

	stats.reserve(groups.size());
	for (const auto &entry : groups) {
		const auto &group = entry.second;
		core::SeasonalStat stat;
		stat.kind = kind;
		stat.period = entry.first;
		stat.label = core::periodLabel(kind, entry.first);
		stat.sample_count = group.returns.size();
		stat.year_count = group.years.size();

		stat.mean_return = mean(group.returns);
		stat.median_return = median(group.returns);
		stat.std_dev = sampleStdDev(group.returns);

		std::vector<double> aggregates;
		aggregates.reserve(group.aggregates.size());
		std::size_t positive = 0;
		for (const auto &aggregate : group.aggregates) {
			aggregates.push_back(aggregate.second);
			if (aggregate.second > 0.0) {
				++positive;
			}
		}
		stat.win_rate = static_cast<double>(positive) / static_cast<double>(aggregates.size());
		stat.mean_aggregate_return = mean(aggregates);
		stat.best_aggregate_return = *std::max_element(aggregates.begin(), aggregates.end());
		stat.worst_aggregate_return = *std::min_element(aggregates.begin(), aggregates.end());
		stat.aggregate_volatility = sampleStdDev(aggregates);

		const auto vs_zero = oneSampleTTest(group.returns, 0.0);
		const auto vs_baseline = oneSampleTTest(group.returns, baseline);
		stat.p_value = vs_zero.p_value;
		stat.p_value_vs_baseline = vs_baseline.p_value;
		stat.effect_size = vs_zero.effect_size;
		stat.effect_size_vs_baseline = vs_baseline.effect_size;
		stat.significance_score = std::isnan(stat.p_value) ? std::numeric_limits<double>::quiet_NaN()
		                                                   : 1.0 - stat.p_value;

		const auto interval = meanConfidenceInterval(group.returns, config_.ci_level, config_.small_sample);
		stat.ci_lower = interval.lower;
		stat.ci_upper = interval.upper;

		stats.push_back(std::move(stat));
	}
	rollingStability(returns, stats);

	ALMANAC_DEBUG("Computed {} {} statistics over {} returns", stats.size(), core::toString(kind), returns.size());
	return stats;
}

void SeasonalStatistics::rollingStability(const core::ReturnSeries &returns, core::SeasonalStats &stats) const {
	if (stats.empty()) {
		return;
	}
	const auto kind = stats.front().kind;
	std::set<int> year_set;
	for (const auto &point : returns) {
		year_set.insert(point.year);
	}
	const std::vector<int> years(year_set.begin(), year_set.end());
	const auto window = static_cast<std::size_t>(config_.stability_window_years);
	if (years.size() < window) {
		return;
	}

	// period -> (windows seen, windows agreeing in sign)
	std::map<int, std::pair<std::size_t, std::size_t>> tallies;
	std::map<int, double> full_means;
	for (const auto &stat : stats) {
		full_means[stat.period] = stat.mean_return;
	}

	for (std::size_t first = 0; first + window <= years.size(); ++first) {
		const int from = years[first];
		const int to = years[first + window - 1];
		std::map<int, std::pair<double, std::size_t>> sums;
		for (const auto &point : returns) {
			if (point.year < from || point.year > to) {
				continue;
			}
			auto &sum = sums[periodOf(point, kind)];
			sum.first += point.daily_return;
			++sum.second;
		}
		for (const auto &entry : sums) {
			const auto full = full_means.find(entry.first);
			if (full == full_means.end()) {
				continue;
			}
			const double window_mean = entry.second.first / static_cast<double>(entry.second.second);
			auto &tally = tallies[entry.first];
			++tally.first;
			if ((window_mean > 0.0 && full->second > 0.0) || (window_mean < 0.0 && full->second < 0.0)) {
				++tally.second;
			}
		}
	}

	for (auto &stat : stats) {
		const auto tally = tallies.find(stat.period);
		if (tally == tallies.end() || tally->second.first == 0) {
			continue;
		}
		stat.stability_windows = tally->second.first;
		stat.stability = static_cast<double>(tally->second.second) / static_cast<double>(tally->second.first);
	}
}

bool SeasonalStatistics::isSignificant(const core::SeasonalStat &stat) const {
	if (std::isnan(stat.p_value)) {
		return false;
	}
	return stat.p_value <= config_.p_value_threshold &&
	       stat.year_count >= static_cast<std::size_t>(config_.min_sample_years);
}

core::Findings SeasonalStatistics::findings(const core::SeasonalStats &stats) const {
	core::Findings result;
	for (const auto &stat : stats) {
		if (isSignificant(stat) && stat.mean_return != 0.0) {
			result.push_back(makeFinding(stat));
		}
	}
	return result;
}

core::PatternFinding SeasonalStatistics::makeFinding(const core::SeasonalStat &stat) const {
	const bool strong = stat.mean_return > 0.0;

	insight::ConfidenceEvidence evidence;
	evidence.significance = stat.significance_score;
	const double win_consistency = strong ? stat.win_rate : 1.0 - stat.win_rate;
	evidence.consistency =
	    std::isnan(stat.stability) ? win_consistency : 0.5 * (win_consistency + stat.stability);
	evidence.reliability = std::min(1.0, static_cast<double>(stat.year_count) / config_.full_reliability_years);

	core::PatternFinding finding;
	finding.label = stat.label + (strong ? " seasonal strength" : " seasonal weakness");
	finding.description =
	    fmt::format("{} returned {:.3f}% per session on average ({:.1f}% per {} in aggregate), positive in {:.0f}% "
	                "of {} years (p = {:.4f})",
	                stat.label, stat.mean_return * 100.0, stat.mean_aggregate_return * 100.0,
	                core::toString(stat.kind), stat.win_rate * 100.0, stat.year_count, stat.p_value);
	finding.confidence = insight::blendConfidence(evidence);
	finding.metrics = {{"mean_return", stat.mean_return},
	                   {"mean_aggregate_return", stat.mean_aggregate_return},
	                   {"win_rate", stat.win_rate},
	                   {"p_value", stat.p_value},
	                   {"effect_size", stat.effect_size},
	                   {"stability", stat.stability},
	                   {"year_count", static_cast<double>(stat.year_count)}};
	finding.category = core::FindingCategory::Seasonal;
	finding.source = "seasonal_statistics";
	finding.scope = core::FindingScope::calendar(stat.kind, {stat.period});
	return finding;
}

} // namespace almanac::stats
