#include "almanac/stats/seasonal_insights.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/stats/descriptive.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace almanac::stats {

namespace {

constexpr const char *kSource = "seasonal_insights";

std::string joinLabels(const std::vector<const core::SeasonalStat *> &stats) {
	std::string joined;
	for (std::size_t i = 0; i < stats.size(); ++i) {
		if (i > 0) {
			joined += ", ";
		}
		joined += stats[i]->label;
	}
	return joined;
}

std::vector<int> periodsOf(const std::vector<const core::SeasonalStat *> &stats) {
	std::vector<int> periods;
	periods.reserve(stats.size());
	for (const auto *stat : stats) {
		periods.push_back(stat->period);
	}
	return periods;
}

double meanOf(const std::vector<const core::SeasonalStat *> &stats, double core::SeasonalStat::*field) {
	std::vector<double> values;
	values.reserve(stats.size());
	for (const auto *stat : stats) {
		if (!std::isnan(stat->*field)) {
			values.push_back(stat->*field);
		}
	}
	return mean(values);
}

/// Mean monthly volatility over months that have one.
double meanVolatility(const core::SeasonalStats &monthly) {
	std::vector<double> values;
	for (const auto &stat : monthly) {
		if (!std::isnan(stat.aggregate_volatility)) {
			values.push_back(stat.aggregate_volatility);
		}
	}
	return mean(values);
}

std::vector<const core::SeasonalStat *> highVolatilityMonths(const core::SeasonalStats &monthly, double multiple) {
	std::vector<const core::SeasonalStat *> selected;
	const double average = meanVolatility(monthly);
	if (std::isnan(average) || average <= 0.0) {
		return selected;
	}
	for (const auto &stat : monthly) {
		if (!std::isnan(stat.aggregate_volatility) && stat.aggregate_volatility > average * multiple) {
			selected.push_back(&stat);
		}
	}
	return selected;
}

} // namespace

SeasonalInsights::SeasonalInsights(SeasonalInsightsConfig config) : config_(config) {
	if (config_.strength_volatility_range <= 0.0 || config_.strength_win_rate <= 0.0 ||
	    config_.strength_years <= 0.0 || config_.strength_return <= 0.0) {
		throw std::invalid_argument("Pattern strength normalisers must be positive.");
	}
}

double SeasonalInsights::reliability(const core::SeasonalStats &monthly) const {
	if (monthly.empty()) {
		return 0.0;
	}
	std::size_t min_years = monthly.front().year_count;
	for (const auto &stat : monthly) {
		min_years = std::min(min_years, stat.year_count);
	}
	return std::min(1.0, static_cast<double>(min_years) / config_.strength_years);
}

std::string SeasonalInsights::interpretStrength(double overall) {
	if (overall >= 0.8) {
		return "Very strong: highly reliable seasonal pattern";
	}
	if (overall >= 0.6) {
		return "Strong: reliable seasonal pattern with good consistency";
	}
	if (overall >= 0.4) {
		return "Moderate: some seasonal pattern with limitations";
	}
	if (overall >= 0.2) {
		return "Weak: limited seasonal pattern, use with caution";
	}
	return "Very weak: no meaningful seasonal pattern";
}

core::PatternStrength SeasonalInsights::assessStrength(const core::SeasonalStats &monthly) const {
	core::PatternStrength strength;
	if (monthly.empty()) {
		strength.interpretation = interpretStrength(0.0);
		return strength;
	}

	std::vector<double> volatilities;
	std::vector<double> win_rates;
	std::vector<double> abs_returns;
	for (const auto &stat : monthly) {
		if (!std::isnan(stat.aggregate_volatility)) {
			volatilities.push_back(stat.aggregate_volatility);
		}
		win_rates.push_back(stat.win_rate);
		abs_returns.push_back(std::abs(stat.mean_aggregate_return));
	}

	if (!volatilities.empty()) {
		const auto minmax = std::minmax_element(volatilities.begin(), volatilities.end());
		const double range = *minmax.second - *minmax.first;
		strength.consistency = std::max(0.0, 1.0 - range / config_.strength_volatility_range);
	}
	strength.win_rate_quality = std::min(1.0, mean(win_rates) / config_.strength_win_rate);
	strength.reliability = reliability(monthly);
	strength.return_magnitude = std::min(1.0, mean(abs_returns) / config_.strength_return);
	strength.overall =
	    (strength.consistency + strength.win_rate_quality + strength.reliability + strength.return_magnitude) / 4.0;
	strength.interpretation = interpretStrength(strength.overall);
	return strength;
}

core::Findings SeasonalInsights::riskFindings(const core::SeasonalStats &monthly) const {
	core::Findings findings;
	if (monthly.empty()) {
		return findings;
	}
	const double sample_reliability = reliability(monthly);

	std::size_t negative = 0;
	for (const auto &stat : monthly) {
		if (stat.mean_aggregate_return < 0.0) {
			++negative;
		}
	}
	const double concentration = static_cast<double>(negative) / static_cast<double>(monthly.size());
	if (concentration > config_.risk_concentration) {
		insight::ConfidenceEvidence evidence;
		evidence.consistency = concentration;
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "High risk concentration";
		finding.description = fmt::format("{} of {} months lose money on average; consider diversifying across "
		                                  "assets or periods",
		                                  negative, monthly.size());
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"risk_concentration", concentration},
		                   {"negative_months", static_cast<double>(negative)}};
		finding.category = core::FindingCategory::Risk;
		finding.source = kSource;
		finding.scope = core::FindingScope::global();
		findings.push_back(std::move(finding));
	}

	const auto worst = std::min_element(monthly.begin(), monthly.end(), [](const auto &a, const auto &b) {
		return a.worst_aggregate_return < b.worst_aggregate_return;
	});
	if (worst->worst_aggregate_return < config_.severe_drawdown) {
		insight::ConfidenceEvidence evidence;
		evidence.consistency = 1.0 - worst->win_rate;
		evidence.reliability = std::min(1.0, static_cast<double>(worst->year_count) / config_.strength_years);

		core::PatternFinding finding;
		finding.label = "Severe drawdown risk in " + worst->label;
		finding.description = fmt::format("The worst {} on record returned {:.1f}%; protective exits are advisable",
		                                  worst->label, worst->worst_aggregate_return * 100.0);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"worst_aggregate_return", worst->worst_aggregate_return},
		                   {"win_rate", worst->win_rate}};
		finding.category = core::FindingCategory::Risk;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, {worst->period});
		findings.push_back(std::move(finding));
	}

	const auto clustered = highVolatilityMonths(monthly, config_.volatility_cluster_multiple);
	if (clustered.size() >= config_.volatility_cluster_months) {
		insight::ConfidenceEvidence evidence;
		evidence.consistency = static_cast<double>(clustered.size()) / static_cast<double>(monthly.size());
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "Volatility clustering";
		finding.description = fmt::format("{} months ({}) are markedly more volatile than average", clustered.size(),
		                                  joinLabels(clustered));
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"high_volatility_months", static_cast<double>(clustered.size())},
		                   {"mean_volatility", meanVolatility(monthly)}};
		finding.category = core::FindingCategory::Risk;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, periodsOf(clustered));
		findings.push_back(std::move(finding));
	}
	return findings;
}

core::Findings SeasonalInsights::strategyFindings(const core::SeasonalStats &monthly) const {
	core::Findings findings;
	if (monthly.empty()) {
		return findings;
	}
	const double sample_reliability = reliability(monthly);

	std::vector<const core::SeasonalStat *> strong;
	std::vector<const core::SeasonalStat *> weak;
	for (const auto &stat : monthly) {
		if (stat.mean_aggregate_return > config_.momentum_return && stat.win_rate > config_.momentum_win_rate) {
			strong.push_back(&stat);
		}
		if (stat.mean_aggregate_return < config_.contrarian_return && stat.win_rate < config_.contrarian_win_rate) {
			weak.push_back(&stat);
		}
	}

	if (!strong.empty()) {
		const double win_rate = meanOf(strong, &core::SeasonalStat::win_rate);
		insight::ConfidenceEvidence evidence;
		evidence.significance = meanOf(strong, &core::SeasonalStat::significance_score);
		evidence.consistency = win_rate;
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "Seasonal momentum strategy";
		finding.description =
		    fmt::format("Increase allocation during {} (average {:.1f}% per month, {:.0f}% win rate)",
		                joinLabels(strong), meanOf(strong, &core::SeasonalStat::mean_aggregate_return) * 100.0,
		                win_rate * 100.0);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"expected_return", meanOf(strong, &core::SeasonalStat::mean_aggregate_return)},
		                   {"win_rate", win_rate}};
		finding.category = core::FindingCategory::Strategy;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, periodsOf(strong));
		findings.push_back(std::move(finding));
	}

	if (!weak.empty()) {
		const double win_rate = meanOf(weak, &core::SeasonalStat::win_rate);
		insight::ConfidenceEvidence evidence;
		evidence.significance = meanOf(weak, &core::SeasonalStat::significance_score);
		evidence.consistency = 1.0 - win_rate;
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "Seasonal contrarian strategy";
		finding.description = fmt::format("Reduce exposure or hedge during {}", joinLabels(weak));
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"expected_return", meanOf(weak, &core::SeasonalStat::mean_aggregate_return)},
		                   {"win_rate", win_rate}};
		finding.category = core::FindingCategory::Strategy;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, periodsOf(weak));
		findings.push_back(std::move(finding));
	}

	const auto volatile_months = highVolatilityMonths(monthly, config_.volatility_timing_multiple);
	if (!volatile_months.empty()) {
		const double ratio = meanOf(volatile_months, &core::SeasonalStat::aggregate_volatility) /
		                     meanVolatility(monthly);
		insight::ConfidenceEvidence evidence;
		evidence.consistency = std::min(1.0, ratio - 1.0);
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "Volatility timing strategy";
		finding.description = fmt::format("Volatility runs {:.1f}x the monthly average during {}", ratio,
		                                  joinLabels(volatile_months));
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"volatility_ratio", ratio}};
		finding.category = core::FindingCategory::Strategy;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, periodsOf(volatile_months));
		findings.push_back(std::move(finding));
	}

	const auto by_return = [](const core::SeasonalStat &a, const core::SeasonalStat &b) {
		return a.mean_aggregate_return < b.mean_aggregate_return;
	};
	const auto best = std::max_element(monthly.begin(), monthly.end(), by_return);
	const auto worst = std::min_element(monthly.begin(), monthly.end(), by_return);
	const double spread = best->mean_aggregate_return - worst->mean_aggregate_return;
	if (spread > config_.calendar_spread) {
		insight::ConfidenceEvidence evidence;
		evidence.significance = 1.0 - 0.5 * (best->p_value_vs_baseline + worst->p_value_vs_baseline);
		evidence.consistency = 0.5 * (best->win_rate + (1.0 - worst->win_rate));
		evidence.reliability = sample_reliability;

		core::PatternFinding finding;
		finding.label = "Calendar spread strategy";
		finding.description = fmt::format("Long {} / short {} spread of {:.1f}% per month", best->label, worst->label,
		                                  spread * 100.0);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"expected_spread", spread}};
		finding.category = core::FindingCategory::Strategy;
		finding.source = kSource;
		finding.scope = core::FindingScope::calendar(core::CalendarPeriod::Month, {best->period, worst->period});
		findings.push_back(std::move(finding));
	}
	return findings;
}

} // namespace almanac::stats
