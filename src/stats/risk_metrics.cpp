#include "almanac/stats/risk_metrics.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/stats/descriptive.hpp"
#include "almanac/stats/distributions.hpp"
#include "almanac/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace almanac::stats {

namespace {

constexpr const char *kSource = "risk_metrics";
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

struct Moments {
	double mean = kNaN;
	/// Population standard deviation.
	double sd = kNaN;
	double skewness = kNaN;
	double excess_kurtosis = kNaN;
};

Moments momentsOf(const std::vector<double> &values) {
	Moments m;
	if (values.empty()) {
		return m;
	}
	const double n = static_cast<double>(values.size());
	m.mean = mean(values);
	double m2 = 0.0;
	double m3 = 0.0;
	double m4 = 0.0;
	for (double v : values) {
		const double d = v - m.mean;
		m2 += d * d;
		m3 += d * d * d;
		m4 += d * d * d * d;
	}
	m2 /= n;
	m3 /= n;
	m4 /= n;
	m.sd = std::sqrt(m2);
	if (m2 > 0.0) {
		m.skewness = m3 / std::pow(m2, 1.5);
		m.excess_kurtosis = m4 / (m2 * m2) - 3.0;
	}
	return m;
}

} // namespace

RiskAnalyzer::RiskAnalyzer(RiskMetricsConfig config) : config_(std::move(config)) {
	for (double level : config_.var_levels) {
		if (level <= 0.0 || level >= 0.5) {
			throw std::invalid_argument("VaR levels must lie in (0, 0.5).");
		}
	}
	if (config_.sessions_per_year <= 0.0) {
		throw std::invalid_argument("sessions_per_year must be positive.");
	}
	if (config_.severe_drawdown >= 0.0 || config_.severe_drawdown <= -1.0) {
		throw std::invalid_argument("severe_drawdown must lie in (-1, 0).");
	}
}

std::vector<core::ValueAtRisk> RiskAnalyzer::valueAtRisk(const std::vector<double> &returns,
                                                         const std::vector<double> &levels) {
	std::vector<core::ValueAtRisk> out;
	if (returns.empty()) {
		return out;
	}
	const auto m = momentsOf(returns);
	for (double level : levels) {
		core::ValueAtRisk var;
		var.level = level;
		var.historical = quantile(returns, level);

		double tail_sum = 0.0;
		std::size_t tail_count = 0;
		for (double r : returns) {
			if (r <= var.historical) {
				tail_sum += r;
				++tail_count;
			}
		}
		var.expected_shortfall = tail_count > 0 ? tail_sum / static_cast<double>(tail_count) : var.historical;

		const double z = normalQuantile(level);
		var.parametric = m.mean + m.sd * z;
		if (!std::isnan(m.skewness)) {
			const double s = m.skewness;
			const double k = m.excess_kurtosis;
			const double adjustment = (z * z - 1.0) * s / 6.0 + (z * z * z - 3.0 * z) * k / 24.0 -
			                          (2.0 * z * z * z - 5.0 * z) * s * s / 36.0;
			var.cornish_fisher = m.mean + m.sd * (z + adjustment);
		} else {
			var.cornish_fisher = var.parametric;
		}
		out.push_back(var);
	}
	return out;
}

core::DrawdownSummary RiskAnalyzer::drawdown(const std::vector<core::PriceObservation> &observations) {
	core::DrawdownSummary summary;
	if (observations.empty()) {
		return summary;
	}
	summary.peak = observations.front().date;
	summary.trough = observations.front().date;

	std::size_t running_peak = 0;
	std::size_t worst_peak = 0;
	std::size_t worst_trough = 0;
	for (std::size_t i = 1; i < observations.size(); ++i) {
		if (observations[i].close > observations[running_peak].close) {
			running_peak = i;
			continue;
		}
		const double peak_close = observations[running_peak].close;
		const double decline = (observations[i].close - peak_close) / peak_close;
		if (decline < summary.max_drawdown) {
			summary.max_drawdown = decline;
			worst_peak = running_peak;
			worst_trough = i;
		}
	}
	if (summary.max_drawdown == 0.0) {
		return summary;
	}

	summary.peak = observations[worst_peak].date;
	summary.trough = observations[worst_trough].date;
	summary.duration_days = summary.trough.toSerial() - summary.peak.toSerial();
	for (std::size_t i = worst_trough + 1; i < observations.size(); ++i) {
		if (observations[i].close >= observations[worst_peak].close) {
			summary.recovery = observations[i].date;
			break;
		}
	}
	return summary;
}

core::RiskMetrics RiskAnalyzer::compute(const core::PreparedSeries &series) const {
	if (series.returns.size() < 2) {
		throw std::invalid_argument("Risk metrics need at least two returns.");
	}
	std::vector<double> returns;
	returns.reserve(series.returns.size());
	std::vector<double> downside;
	for (const auto &point : series.returns) {
		returns.push_back(point.daily_return);
		if (point.daily_return < 0.0) {
			downside.push_back(point.daily_return);
		}
	}

	core::RiskMetrics metrics;
	const double annualiser = std::sqrt(config_.sessions_per_year);
	metrics.annual_return = mean(returns) * config_.sessions_per_year;
	metrics.annual_volatility = sampleStdDev(returns) * annualiser;
	if (metrics.annual_volatility > 0.0) {
		metrics.sharpe_ratio = (metrics.annual_return - config_.risk_free_rate) / metrics.annual_volatility;
	}
	const double downside_volatility = sampleStdDev(downside) * annualiser;
	if (downside_volatility > 0.0) {
		metrics.sortino_ratio = (metrics.annual_return - config_.risk_free_rate) / downside_volatility;
	}

	const auto moments = momentsOf(returns);
	metrics.skewness = moments.skewness;
	metrics.excess_kurtosis = moments.excess_kurtosis;
	if (!std::isnan(moments.skewness)) {
		const double n = static_cast<double>(returns.size());
		metrics.jarque_bera_statistic =
		    n / 6.0 * (moments.skewness * moments.skewness + moments.excess_kurtosis * moments.excess_kurtosis / 4.0);
		metrics.jarque_bera_p_value = chiSquareSurvival(metrics.jarque_bera_statistic, 2.0);
	}

	metrics.drawdown = drawdown(series.observations);
	if (metrics.drawdown.max_drawdown < 0.0) {
		metrics.calmar_ratio = std::abs(metrics.annual_return / metrics.drawdown.max_drawdown);
	}
	metrics.value_at_risk = valueAtRisk(returns, config_.var_levels);

	ALMANAC_DEBUG("Risk metrics for {}: annual return {:.4f}, volatility {:.4f}, max drawdown {:.4f}", series.symbol,
	              metrics.annual_return, metrics.annual_volatility, metrics.drawdown.max_drawdown);
	return metrics;
}

core::Findings RiskAnalyzer::findings(const core::RiskMetrics &metrics, std::size_t sessions) const {
	core::Findings out;
	const double reliability = std::min(1.0, static_cast<double>(sessions) / config_.full_reliability_sessions);

	const auto &dd = metrics.drawdown;
	if (dd.max_drawdown <= config_.severe_drawdown) {
		insight::ConfidenceEvidence evidence;
		evidence.consistency = std::min(1.0, dd.max_drawdown / (2.0 * config_.severe_drawdown));
		evidence.reliability = reliability;

		core::PatternFinding finding;
		finding.label = "Severe historical drawdown";
		finding.description = fmt::format("The close fell {:.1f}% from {} to {} over {} days{}",
		                                  -dd.max_drawdown * 100.0, dd.peak.toString(), dd.trough.toString(),
		                                  dd.duration_days,
		                                  dd.recovery ? " and recovered on " + dd.recovery->toString()
		                                              : std::string(" and has not recovered"));
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"max_drawdown", dd.max_drawdown},
		                   {"duration_days", static_cast<double>(dd.duration_days)},
		                   {"calmar_ratio", metrics.calmar_ratio}};
		finding.category = core::FindingCategory::Risk;
		finding.source = kSource;
		finding.scope = core::FindingScope::dated(core::DateRange{dd.peak, dd.recovery.value_or(dd.trough)});
		out.push_back(std::move(finding));
	}

	if (metrics.excess_kurtosis > config_.fat_tail_kurtosis &&
	    metrics.jarque_bera_p_value < config_.normality_p_value) {
		insight::ConfidenceEvidence evidence;
		evidence.significance = 1.0 - metrics.jarque_bera_p_value;
		evidence.reliability = reliability;

		const core::ValueAtRisk *five = nullptr;
		for (const auto &var : metrics.value_at_risk) {
			if (std::abs(var.level - 0.05) < 1e-9) {
				five = &var;
			}
		}

		core::PatternFinding finding;
		finding.label = "Fat-tailed returns";
		finding.description = fmt::format("Excess kurtosis {:.2f} (Jarque-Bera p = {:.4f}); extreme sessions are "
		                                  "more frequent than a normal model predicts",
		                                  metrics.excess_kurtosis, metrics.jarque_bera_p_value);
		if (five != nullptr) {
			finding.description += fmt::format(", 95% VaR {:.2f}% historical vs {:.2f}% normal",
			                                   five->historical * 100.0, five->parametric * 100.0);
		}
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"excess_kurtosis", metrics.excess_kurtosis},
		                   {"skewness", metrics.skewness},
		                   {"jarque_bera_p_value", metrics.jarque_bera_p_value}};
		finding.category = core::FindingCategory::Risk;
		finding.source = kSource;
		finding.scope = core::FindingScope::global();
		out.push_back(std::move(finding));
	}
	return out;
}

} // namespace almanac::stats
