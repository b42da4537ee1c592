#include "almanac/regime/regime_classifier.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/stats/descriptive.hpp"
#include "almanac/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace almanac::regime {

namespace {

struct Segmented {
	std::vector<core::RegimeSegment> segments;
	/// Offset into the session vector where the last segment starts.
	std::size_t last_start = 0;
};

Segmented encode(core::RegimeDimension dimension, const std::vector<core::Regime> &states,
                 const std::vector<core::Date> &dates) {
	Segmented out;
	std::size_t start = 0;
	for (std::size_t i = 1; i <= states.size(); ++i) {
		if (i == states.size() || states[i] != states[start]) {
			out.segments.push_back(core::RegimeSegment{dimension, states[start], dates[start], dates[i - 1], i - start});
			out.last_start = start;
			start = i;
		}
	}
	return out;
}

double agreement(const std::vector<core::Regime> &raw, std::size_t from, core::Regime regime) {
	if (from >= raw.size()) {
		return 0.0;
	}
	const auto hits = std::count(raw.begin() + static_cast<std::ptrdiff_t>(from), raw.end(), regime);
	return static_cast<double>(hits) / static_cast<double>(raw.size() - from);
}

std::string regimeLabel(core::Regime regime) {
	switch (regime) {
	case core::Regime::HighVol:
		return "High volatility regime";
	case core::Regime::LowVol:
		return "Low volatility regime";
	case core::Regime::Bull:
		return "Bull trend regime";
	case core::Regime::Bear:
		return "Bear trend regime";
	case core::Regime::Neutral:
		return "Neutral trend regime";
	}
	return "Regime";
}

} // namespace

RegimeClassifier::RegimeClassifier(RegimeConfig config) : config_(config) {
	if (config_.window < 2) {
		throw std::invalid_argument("Regime window must be at least 2.");
	}
	if (config_.high_vol_percentile <= 0.0 || config_.high_vol_percentile >= 1.0) {
		throw std::invalid_argument("high_vol_percentile must lie in (0, 1).");
	}
	if (config_.min_run == 0) {
		throw std::invalid_argument("min_run must be positive.");
	}
}

std::vector<core::Regime> RegimeClassifier::smooth(const std::vector<core::Regime> &raw, std::size_t min_run) {
	std::vector<core::Regime> states(raw.size());
	if (raw.empty()) {
		return states;
	}
	core::Regime current = raw.front();
	std::size_t run_start = 0;
	for (std::size_t i = 0; i < raw.size(); ++i) {
		if (i > 0 && raw[i] != raw[i - 1]) {
			run_start = i;
		}
		states[i] = current;
		if (raw[i] != current && i - run_start + 1 >= min_run) {
			current = raw[i];
			std::fill(states.begin() + static_cast<std::ptrdiff_t>(run_start),
			          states.begin() + static_cast<std::ptrdiff_t>(i + 1), current);
		}
	}
	return states;
}

RegimeClassification RegimeClassifier::classify(const core::ReturnSeries &returns) const {
	RegimeClassification result;
	const std::size_t w = config_.window;
	if (returns.size() < w) {
		ALMANAC_WARN("Regime classification skipped: {} returns, window {}", returns.size(), w);
		return result;
	}

	std::vector<core::Date> dates;
	std::vector<double> volatility;
	std::vector<double> drift;
	for (std::size_t end = w; end <= returns.size(); ++end) {
		std::vector<double> window;
		window.reserve(w);
		for (std::size_t i = end - w; i < end; ++i) {
			window.push_back(returns[i].daily_return);
		}
		dates.push_back(returns[end - 1].date);
		volatility.push_back(stats::sampleStdDev(window));
		drift.push_back(stats::mean(window));
	}

	const double threshold = stats::quantile(volatility, config_.high_vol_percentile);
	std::vector<core::Regime> raw_vol;
	std::vector<core::Regime> raw_trend;
	for (std::size_t i = 0; i < dates.size(); ++i) {
		raw_vol.push_back(volatility[i] > threshold ? core::Regime::HighVol : core::Regime::LowVol);
		if (drift[i] > config_.trend_threshold) {
			raw_trend.push_back(core::Regime::Bull);
		} else if (drift[i] < -config_.trend_threshold) {
			raw_trend.push_back(core::Regime::Bear);
		} else {
			raw_trend.push_back(core::Regime::Neutral);
		}
	}

	const auto vol = encode(core::RegimeDimension::Volatility, smooth(raw_vol, config_.min_run), dates);
	const auto trend = encode(core::RegimeDimension::Trend, smooth(raw_trend, config_.min_run), dates);

	auto &summary = result.summary;
	summary.volatility_threshold = threshold;
	summary.segments = vol.segments;
	summary.segments.insert(summary.segments.end(), trend.segments.begin(), trend.segments.end());
	summary.current_volatility = vol.segments.back().regime;
	summary.current_trend = trend.segments.back().regime;

	const auto reliability = [&](const core::RegimeSegment &segment) {
		return std::min(1.0, static_cast<double>(segment.length) / static_cast<double>(3 * config_.min_run));
	};

	const auto &vol_segment = vol.segments.back();
	if (vol_segment.regime == core::Regime::HighVol) {
		const double current = volatility.back();
		const auto below = std::count_if(volatility.begin(), volatility.end(), [&](double v) { return v < current; });

		insight::ConfidenceEvidence evidence;
		evidence.significance = static_cast<double>(below) / static_cast<double>(volatility.size());
		evidence.consistency = agreement(raw_vol, vol.last_start, vol_segment.regime);
		evidence.reliability = reliability(vol_segment);

		core::PatternFinding finding;
		finding.label = regimeLabel(vol_segment.regime);
		finding.description = fmt::format(
		    "{}-day volatility of {:.2f}% has stayed above the {:.0f}th percentile ({:.2f}%) since {} ({} sessions)", w,
		    current * 100.0, config_.high_vol_percentile * 100.0, threshold * 100.0, vol_segment.start.toString(),
		    vol_segment.length);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"volatility", current}, {"threshold", threshold},
		                   {"sessions", static_cast<double>(vol_segment.length)}};
		finding.category = core::FindingCategory::Regime;
		finding.source = "regime_classifier";
		finding.scope = core::FindingScope::dated(core::DateRange{vol_segment.start, vol_segment.end});
		result.findings.push_back(std::move(finding));
	}

	const auto &trend_segment = trend.segments.back();
	if (trend_segment.regime != core::Regime::Neutral) {
		// Returns inside the segment; the segment's first date closes its first window.
		std::vector<double> segment_returns;
		for (const auto &point : returns) {
			if (trend_segment.start <= point.date && point.date <= trend_segment.end) {
				segment_returns.push_back(point.daily_return);
			}
		}

		insight::ConfidenceEvidence evidence;
		if (segment_returns.size() >= 2) {
			evidence.significance = 1.0 - stats::oneSampleTTest(segment_returns, 0.0).p_value;
		}
		evidence.consistency = agreement(raw_trend, trend.last_start, trend_segment.regime);
		evidence.reliability = reliability(trend_segment);

		const double segment_mean = stats::mean(segment_returns);
		core::PatternFinding finding;
		finding.label = regimeLabel(trend_segment.regime);
		finding.description =
		    fmt::format("Mean daily return of {:.3f}% since {} ({} sessions) against a {:.2f}% trend threshold",
		                segment_mean * 100.0, trend_segment.start.toString(), trend_segment.length,
		                config_.trend_threshold * 100.0);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"mean_return", segment_mean}, {"sessions", static_cast<double>(trend_segment.length)}};
		finding.category = core::FindingCategory::Regime;
		finding.source = "regime_classifier";
		finding.scope = core::FindingScope::dated(core::DateRange{trend_segment.start, trend_segment.end});
		result.findings.push_back(std::move(finding));
	}

	ALMANAC_INFO("Regimes: current {} / {}, {} segments", core::toString(*summary.current_volatility),
	             core::toString(*summary.current_trend), summary.segments.size());
	return result;
}

} // namespace almanac::regime
