#include "almanac/insight/insight_aggregator.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace almanac::insight {

namespace {

bool ranksBefore(const core::PatternFinding &a, const core::PatternFinding &b) {
	if (a.confidence != b.confidence) {
		return a.confidence > b.confidence;
	}
	return a.label < b.label;
}

template <typename T>
void collect(const std::optional<core::ModuleResult<T>> &result, std::vector<core::UnavailableSection> &unavailable) {
	if (result && !result->ok()) {
		unavailable.push_back(result->error());
	}
}

} // namespace

InsightAggregator::InsightAggregator(double confidence_threshold) : confidence_threshold_(confidence_threshold) {
	if (confidence_threshold_ < 0.0 || confidence_threshold_ > 1.0) {
		throw std::invalid_argument("Confidence threshold must lie in [0, 1].");
	}
}

bool InsightAggregator::nearIdentical(const core::PatternFinding &a, const core::PatternFinding &b) {
	if (a.category != b.category || !a.scope.overlaps(b.scope)) {
		return false;
	}
	if (a.scope.kind == core::FindingScope::Kind::Global || a.source == b.source) {
		return a.label == b.label;
	}
	return true;
}

core::Findings InsightAggregator::merge(core::Findings findings) {
	std::stable_sort(findings.begin(), findings.end(), ranksBefore);
	core::Findings kept;
	for (auto &finding : findings) {
		auto match = std::find_if(kept.begin(), kept.end(),
		                          [&](const core::PatternFinding &existing) { return nearIdentical(existing, finding); });
		if (match != kept.end()) {
			match->corroborations += 1 + finding.corroborations;
			continue;
		}
		kept.push_back(std::move(finding));
	}
	return kept;
}

core::AnalysisResult InsightAggregator::aggregate(ModuleOutputs outputs) const {
	core::AnalysisResult result;
	result.symbol = std::move(outputs.symbol);
	result.range = outputs.range;
	result.observation_count = outputs.observation_count;
	result.reduced_history = outputs.reduced_history;
	result.monthly_stats = std::move(outputs.monthly_stats);
	result.quarterly_stats = std::move(outputs.quarterly_stats);
	result.weekday_stats = std::move(outputs.weekday_stats);
	result.pattern_strength = outputs.pattern_strength;
	result.risk_metrics = std::move(outputs.risk_metrics);

	core::Findings all = std::move(outputs.seasonal_findings);
	const auto append = [&all](const core::Findings &more) { all.insert(all.end(), more.begin(), more.end()); };

	if (outputs.patterns && outputs.patterns->ok()) {
		const auto &detection = outputs.patterns->value();
		result.pattern_model = detection.summary;
		append(detection.findings);
	}
	if (outputs.anomalies && outputs.anomalies->ok()) {
		const auto &detection = outputs.anomalies->value();
		result.anomaly = detection.summary;
		append(detection.findings);
	}
	if (outputs.decomposition && outputs.decomposition->ok()) {
		result.decomposition = outputs.decomposition->value();
	}
	if (outputs.structural_breaks && outputs.structural_breaks->ok()) {
		result.structural_breaks = outputs.structural_breaks->value();
	}
	if (outputs.regimes && outputs.regimes->ok()) {
		const auto &classification = outputs.regimes->value();
		result.regimes = classification.summary.segments;
		result.current_volatility_regime = classification.summary.current_volatility;
		result.current_trend_regime = classification.summary.current_trend;
		append(classification.findings);
	}

	collect(outputs.patterns, result.unavailable);
	collect(outputs.anomalies, result.unavailable);
	collect(outputs.decomposition, result.unavailable);
	collect(outputs.structural_breaks, result.unavailable);
	collect(outputs.regimes, result.unavailable);

	for (auto &forecast : outputs.forecasts) {
		if (forecast.ok()) {
			result.forecasts.push_back(std::move(forecast.value()));
		} else {
			result.unavailable.push_back(forecast.error());
		}
	}

	const std::size_t candidates = all.size();
	auto merged = merge(std::move(all));
	const auto cut = std::find_if(merged.begin(), merged.end(), [this](const core::PatternFinding &finding) {
		return finding.confidence < confidence_threshold_;
	});
	merged.erase(cut, merged.end());
	result.findings = std::move(merged);

	ALMANAC_INFO("Aggregated {} candidate findings into {} above confidence {:.2f}; {} sections unavailable", candidates,
	             result.findings.size(), confidence_threshold_, result.unavailable.size());
	return result;
}

} // namespace almanac::insight
