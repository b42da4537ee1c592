#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/module_result.hpp"
#include "almanac/detectors/anomaly_detector.hpp"
#include "almanac/patterns/pattern_detector.hpp"
#include "almanac/regime/regime_classifier.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace almanac::insight {

/**
 * @struct ModuleOutputs
 * @brief Everything the analysis modules produced for one run.
 *
 * An empty optional means the module was not run (disabled); an unavailable
 * ModuleResult means it ran and failed softly.
 */
struct ModuleOutputs {
	std::string symbol;
	core::DateRange range;
	std::size_t observation_count = 0;
	bool reduced_history = false;

	core::SeasonalStats monthly_stats;
	core::SeasonalStats quarterly_stats;
	core::SeasonalStats weekday_stats;
	/// Seasonal statistics findings plus seasonal risk, strategy and series risk findings.
	core::Findings seasonal_findings;
	std::optional<core::PatternStrength> pattern_strength;
	std::optional<core::RiskMetrics> risk_metrics;

	std::optional<core::ModuleResult<patterns::PatternDetection>> patterns;
	std::optional<core::ModuleResult<detectors::AnomalyDetection>> anomalies;
	std::optional<core::ModuleResult<core::DecompositionSummary>> decomposition;
	std::optional<core::ModuleResult<std::vector<core::StructuralBreak>>> structural_breaks;
	std::optional<core::ModuleResult<regime::RegimeClassification>> regimes;
	std::vector<core::ModuleResult<core::ForecastResult>> forecasts;
};

/**
 * @class InsightAggregator
 * @brief Merges module findings into the ranked, filtered AnalysisResult.
 *
 * Two findings are near-identical when they share a category and their scopes
 * overlap. Global scopes, and two findings from the same module, additionally
 * need the same label. Of a near-identical group only the most confident
 * finding survives; it counts the others as corroborations. Survivors are
 * ordered by confidence, descending, ties broken by label, and cut at the
 * confidence threshold.
 */
class InsightAggregator {
public:
	/// @throws std::invalid_argument when the threshold lies outside [0, 1].
	explicit InsightAggregator(double confidence_threshold = 0.75);

	core::AnalysisResult aggregate(ModuleOutputs outputs) const;

	/// De-duplicates and orders findings without applying the threshold.
	static core::Findings merge(core::Findings findings);

	static bool nearIdentical(const core::PatternFinding &a, const core::PatternFinding &b);

	double confidenceThreshold() const {
		return confidence_threshold_;
	}

private:
	double confidence_threshold_;
};

} // namespace almanac::insight
