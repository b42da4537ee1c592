#include "almanac/insight/confidence.hpp"

#include <algorithm>
#include <cmath>

namespace almanac::insight {

double accuracyLift(double accuracy) {
	if (std::isnan(accuracy)) {
		return 0.0;
	}
	return std::clamp(2.0 * (accuracy - 0.5), 0.0, 1.0);
}

double blendConfidence(const ConfidenceEvidence &evidence) {
	double weighted = 0.0;
	double total_weight = 0.0;

	auto add = [&](const std::optional<double> &component, double weight) {
		if (!component || std::isnan(*component)) {
			return;
		}
		weighted += weight * std::clamp(*component, 0.0, 1.0);
		total_weight += weight;
	};

	add(evidence.significance, ConfidenceWeights::kSignificance);
	if (evidence.accuracy && !std::isnan(*evidence.accuracy)) {
		add(accuracyLift(*evidence.accuracy), ConfidenceWeights::kAccuracyLift);
	}
	add(evidence.consistency, ConfidenceWeights::kConsistency);
	add(evidence.importance, ConfidenceWeights::kImportance);
	add(evidence.reliability, ConfidenceWeights::kReliability);

	if (total_weight <= 0.0) {
		return 0.0;
	}
	return std::clamp(weighted / total_weight, 0.0, 1.0);
}

} // namespace almanac::insight
