#pragma once

#include <optional>

namespace almanac::insight {

/**
 * @struct ConfidenceEvidence
 * @brief Evidence components behind a finding, each in [0, 1] when present.
 */
struct ConfidenceEvidence {
	/// 1 - p-value of the finding's statistical test.
	std::optional<double> significance;
	/// Out-of-sample directional accuracy of a model, raw (the blend converts it to lift).
	std::optional<double> accuracy;
	/// How consistently the pattern repeated (e.g. win rate in its direction).
	std::optional<double> consistency;
	/// Normalised feature importance.
	std::optional<double> importance;
	/// Sample adequacy, e.g. years of history / 10.
	std::optional<double> reliability;
};

struct ConfidenceWeights {
	static constexpr double kSignificance = 0.40;
	static constexpr double kAccuracyLift = 0.25;
	static constexpr double kConsistency = 0.15;
	static constexpr double kImportance = 0.10;
	static constexpr double kReliability = 0.10;
};

/// 2 * (accuracy - 0.5), clamped to [0, 1].
double accuracyLift(double accuracy);

/**
 * @brief Weighted mean of the present evidence components, clamped to [0, 1].
 *
 * Returns 0 when no component is present. Components are clamped to [0, 1]
 * before weighting; NaN components count as absent.
 */
double blendConfidence(const ConfidenceEvidence &evidence);

} // namespace almanac::insight
