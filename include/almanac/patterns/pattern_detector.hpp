#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/features/feature_engineering.hpp"
#include "almanac/models/imodel.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace almanac::patterns {

struct PatternDetectorConfig {
	std::size_t min_training_rows = 100;
	/// Trailing share of the labelled rows held out for validation.
	double validation_fraction = 0.3;
	std::size_t importance_top_k = 5;
	double min_validation_accuracy = 0.55;
	int forest_trees = 100;
	int forest_max_depth = 8;
	std::uint64_t seed = 42;
};

/**
 * @struct PatternDetection
 * @brief Selected model summary plus the seasonal findings it supports.
 */
struct PatternDetection {
	core::PatternModelSummary summary;
	core::Findings findings;
};

/**
 * @class PatternDetector
 * @brief Learns which engineered features predict the next session's direction.
 *
 * Rows are split in time order: the leading share trains, the trailing share
 * validates. Every configured classifier is fitted and the one with the best
 * validation directional accuracy is kept. Calendar indicators that rank among
 * its most important features become seasonal findings when the model beats
 * the accuracy floor out of sample.
 */
class PatternDetector {
public:
	/// Uses the default classifiers: a random forest and a ridge baseline.
	explicit PatternDetector(PatternDetectorConfig config = {});

	PatternDetector(PatternDetectorConfig config, std::vector<models::ModelFactory> classifiers);

	/**
	 * @throws core::ModelTrainingError with fewer than min_training_rows labelled rows, when
	 *         the training targets contain a single class, or when no classifier can be fitted.
	 */
	PatternDetection detect(const features::FeatureMatrix &matrix) const;

	const PatternDetectorConfig &config() const {
		return config_;
	}

	/// Classifier factories used when none are supplied.
	static std::vector<models::ModelFactory> defaultClassifiers(const PatternDetectorConfig &config);

private:
	PatternDetectorConfig config_;
	std::vector<models::ModelFactory> classifiers_;
};

/// Share of positions where @p predicted equals @p actual.
double directionalAccuracy(const std::vector<double> &predicted, const std::vector<double> &actual);

} // namespace almanac::patterns
