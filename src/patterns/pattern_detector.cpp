#include "almanac/patterns/pattern_detector.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/insight/confidence.hpp"
#include "almanac/models/linear_model.hpp"
#include "almanac/models/random_forest.hpp"
#include "almanac/utils/logging.hpp"
#include "almanac/utils/metrics.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <stdexcept>

namespace almanac::patterns {

namespace {

constexpr double kFullReliabilityRows = 2520.0;

std::vector<double> toDouble(const std::vector<int> &values) {
	return std::vector<double>(values.begin(), values.end());
}

} // namespace

double directionalAccuracy(const std::vector<double> &predicted, const std::vector<double> &actual) {
	if (predicted.size() != actual.size() || predicted.empty()) {
		throw std::invalid_argument("Predicted and actual directions must be non-empty and equal length.");
	}
	std::size_t hits = 0;
	for (std::size_t i = 0; i < predicted.size(); ++i) {
		if ((predicted[i] > 0.5) == (actual[i] > 0.5)) {
			++hits;
		}
	}
	return static_cast<double>(hits) / static_cast<double>(predicted.size());
}

std::vector<models::ModelFactory> PatternDetector::defaultClassifiers(const PatternDetectorConfig &config) {
	std::vector<models::ModelFactory> factories;
	factories.emplace_back([config]() -> std::unique_ptr<models::IModel> {
		return models::RandomForest::builder()
		    .withTask(models::ModelTask::Classification)
		    .withTrees(config.forest_trees)
		    .withMaxDepth(config.forest_max_depth)
		    .withSeed(config.seed)
		    .build();
	});
	factories.emplace_back([]() -> std::unique_ptr<models::IModel> {
		return models::LinearModelBuilder().withTask(models::ModelTask::Classification).withLambda(10.0).build();
	});
	return factories;
}

PatternDetector::PatternDetector(PatternDetectorConfig config)
    : PatternDetector(config, defaultClassifiers(config)) {
}

PatternDetector::PatternDetector(PatternDetectorConfig config, std::vector<models::ModelFactory> classifiers)
    : config_(config), classifiers_(std::move(classifiers)) {
	if (config_.validation_fraction <= 0.0 || config_.validation_fraction >= 1.0) {
		throw std::invalid_argument("validation_fraction must lie in (0, 1).");
	}
	if (classifiers_.empty()) {
		throw std::invalid_argument("PatternDetector requires at least one classifier factory.");
	}
}

PatternDetection PatternDetector::detect(const features::FeatureMatrix &matrix) const {
	const std::size_t labelled = matrix.labelledCount();
	if (labelled < config_.min_training_rows) {
		throw core::ModelTrainingError("Pattern detection needs at least " + std::to_string(config_.min_training_rows) +
		                               " labelled feature rows, got " + std::to_string(labelled) + ".");
	}

	const auto train_count =
	    static_cast<std::size_t>(std::floor(static_cast<double>(labelled) * (1.0 - config_.validation_fraction)));
	if (train_count == 0 || train_count >= labelled) {
		throw core::ModelTrainingError("Validation split leaves no rows to train or validate on.");
	}

	const auto X_train = matrix.values(0, train_count);
	const auto y_train = toDouble(matrix.directions(0, train_count));
	const auto X_val = matrix.values(train_count, labelled);
	const auto y_val = toDouble(matrix.directions(train_count, labelled));

	const auto positives = static_cast<std::size_t>(std::count(y_train.begin(), y_train.end(), 1.0));
	if (positives == 0 || positives == y_train.size()) {
		throw core::ModelTrainingError("Training targets contain a single direction; nothing to learn.");
	}

	std::unique_ptr<models::IModel> best;
	double best_accuracy = -1.0;
	for (const auto &factory : classifiers_) {
		auto model = factory();
		try {
			model->fit(X_train, y_train);
		} catch (const std::exception &e) {
			ALMANAC_WARN("Pattern detection: {} failed to fit: {}", model->getName(), e.what());
			continue;
		}
		const double accuracy = directionalAccuracy(model->predict(X_val), y_val);
		ALMANAC_DEBUG("Pattern detection: {} validation accuracy {:.4f}", model->getName(), accuracy);
		if (accuracy > best_accuracy) {
			best_accuracy = accuracy;
			best = std::move(model);
		}
	}
	if (!best) {
		throw core::ModelTrainingError("No pattern classifier could be fitted.");
	}

	PatternDetection detection;
	auto &summary = detection.summary;
	summary.model = best->getName();
	summary.training_rows = train_count;
	summary.validation_rows = labelled - train_count;
	summary.validation_accuracy = best_accuracy;

	const double majority = positives * 2 >= y_train.size() ? 1.0 : 0.0;
	const auto baseline_hits = static_cast<std::size_t>(std::count(y_val.begin(), y_val.end(), majority));
	summary.baseline_accuracy = static_cast<double>(baseline_hits) / static_cast<double>(y_val.size());

	auto regressor = models::RandomForest::builder()
	                     .withTask(models::ModelTask::Regression)
	                     .withTrees(config_.forest_trees)
	                     .withMaxDepth(config_.forest_max_depth)
	                     .withSeed(config_.seed)
	                     .build();
	const auto r_train = matrix.forwardReturns(0, train_count);
	const auto r_val = matrix.forwardReturns(train_count, labelled);
	regressor->fit(X_train, r_train);
	summary.magnitude_mae = utils::Metrics::mae(r_val, regressor->predict(X_val));

	const auto importances = best->featureImportances();
	std::vector<std::size_t> order(importances.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(),
	                 [&](std::size_t a, std::size_t b) { return importances[a] > importances[b]; });

	const auto &names = matrix.featureNames();
	for (auto index : order) {
		summary.importances.push_back(core::FeatureImportance{names[index], importances[index]});
	}

	const double top_importance = importances.empty() ? 0.0 : importances[order.front()];
	const double reliability = std::min(1.0, static_cast<double>(labelled) / kFullReliabilityRows);
	const std::size_t top_k = std::min(config_.importance_top_k, order.size());

	for (std::size_t rank = 0; rank < top_k; ++rank) {
		const auto index = order[rank];
		const double importance = importances[index];
		if (importance <= 0.0 || best_accuracy < config_.min_validation_accuracy) {
			continue;
		}
		const auto scope = features::FeatureSchema::calendarScope(index);
		if (!scope) {
			continue;
		}

		insight::ConfidenceEvidence evidence;
		evidence.accuracy = best_accuracy;
		evidence.importance = importance / top_importance;
		evidence.reliability = reliability;

		core::PatternFinding finding;
		finding.label = core::periodLabel(scope->first, scope->second) + " calendar effect";
		finding.description = fmt::format(
		    "{} ranks #{} of {} features (importance {:.3f}) in a {} that calls the next session's direction "
		    "{:.1f}% of the time out of sample (baseline {:.1f}%)",
		    names[index], rank + 1, names.size(), importance, summary.model, best_accuracy * 100.0,
		    summary.baseline_accuracy * 100.0);
		finding.confidence = insight::blendConfidence(evidence);
		finding.metrics = {{"importance", importance},
		                   {"importance_rank", static_cast<double>(rank + 1)},
		                   {"validation_accuracy", best_accuracy},
		                   {"baseline_accuracy", summary.baseline_accuracy}};
		finding.category = core::FindingCategory::Seasonal;
		finding.source = "pattern_detection";
		finding.scope = core::FindingScope::calendar(scope->first, {scope->second});
		detection.findings.push_back(std::move(finding));
	}

	ALMANAC_INFO("Pattern detection selected {} ({:.1f}% validation accuracy, {} seasonal findings)", summary.model,
	             best_accuracy * 100.0, detection.findings.size());
	return detection;
}

} // namespace almanac::patterns
