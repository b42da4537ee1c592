#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/core/errors.hpp"
#include "almanac/features/feature_engineering.hpp"
#include "almanac/patterns/pattern_detector.hpp"

#include "common/series_helpers.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

using almanac::core::ModelTrainingError;
using almanac::features::FeatureEngineer;
using almanac::patterns::PatternDetector;
using almanac::patterns::PatternDetectorConfig;

namespace {

PatternDetectorConfig fastConfig() {
	PatternDetectorConfig config;
	config.forest_trees = 20;
	config.forest_max_depth = 5;
	return config;
}

class ThrowingModel : public almanac::models::IModel {
public:
	void fit(const almanac::features::Matrix &, const std::vector<double> &) override {
		throw std::runtime_error("singular design");
	}
	std::vector<double> predict(const almanac::features::Matrix &X) const override {
		return std::vector<double>(X.size(), 0.0);
	}
	std::vector<double> featureImportances() const override {
		return {};
	}
	almanac::models::ModelTask task() const override {
		return almanac::models::ModelTask::Classification;
	}
	std::string getName() const override {
		return "Throwing";
	}
};

} // namespace

TEST_CASE("Directional accuracy counts matching labels", "[patterns]") {
	REQUIRE(almanac::patterns::directionalAccuracy({1.0, 0.0, 1.0, 1.0}, {1.0, 1.0, 1.0, 0.0}) ==
	        Catch::Approx(0.5));
	REQUIRE_THROWS_AS(almanac::patterns::directionalAccuracy({1.0}, {1.0, 0.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(almanac::patterns::directionalAccuracy({}, {}), std::invalid_argument);
}

TEST_CASE("Pattern detection needs enough labelled rows", "[patterns]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::randomWalk(150));
	const auto matrix = FeatureEngineer().build(prepared);
	REQUIRE(matrix.labelledCount() < 100);
	REQUIRE_THROWS_AS(PatternDetector(fastConfig()).detect(matrix), ModelTrainingError);
}

TEST_CASE("A single training direction cannot be learned", "[patterns]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::flatSeries(300));
	const auto matrix = FeatureEngineer().build(prepared);
	REQUIRE(matrix.labelledCount() >= 100);
	REQUIRE_THROWS_AS(PatternDetector(fastConfig()).detect(matrix), ModelTrainingError);
}

TEST_CASE("Pattern detection selects a model and ranks features", "[patterns]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::randomWalk(700));
	const auto matrix = FeatureEngineer().build(prepared);
	const auto detection = PatternDetector(fastConfig()).detect(matrix);
	const auto &summary = detection.summary;

	const auto labelled = matrix.labelledCount();
	REQUIRE(summary.training_rows == static_cast<std::size_t>(std::floor(static_cast<double>(labelled) * 0.7)));
	REQUIRE(summary.training_rows + summary.validation_rows == labelled);
	REQUIRE((summary.model == "RandomForestClassifier" || summary.model == "RidgeClassifier"));
	REQUIRE(summary.validation_accuracy >= 0.0);
	REQUIRE(summary.validation_accuracy <= 1.0);
	REQUIRE(summary.baseline_accuracy >= 0.0);
	REQUIRE(summary.magnitude_mae >= 0.0);

	REQUIRE(summary.importances.size() == matrix.featureNames().size());
	for (std::size_t i = 1; i < summary.importances.size(); ++i) {
		REQUIRE(summary.importances[i - 1].importance >= summary.importances[i].importance);
	}

	for (const auto &finding : detection.findings) {
		REQUIRE(finding.source == "pattern_detection");
		REQUIRE(finding.scope.kind == almanac::core::FindingScope::Kind::Calendar);
		REQUIRE(finding.confidence >= 0.0);
		REQUIRE(finding.confidence <= 1.0);
		REQUIRE(summary.validation_accuracy >= 0.55);
	}
}

TEST_CASE("Pattern detection is deterministic", "[patterns]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::randomWalk(400));
	const auto matrix = FeatureEngineer().build(prepared);
	const PatternDetector detector(fastConfig());
	const auto first = detector.detect(matrix);
	const auto second = detector.detect(matrix);
	REQUIRE(first.summary.model == second.summary.model);
	REQUIRE(first.summary.validation_accuracy == second.summary.validation_accuracy);
	REQUIRE(first.findings.size() == second.findings.size());
}

TEST_CASE("Classifiers that fail to fit are skipped", "[patterns]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::randomWalk(400));
	const auto matrix = FeatureEngineer().build(prepared);

	std::vector<almanac::models::ModelFactory> only_failing{
	    []() -> std::unique_ptr<almanac::models::IModel> { return std::make_unique<ThrowingModel>(); }};
	REQUIRE_THROWS_AS(PatternDetector(fastConfig(), only_failing).detect(matrix), ModelTrainingError);

	auto mixed = PatternDetector::defaultClassifiers(fastConfig());
	mixed.insert(mixed.begin(), only_failing.front());
	REQUIRE_NOTHROW(PatternDetector(fastConfig(), mixed).detect(matrix));
}

TEST_CASE("Pattern detector configuration is validated", "[patterns]") {
	auto config = fastConfig();
	config.validation_fraction = 1.0;
	REQUIRE_THROWS_AS(PatternDetector(config), std::invalid_argument);
	REQUIRE_THROWS_AS(PatternDetector(fastConfig(), {}), std::invalid_argument);
}
