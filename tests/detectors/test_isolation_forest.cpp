#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/detectors/isolation_forest.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

using almanac::detectors::IsolationForestBuilder;
using almanac::features::Matrix;

namespace {

Matrix clusterWithOutlier(std::size_t count) {
	std::mt19937 rng(5);
	std::normal_distribution<double> noise(0.0, 1.0);
	Matrix X;
	for (std::size_t i = 0; i < count; ++i) {
		X.push_back({noise(rng), noise(rng)});
	}
	X.push_back({12.0, -12.0});
	return X;
}

} // namespace

TEST_CASE("Average path length normalisation", "[detectors][isolation_forest]") {
	REQUIRE(almanac::detectors::averagePathLength(1) == 0.0);
	REQUIRE(almanac::detectors::averagePathLength(2) == 1.0);
	REQUIRE(almanac::detectors::averagePathLength(10) == Catch::Approx(3.7488).margin(1e-3));
}

TEST_CASE("Isolated points score higher than the cluster", "[detectors][isolation_forest]") {
	const auto X = clusterWithOutlier(300);
	auto forest = IsolationForestBuilder().withTrees(100).withSubsample(128).withSeed(1).build();
	forest->fit(X);
	REQUIRE(forest->treeCount() == 100);

	const auto scores = forest->score(X);
	const double outlier = scores.back();
	REQUIRE(outlier == *std::max_element(scores.begin(), scores.end()));
	REQUIRE(outlier > 0.6);
	REQUIRE(forest->score({0.0, 0.0}) < 0.5);

	for (double score : scores) {
		REQUIRE(score > 0.0);
		REQUIRE(score <= 1.0);
	}

	const auto flagged = forest->outliers(X, 0.01);
	REQUIRE(std::find(flagged.begin(), flagged.end(), X.size() - 1) != flagged.end());
}

TEST_CASE("Training is deterministic for a seed", "[detectors][isolation_forest]") {
	const auto X = clusterWithOutlier(200);
	auto first = IsolationForestBuilder().withSeed(17).build();
	auto second = IsolationForestBuilder().withSeed(17).build();
	first->fit(X);
	second->fit(X);
	REQUIRE(first->score(X) == second->score(X));
}

TEST_CASE("Identical rows share one score and no outliers", "[detectors][isolation_forest]") {
	const Matrix X(50, {1.0, 2.0, 3.0});
	auto forest = IsolationForestBuilder().withTrees(10).build();
	forest->fit(X);
	const auto scores = forest->score(X);
	REQUIRE(std::all_of(scores.begin(), scores.end(), [&](double s) { return s == scores.front(); }));
	REQUIRE(forest->outliers(X, 0.1).empty());
}

TEST_CASE("Isolation forest error paths", "[detectors][isolation_forest]") {
	REQUIRE_THROWS_AS(IsolationForestBuilder().withTrees(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(IsolationForestBuilder().withSubsample(1).build(), std::invalid_argument);

	auto forest = IsolationForestBuilder().build();
	REQUIRE_THROWS_AS(forest->score({1.0}), std::runtime_error);
	REQUIRE_THROWS_AS(forest->fit({}), std::invalid_argument);
	REQUIRE_THROWS_AS(forest->fit({{1.0, 2.0}, {1.0}}), std::invalid_argument);

	forest->fit({{1.0}, {2.0}, {3.0}});
	REQUIRE_THROWS_AS(forest->score({1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(forest->outliers({{1.0}}, 0.0), std::invalid_argument);
}
