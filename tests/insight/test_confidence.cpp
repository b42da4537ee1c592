#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/insight/confidence.hpp"

#include <cmath>

using almanac::insight::accuracyLift;
using almanac::insight::blendConfidence;
using almanac::insight::ConfidenceEvidence;

TEST_CASE("Accuracy lift rescales accuracy above chance", "[insight][confidence]") {
	CHECK(accuracyLift(0.5) == 0.0);
	CHECK(accuracyLift(0.75) == Catch::Approx(0.5));
	CHECK(accuracyLift(1.0) == 1.0);
	CHECK(accuracyLift(0.3) == 0.0);
	CHECK(accuracyLift(std::nan("")) == 0.0);
}

TEST_CASE("Confidence blends the present evidence", "[insight][confidence]") {
	CHECK(blendConfidence({}) == 0.0);

	ConfidenceEvidence significance_only;
	significance_only.significance = 0.9;
	CHECK(blendConfidence(significance_only) == Catch::Approx(0.9));

	ConfidenceEvidence mixed;
	mixed.significance = 1.0;
	mixed.consistency = 0.0;
	CHECK(blendConfidence(mixed) == Catch::Approx(0.40 / 0.55));

	ConfidenceEvidence model;
	model.accuracy = 0.75;
	model.importance = 1.0;
	CHECK(blendConfidence(model) == Catch::Approx((0.25 * 0.5 + 0.10) / 0.35));
}

TEST_CASE("Confidence ignores NaN and clamps components", "[insight][confidence]") {
	ConfidenceEvidence evidence;
	evidence.significance = std::nan("");
	evidence.reliability = 0.5;
	CHECK(blendConfidence(evidence) == Catch::Approx(0.5));

	ConfidenceEvidence excessive;
	excessive.consistency = 1.5;
	excessive.reliability = -0.5;
	CHECK(blendConfidence(excessive) == Catch::Approx(0.15 / 0.25));
}
