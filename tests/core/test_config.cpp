#include <catch2/catch_test_macros.hpp>

#include "almanac/core/config.hpp"
#include "almanac/core/errors.hpp"

using almanac::core::AnalysisConfig;
using almanac::core::ConfigurationError;

TEST_CASE("Default configuration is valid", "[core][config]") {
	AnalysisConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.confidence_threshold == 0.75);
	REQUIRE(config.forecast_horizons == std::set<int>{30, 60, 90, 180, 365});
	REQUIRE(config.min_sample_years == 3);
	REQUIRE(config.structural_break_sensitivity == 2.0);
}

TEST_CASE("Confidence threshold must lie in [0.5, 0.99]", "[core][config]") {
	AnalysisConfig config;
	config.confidence_threshold = 0.5;
	REQUIRE_NOTHROW(config.validate());
	config.confidence_threshold = 0.99;
	REQUIRE_NOTHROW(config.validate());
	config.confidence_threshold = 0.49;
	REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	config.confidence_threshold = 1.0;
	REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
}

TEST_CASE("Invalid configuration fields are rejected", "[core][config]") {
	SECTION("non-positive horizon") {
		AnalysisConfig config;
		config.forecast_horizons = {30, 0};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("zero sample years") {
		AnalysisConfig config;
		config.min_sample_years = 0;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("non-positive sensitivity") {
		AnalysisConfig config;
		config.structural_break_sensitivity = 0.0;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("fallback period above primary period") {
		AnalysisConfig config;
		config.decomposition_period = 10;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("confidence level outside (0, 1)") {
		AnalysisConfig config;
		config.forecast_confidence_levels = {0.8, 1.2};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
}
