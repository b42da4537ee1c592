#include <catch2/catch_test_macros.hpp>

#include "almanac/insight/insight_aggregator.hpp"

#include <stdexcept>

using almanac::core::CalendarPeriod;
using almanac::core::FindingCategory;
using almanac::core::FindingScope;
using almanac::core::ModuleResult;
using almanac::core::PatternFinding;
using almanac::insight::InsightAggregator;
using almanac::insight::ModuleOutputs;

namespace {

PatternFinding finding(const std::string &label, double confidence, FindingCategory category,
                       const std::string &source, FindingScope scope = FindingScope::global()) {
	PatternFinding f;
	f.label = label;
	f.description = label;
	f.confidence = confidence;
	f.category = category;
	f.source = source;
	f.scope = std::move(scope);
	return f;
}

FindingScope months(std::vector<int> values) {
	return FindingScope::calendar(CalendarPeriod::Month, std::move(values));
}

} // namespace

TEST_CASE("Near-identical findings share category and scope", "[insight][aggregator]") {
	const auto stats = finding("December seasonal strength", 0.9, FindingCategory::Seasonal, "seasonal_statistics",
	                           months({12}));
	const auto model =
	    finding("Year-end pattern", 0.8, FindingCategory::Seasonal, "pattern_detection", months({11, 12}));
	CHECK(InsightAggregator::nearIdentical(stats, model));

	const auto other_label =
	    finding("December weakness", 0.8, FindingCategory::Seasonal, "seasonal_statistics", months({12}));
	CHECK_FALSE(InsightAggregator::nearIdentical(stats, other_label));
	CHECK(InsightAggregator::nearIdentical(stats, finding("December seasonal strength", 0.7,
	                                                      FindingCategory::Seasonal, "seasonal_statistics",
	                                                      months({12}))));

	CHECK_FALSE(InsightAggregator::nearIdentical(
	    stats, finding("Year-end pattern", 0.8, FindingCategory::Strategy, "pattern_detection", months({12}))));
	CHECK_FALSE(InsightAggregator::nearIdentical(
	    stats, finding("Spring pattern", 0.8, FindingCategory::Seasonal, "pattern_detection", months({3, 4}))));

	const auto risk = finding("High risk concentration", 0.8, FindingCategory::Risk, "seasonal_insights");
	CHECK_FALSE(
	    InsightAggregator::nearIdentical(risk, finding("Tail risk", 0.8, FindingCategory::Risk, "anomaly_detection")));
	CHECK(InsightAggregator::nearIdentical(
	    risk, finding("High risk concentration", 0.6, FindingCategory::Risk, "anomaly_detection")));
}

TEST_CASE("Merging keeps the most confident of each group", "[insight][aggregator]") {
	const auto merged = InsightAggregator::merge({
	    finding("December seasonal strength", 0.8, FindingCategory::Seasonal, "seasonal_statistics", months({12})),
	    finding("Year-end pattern", 0.9, FindingCategory::Seasonal, "pattern_detection", months({11, 12})),
	    finding("High risk concentration", 0.95, FindingCategory::Risk, "seasonal_insights"),
	});

	REQUIRE(merged.size() == 2);
	CHECK(merged[0].label == "High risk concentration");
	CHECK(merged[0].corroborations == 0);
	CHECK(merged[1].label == "Year-end pattern");
	CHECK(merged[1].corroborations == 1);
}

TEST_CASE("Merging breaks confidence ties by label", "[insight][aggregator]") {
	const auto merged = InsightAggregator::merge({
	    finding("Beta", 0.8, FindingCategory::Strategy, "seasonal_insights"),
	    finding("Alpha", 0.8, FindingCategory::Strategy, "seasonal_insights"),
	    finding("Gamma", 0.85, FindingCategory::Strategy, "seasonal_insights"),
	});
	REQUIRE(merged.size() == 3);
	CHECK(merged[0].label == "Gamma");
	CHECK(merged[1].label == "Alpha");
	CHECK(merged[2].label == "Beta");
}

TEST_CASE("Aggregation applies the confidence threshold", "[insight][aggregator]") {
	const auto outputs = [] {
		ModuleOutputs out;
		out.symbol = "ACME";
		out.seasonal_findings = {
		    finding("January", 0.9, FindingCategory::Seasonal, "seasonal_statistics", months({1})),
		    finding("March", 0.8, FindingCategory::Seasonal, "seasonal_statistics", months({3})),
		    finding("June", 0.6, FindingCategory::Seasonal, "seasonal_statistics", months({6})),
		};
		return out;
	};

	const auto strict = InsightAggregator(0.75).aggregate(outputs());
	const auto lenient = InsightAggregator(0.5).aggregate(outputs());
	CHECK(strict.symbol == "ACME");
	REQUIRE(strict.findings.size() == 2);
	REQUIRE(lenient.findings.size() == 3);
	for (std::size_t i = 0; i < strict.findings.size(); ++i) {
		CHECK(strict.findings[i].label == lenient.findings[i].label);
		CHECK(strict.findings[i].confidence >= 0.75);
	}
	CHECK(InsightAggregator(1.0).aggregate(outputs()).findings.empty());
}

TEST_CASE("Aggregation collects unavailable sections", "[insight][aggregator]") {
	ModuleOutputs outputs;
	outputs.patterns = ModuleResult<almanac::patterns::PatternDetection>::unavailable("pattern_detection", "too few rows");

	almanac::regime::RegimeClassification classification;
	classification.summary.current_volatility = almanac::core::Regime::LowVol;
	classification.summary.current_trend = almanac::core::Regime::Bull;
	classification.findings.push_back(finding("Bull trend regime", 0.8, FindingCategory::Regime, "regime_classifier"));
	outputs.regimes = classification;

	almanac::core::ForecastResult served;
	served.horizon_days = 30;
	outputs.forecasts.emplace_back(served);
	outputs.forecasts.push_back(ModuleResult<almanac::core::ForecastResult>::unavailable("forecast", "horizon 180"));

	const auto result = InsightAggregator().aggregate(outputs);
	REQUIRE(result.unavailable.size() == 2);
	CHECK(result.isUnavailable("pattern_detection"));
	CHECK(result.isUnavailable("forecast"));
	CHECK_FALSE(result.isUnavailable("anomaly_detection"));
	CHECK_FALSE(result.pattern_model.has_value());
	CHECK_FALSE(result.anomaly.has_value());

	REQUIRE(result.forecasts.size() == 1);
	CHECK(result.forecastFor(30) != nullptr);
	CHECK(result.forecastFor(180) == nullptr);

	CHECK(result.current_volatility_regime == almanac::core::Regime::LowVol);
	CHECK(result.current_trend_regime == almanac::core::Regime::Bull);
	REQUIRE(result.findings.size() == 1);
	CHECK(result.findings[0].source == "regime_classifier");
}

TEST_CASE("Aggregator validates its threshold", "[insight][aggregator]") {
	CHECK_THROWS_AS(InsightAggregator(-0.1), std::invalid_argument);
	CHECK_THROWS_AS(InsightAggregator(1.1), std::invalid_argument);
	CHECK(InsightAggregator().confidenceThreshold() == 0.75);
}
