#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/stats/risk_metrics.hpp"

#include "common/series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using almanac::core::FindingCategory;
using almanac::core::FindingScope;
using almanac::stats::RiskAnalyzer;
using almanac::stats::RiskMetricsConfig;
using Catch::Approx;

TEST_CASE("Value at risk on a symmetric ladder of returns", "[stats][risk]") {
	std::vector<double> returns;
	for (int i = -5; i <= 5; ++i) {
		returns.push_back(0.01 * i);
	}
	const auto var = RiskAnalyzer::valueAtRisk(returns, {0.10});
	REQUIRE(var.size() == 1);

	CHECK(var[0].level == 0.10);
	CHECK(var[0].historical == Approx(-0.04));
	CHECK(var[0].expected_shortfall == Approx(-0.045));
	// Population sd is 0.01 * sqrt(10); excess kurtosis is -1.22 and skew is zero.
	CHECK(var[0].parametric == Approx(-0.0405262).margin(1e-6));
	CHECK(var[0].cornish_fisher == Approx(-0.0433230).margin(1e-6));
	CHECK(var[0].expected_shortfall <= var[0].historical);

	CHECK(RiskAnalyzer::valueAtRisk({}, {0.05}).empty());
}

TEST_CASE("Drawdown tracks peak, trough and recovery", "[stats][risk]") {
	const auto dates = tests::helpers::weekdays(almanac::core::Date(2020, 1, 1), 6);
	const auto observations = tests::helpers::fromCloses(dates, {100.0, 120.0, 90.0, 130.0, 80.0, 140.0});

	const auto dd = RiskAnalyzer::drawdown(observations);
	CHECK(dd.max_drawdown == Approx(80.0 / 130.0 - 1.0));
	CHECK(dd.peak == dates[3]);
	CHECK(dd.trough == dates[4]);
	REQUIRE(dd.recovery.has_value());
	CHECK(*dd.recovery == dates[5]);
	CHECK(dd.duration_days == 1);

	SECTION("Still under water") {
		const auto falling = tests::helpers::fromCloses(dates, {100.0, 120.0, 90.0, 130.0, 80.0, 100.0});
		const auto open = RiskAnalyzer::drawdown(falling);
		CHECK(open.trough == dates[4]);
		CHECK_FALSE(open.recovery.has_value());
	}

	SECTION("Rising prices never draw down") {
		const auto rising = tests::helpers::fromCloses(dates, {100.0, 101.0, 102.0, 103.0, 104.0, 105.0});
		const auto none = RiskAnalyzer::drawdown(rising);
		CHECK(none.max_drawdown == 0.0);
		CHECK(none.peak == dates[0]);
		CHECK_FALSE(none.recovery.has_value());
	}
}

TEST_CASE("Flat prices carry no risk findings", "[stats][risk]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::flatSeries(300));
	const RiskAnalyzer risk;
	const auto metrics = risk.compute(prepared);

	CHECK(metrics.annual_return == 0.0);
	CHECK(metrics.annual_volatility == 0.0);
	CHECK(std::isnan(metrics.sharpe_ratio));
	CHECK(std::isnan(metrics.skewness));
	CHECK(std::isnan(metrics.jarque_bera_p_value));
	CHECK(metrics.drawdown.max_drawdown == 0.0);
	REQUIRE(metrics.value_at_risk.size() == 3);
	for (const auto &var : metrics.value_at_risk) {
		CHECK(var.historical == 0.0);
	}
	CHECK(risk.findings(metrics, prepared.returns.size()).empty());
}

TEST_CASE("Rare December jumps read as fat tails", "[stats][risk]") {
	const auto prepared = tests::helpers::prepare(tests::helpers::decemberJumpSeries());
	const RiskAnalyzer risk;
	const auto metrics = risk.compute(prepared);

	CHECK(metrics.annual_return > 0.0);
	CHECK(metrics.skewness > 0.0);
	CHECK(metrics.excess_kurtosis > 3.0);
	CHECK(metrics.jarque_bera_p_value < 0.05);
	CHECK(metrics.drawdown.max_drawdown == 0.0);

	const auto findings = risk.findings(metrics, prepared.returns.size());
	REQUIRE(findings.size() == 1);
	CHECK(findings[0].label == "Fat-tailed returns");
	CHECK(findings[0].category == FindingCategory::Risk);
	CHECK(findings[0].source == "risk_metrics");
	CHECK(findings[0].scope.kind == FindingScope::Kind::Global);
	CHECK(findings[0].confidence > 0.9);
}

TEST_CASE("A deep decline raises a dated drawdown finding", "[stats][risk]") {
	std::vector<double> closes(100, 100.0);
	for (int i = 1; i <= 50; ++i) {
		closes.push_back(100.0 - 0.8 * i);
	}
	for (int i = 1; i <= 100; ++i) {
		closes.push_back(60.0 + 0.5 * i);
	}
	const auto dates = tests::helpers::weekdays(almanac::core::Date(2018, 1, 1), closes.size());
	const auto prepared = tests::helpers::prepare(tests::helpers::fromCloses(dates, closes));
	const RiskAnalyzer risk;
	const auto metrics = risk.compute(prepared);

	CHECK(metrics.drawdown.max_drawdown == Approx(-0.4));
	REQUIRE(metrics.drawdown.recovery.has_value());
	CHECK(metrics.calmar_ratio > 0.0);

	const auto findings = risk.findings(metrics, prepared.returns.size());
	const auto it = std::find_if(findings.begin(), findings.end(),
	                             [](const auto &f) { return f.label == "Severe historical drawdown"; });
	REQUIRE(it != findings.end());
	CHECK(it->scope.kind == FindingScope::Kind::Dated);
	REQUIRE(it->scope.range.has_value());
	CHECK(it->scope.range->start == metrics.drawdown.peak);
	CHECK(it->scope.range->end == *metrics.drawdown.recovery);
	CHECK(it->confidence > 0.0);
	CHECK(it->confidence <= 1.0);
}

TEST_CASE("Risk configuration is validated", "[stats][risk]") {
	RiskMetricsConfig levels;
	levels.var_levels = {0.05, 0.6};
	CHECK_THROWS_AS(RiskAnalyzer(levels), std::invalid_argument);

	RiskMetricsConfig drawdown;
	drawdown.severe_drawdown = 0.1;
	CHECK_THROWS_AS(RiskAnalyzer(drawdown), std::invalid_argument);

	almanac::core::PreparedSeries short_series;
	short_series.returns.resize(1);
	CHECK_THROWS_AS(RiskAnalyzer().compute(short_series), std::invalid_argument);
}
