#include <catch2/catch_test_macros.hpp>

#include "almanac/core/errors.hpp"
#include "almanac/engine/analysis_engine.hpp"
#include "almanac/models/iforecaster.hpp"

#include "common/series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using almanac::core::AnalysisConfig;
using almanac::core::AnalysisResult;
using almanac::core::CalendarPeriod;
using almanac::core::FindingCategory;
using almanac::core::FindingScope;
using almanac::engine::AnalysisEngine;

namespace {

class ThrowingForecaster : public almanac::models::IForecaster {
public:
	void fit(const almanac::core::TimeSeries &) override {
		throw std::runtime_error("solver diverged");
	}

	almanac::core::Forecast predict(int) override {
		throw std::runtime_error("solver diverged");
	}

	std::string getName() const override {
		return "Throwing";
	}
};

bool sameNumber(double a, double b) {
	return (std::isnan(a) && std::isnan(b)) || a == b;
}

void requireEquivalent(const AnalysisResult &a, const AnalysisResult &b) {
	REQUIRE(a.findings.size() == b.findings.size());
	for (std::size_t i = 0; i < a.findings.size(); ++i) {
		CHECK(a.findings[i].label == b.findings[i].label);
		CHECK(a.findings[i].source == b.findings[i].source);
		CHECK(a.findings[i].confidence == b.findings[i].confidence);
		CHECK(a.findings[i].corroborations == b.findings[i].corroborations);
	}
	REQUIRE(a.monthly_stats.size() == b.monthly_stats.size());
	for (std::size_t i = 0; i < a.monthly_stats.size(); ++i) {
		CHECK(sameNumber(a.monthly_stats[i].mean_return, b.monthly_stats[i].mean_return));
		CHECK(sameNumber(a.monthly_stats[i].p_value, b.monthly_stats[i].p_value));
	}
	REQUIRE(a.forecasts.size() == b.forecasts.size());
	for (std::size_t i = 0; i < a.forecasts.size(); ++i) {
		CHECK(a.forecasts[i].forecast.point == b.forecasts[i].forecast.point);
	}
	CHECK(a.unavailable == b.unavailable);
	CHECK(a.structural_breaks.size() == b.structural_breaks.size());
	CHECK(a.current_volatility_regime == b.current_volatility_regime);
	CHECK(a.pattern_model.has_value() == b.pattern_model.has_value());
}

bool coversDecember(const FindingScope &scope) {
	return scope.kind == FindingScope::Kind::Calendar && scope.period_kind == CalendarPeriod::Month &&
	       std::find(scope.periods.begin(), scope.periods.end(), 12) != scope.periods.end();
}

} // namespace

TEST_CASE("Engine surfaces a recurring December move", "[integration][engine]") {
	const auto observations = tests::helpers::decemberJumpSeries();
	const auto result = AnalysisEngine().analyze("DEC", observations);

	CHECK(result.symbol == "DEC");
	CHECK(result.observation_count == observations.size());
	CHECK_FALSE(result.reduced_history);
	REQUIRE(result.monthly_stats.size() == 12);
	const auto december = std::find_if(result.monthly_stats.begin(), result.monthly_stats.end(),
	                                   [](const auto &stat) { return stat.period == 12; });
	REQUIRE(december != result.monthly_stats.end());
	CHECK(december->year_count == 10);
	CHECK(december->win_rate == 1.0);
	CHECK(december->p_value < 0.05);

	const auto found = std::find_if(result.findings.begin(), result.findings.end(), [](const auto &finding) {
		return finding.category == FindingCategory::Seasonal && coversDecember(finding.scope);
	});
	REQUIRE(found != result.findings.end());
	CHECK(found->confidence >= 0.75);

	for (std::size_t i = 0; i < result.findings.size(); ++i) {
		CHECK(result.findings[i].confidence >= 0.75);
		if (i > 0) {
			CHECK(result.findings[i - 1].confidence >= result.findings[i].confidence);
		}
	}
	CHECK(result.forecasts.size() == 5);
	REQUIRE(result.decomposition.has_value());
	CHECK(result.decomposition->period == 252);
	REQUIRE(result.pattern_strength.has_value());

	REQUIRE(result.risk_metrics.has_value());
	CHECK(result.risk_metrics->drawdown.max_drawdown == 0.0);
	CHECK(result.risk_metrics->value_at_risk.size() == 3);
	const auto fat_tails = std::find_if(result.findings.begin(), result.findings.end(),
	                                    [](const auto &finding) { return finding.label == "Fat-tailed returns"; });
	REQUIRE(fat_tails != result.findings.end());
	CHECK(fat_tails->category == FindingCategory::Risk);
}

TEST_CASE("Engine reports nothing for a constant price", "[integration][engine]") {
	const auto result = AnalysisEngine().analyze("FLAT", tests::helpers::flatSeries(200));

	CHECK(result.findings.empty());
	CHECK(result.reduced_history);
	CHECK(result.isUnavailable("pattern_detection"));
	REQUIRE(result.anomaly.has_value());
	CHECK_FALSE(result.anomaly->is_anomalous);
	CHECK(result.structural_breaks.empty());
	CHECK(result.current_volatility_regime == almanac::core::Regime::LowVol);
	CHECK(result.current_trend_regime == almanac::core::Regime::Neutral);
	REQUIRE(result.decomposition.has_value());
	CHECK(result.decomposition->period == 21);
}

TEST_CASE("Engine marks horizons the history cannot support", "[integration][engine]") {
	const auto result = AnalysisEngine().analyze("SHORT", tests::helpers::randomWalk(300));

	CHECK(result.forecastFor(30) != nullptr);
	CHECK(result.forecastFor(60) != nullptr);
	CHECK(result.forecastFor(90) != nullptr);
	CHECK(result.forecastFor(180) == nullptr);
	CHECK(result.forecastFor(365) == nullptr);

	const auto forecast_gaps = std::count_if(result.unavailable.begin(), result.unavailable.end(),
	                                         [](const auto &section) { return section.module == "forecast"; });
	CHECK(forecast_gaps == 2);

	const auto *quarter = result.forecastFor(90);
	REQUIRE(quarter != nullptr);
	CHECK(quarter->accuracy.folds == 2);
	CHECK(quarter->forecast.horizon() == 90);
}

TEST_CASE("Engine keeps other modules when the forecaster throws", "[integration][engine][error]") {
	AnalysisConfig config;
	config.forecast_horizons = {5, 10};
	const AnalysisEngine engine(config, nullptr, [] { return std::make_unique<ThrowingForecaster>(); });
	const auto result = engine.analyze("RW", tests::helpers::randomWalk(300));

	CHECK(result.forecasts.empty());
	std::size_t forecast_gaps = 0;
	for (const auto &section : result.unavailable) {
		if (section.module == "forecast") {
			++forecast_gaps;
			CHECK(section.reason.find("solver diverged") != std::string::npos);
		}
	}
	CHECK(forecast_gaps == 2);

	CHECK(result.monthly_stats.size() == 12);
	CHECK_FALSE(result.regimes.empty());
	CHECK(result.current_volatility_regime.has_value());
	CHECK((result.decomposition.has_value() || result.isUnavailable("decomposition")));
	CHECK(result.risk_metrics.has_value());
}

TEST_CASE("Raising the confidence threshold never adds findings", "[integration][engine]") {
	const auto observations = tests::helpers::decemberJumpSeries();
	std::size_t previous = 0;
	std::vector<std::string> previous_labels;
	bool first = true;
	for (double threshold : {0.5, 0.6, 0.7, 0.75, 0.8, 0.85, 0.9, 0.95, 0.99}) {
		AnalysisConfig config;
		config.enable_forecast = false;
		config.confidence_threshold = threshold;
		const auto result = AnalysisEngine(config).analyze("DEC", observations);

		std::vector<std::string> labels;
		for (const auto &finding : result.findings) {
			CHECK(finding.confidence >= threshold);
			labels.push_back(finding.label);
		}
		if (!first) {
			CHECK(labels.size() <= previous);
			CHECK(std::equal(labels.begin(), labels.end(), previous_labels.begin()));
		}
		previous = labels.size();
		previous_labels = labels;
		first = false;
	}
}

TEST_CASE("Engine completes on exactly the minimum history", "[integration][engine]") {
	const auto observations = tests::helpers::randomWalk(50);
	const auto result = AnalysisEngine().analyze("MIN", observations);

	CHECK(result.observation_count == 50);
	CHECK(result.reduced_history);
	CHECK(result.isUnavailable("pattern_detection"));
	CHECK(result.isUnavailable("anomaly_detection"));
	CHECK(result.forecasts.empty());
	const auto forecast_gaps = std::count_if(result.unavailable.begin(), result.unavailable.end(),
	                                         [](const auto &section) { return section.module == "forecast"; });
	CHECK(forecast_gaps == 5);
	CHECK(result.structural_breaks.empty());
	CHECK_FALSE(result.monthly_stats.empty());
	CHECK(result.risk_metrics.has_value());

	const std::vector<almanac::core::PriceObservation> one_short(observations.begin(), observations.end() - 1);
	CHECK_THROWS_AS(AnalysisEngine().analyze("MIN", one_short), almanac::core::InsufficientDataError);
}

TEST_CASE("Engine runs are repeatable", "[integration][engine]") {
	const auto observations = tests::helpers::randomWalk(300);

	AnalysisConfig sequential;
	sequential.parallel_modules = false;
	const auto first = AnalysisEngine(sequential).analyze("RW", observations);
	const auto second = AnalysisEngine(sequential).analyze("RW", observations);
	requireEquivalent(first, second);

	AnalysisConfig concurrent;
	concurrent.parallel_modules = true;
	const auto third = AnalysisEngine(concurrent).analyze("RW", observations);
	requireEquivalent(first, third);
}

TEST_CASE("Engine reuses cached feature matrices", "[integration][engine]") {
	auto cache = std::make_shared<almanac::utils::AnalysisCache>();
	AnalysisConfig config;
	config.enable_forecast = false;
	const AnalysisEngine engine(config, cache);
	const auto observations = tests::helpers::randomWalk(300);

	const auto uncached = AnalysisEngine(config).analyze("RW", observations);
	const auto first = engine.analyze("RW", observations);
	const auto second = engine.analyze("RW", observations);

	CHECK(cache->size() == 1);
	CHECK(cache->misses() == 1);
	CHECK(cache->hits() == 1);
	requireEquivalent(first, second);
	requireEquivalent(uncached, second);
}

TEST_CASE("Engine cache does not serve matrices of revised prices", "[integration][engine]") {
	auto cache = std::make_shared<almanac::utils::AnalysisCache>();
	AnalysisConfig config;
	config.enable_forecast = false;
	const AnalysisEngine engine(config, cache);

	const auto original = tests::helpers::randomWalk(600);
	const auto revised = tests::helpers::randomWalk(600, 99);
	REQUIRE(original.front().date == revised.front().date);
	REQUIRE(original.back().date == revised.back().date);

	engine.analyze("RW", original);
	const auto warm = engine.analyze("RW", revised);
	const auto cold = AnalysisEngine(config).analyze("RW", revised);

	CHECK(cache->size() == 2);
	CHECK(cache->hits() == 0);
	requireEquivalent(warm, cold);
	REQUIRE(warm.anomaly.has_value());
	REQUIRE(cold.anomaly.has_value());
	CHECK(sameNumber(warm.anomaly->current_score, cold.anomaly->current_score));
}

TEST_CASE("Engine honours disabled modules", "[integration][engine]") {
	AnalysisConfig config;
	config.enable_forecast = false;
	config.enable_anomaly_detection = false;
	const auto result = AnalysisEngine(config).analyze("RW", tests::helpers::randomWalk(300));

	CHECK(result.forecasts.empty());
	CHECK_FALSE(result.isUnavailable("forecast"));
	CHECK_FALSE(result.anomaly.has_value());
	CHECK_FALSE(result.isUnavailable("anomaly_detection"));
}

TEST_CASE("Engine propagates fatal input errors", "[integration][engine][error]") {
	AnalysisConfig invalid;
	invalid.confidence_threshold = 0.3;
	CHECK_THROWS_AS(AnalysisEngine(invalid).analyze("RW", tests::helpers::randomWalk(300)),
	                almanac::core::ConfigurationError);

	CHECK_THROWS_AS(AnalysisEngine().analyze("TINY", tests::helpers::flatSeries(30)),
	                almanac::core::InsufficientDataError);
}
