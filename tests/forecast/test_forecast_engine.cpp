#include <catch2/catch_test_macros.hpp>

#include "almanac/core/errors.hpp"
#include "almanac/forecast/forecast_engine.hpp"

#include "common/series_helpers.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

using almanac::core::ForecastUnavailableError;
using almanac::forecast::ForecastEngine;
using almanac::forecast::ForecastEngineConfig;

namespace {

/// Repeats the last observed value.
class NaiveForecaster : public almanac::models::IForecaster {
public:
	void fit(const almanac::core::TimeSeries &ts) override {
		last_ = ts.getValues().back();
		last_date_ = ts.back();
	}

	almanac::core::Forecast predict(int horizon) override {
		almanac::core::Forecast forecast;
		auto date = last_date_;
		for (int i = 0; i < horizon; ++i) {
			date = date.nextWeekday();
			forecast.dates.push_back(date);
			forecast.point.push_back(last_);
		}
		return forecast;
	}

	std::string getName() const override {
		return "Naive";
	}

private:
	double last_ = 0.0;
	almanac::core::Date last_date_;
};

class RejectingForecaster : public NaiveForecaster {
public:
	void fit(const almanac::core::TimeSeries &) override {
		throw std::invalid_argument("cannot fit");
	}
};

class DivergingForecaster : public NaiveForecaster {
public:
	almanac::core::Forecast predict(int) override {
		throw std::runtime_error("solver diverged");
	}
};

} // namespace

TEST_CASE("Forecast engine serves horizons the history supports", "[forecast][engine]") {
	const auto series = tests::helpers::prepare(tests::helpers::randomWalk(300));
	const auto results = ForecastEngine().forecastAll(series);

	REQUIRE(results.size() == 5);
	const int expected_folds[] = {5, 4, 2};
	const int served[] = {30, 60, 90};
	for (std::size_t i = 0; i < 3; ++i) {
		REQUIRE(results[i].ok());
		const auto &result = results[i].value();
		CHECK(result.horizon_days == served[i]);
		CHECK(result.model == "SeasonalTrend");
		CHECK(result.forecast.horizon() == static_cast<std::size_t>(served[i]));
		CHECK(result.forecast.dates.front() > series.observations.back().date);
		CHECK(result.accuracy.folds == static_cast<std::size_t>(expected_folds[i]));
		CHECK(std::isfinite(result.accuracy.mae));
		REQUIRE(result.accuracy.mape.has_value());
		CHECK(*result.accuracy.mape >= 0.0);
	}
	for (std::size_t i = 3; i < 5; ++i) {
		REQUIRE_FALSE(results[i].ok());
		CHECK(results[i].error().module == "forecast");
	}
	CHECK(results[3].error().reason.find("180") != std::string::npos);
	CHECK(results[4].error().reason.find("365") != std::string::npos);
}

TEST_CASE("Forecast engine rejects unsupported histories", "[forecast][engine]") {
	ForecastEngine engine;
	const auto short_series = tests::helpers::prepare(tests::helpers::flatSeries(100));
	CHECK_THROWS_AS(engine.forecast(short_series, 60), ForecastUnavailableError);
	CHECK_THROWS_AS(engine.forecast(short_series, 0), std::invalid_argument);

	std::vector<almanac::core::Date> dates;
	auto date = almanac::core::Date(2015, 1, 5);
	for (int i = 0; i < 200; ++i) {
		dates.push_back(date);
		date = date.addDays(7);
	}
	const auto weekly = tests::helpers::prepare(tests::helpers::fromCloses(dates, std::vector<double>(200, 50.0)));
	REQUIRE_FALSE(weekly.is_daily);
	try {
		engine.forecast(weekly, 30);
		FAIL("expected ForecastUnavailableError");
	} catch (const ForecastUnavailableError &e) {
		CHECK(e.horizon() == 30);
	}
	for (const auto &result : engine.forecastAll(weekly)) {
		CHECK_FALSE(result.ok());
	}
}

TEST_CASE("Forecast engine uses an injected forecaster", "[forecast][engine]") {
	ForecastEngineConfig config;
	config.horizons = {30};
	ForecastEngine engine(config, [] { return std::make_unique<NaiveForecaster>(); });

	const auto series = tests::helpers::prepare(tests::helpers::flatSeries(200));
	const auto result = engine.forecast(series, 30);
	CHECK(result.model == "Naive");
	CHECK(result.accuracy.folds == 5);
	CHECK(result.accuracy.mae == 0.0);
	REQUIRE(result.accuracy.mape.has_value());
	CHECK(*result.accuracy.mape == 0.0);
	CHECK(std::isnan(result.accuracy.directional_accuracy));

	ForecastEngine rejecting(config, [] { return std::make_unique<RejectingForecaster>(); });
	CHECK_THROWS_AS(rejecting.forecast(series, 30), ForecastUnavailableError);
}

TEST_CASE("Forecast engine validates its configuration", "[forecast][engine][config]") {
	ForecastEngineConfig config;
	config.horizons = {0, 30};
	CHECK_THROWS_AS(ForecastEngine(config), std::invalid_argument);

	ForecastEngineConfig folds;
	folds.cv_max_folds = 0;
	CHECK_THROWS_AS(ForecastEngine(folds), std::invalid_argument);
}

TEST_CASE("Forecast engine reports runtime failures as unavailable horizons", "[forecast][engine][error]") {
	ForecastEngineConfig config;
	config.horizons = {10, 30};
	const ForecastEngine engine(config, [] { return std::make_unique<DivergingForecaster>(); });
	const auto series = tests::helpers::prepare(tests::helpers::flatSeries(200));

	CHECK_THROWS_AS(engine.forecast(series, 10), ForecastUnavailableError);

	const auto results = engine.forecastAll(series);
	REQUIRE(results.size() == 2);
	for (const auto &result : results) {
		REQUIRE_FALSE(result.ok());
		CHECK(result.error().module == "forecast");
		CHECK(result.error().reason.find("Naive failed: solver diverged") != std::string::npos);
	}
}

TEST_CASE("Forecast engine survives a factory that cannot build a model", "[forecast][engine][error]") {
	ForecastEngineConfig config;
	config.horizons = {10};
	const ForecastEngine engine(config, []() -> std::unique_ptr<almanac::models::IForecaster> {
		throw std::runtime_error("model registry offline");
	});

	const auto results = engine.forecastAll(tests::helpers::prepare(tests::helpers::flatSeries(200)));
	REQUIRE(results.size() == 1);
	REQUIRE_FALSE(results[0].ok());
	CHECK(results[0].error().reason == "horizon 10: model registry offline");
}
