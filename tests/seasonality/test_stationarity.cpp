#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/core/errors.hpp"
#include "almanac/seasonality/decomposition_analyzer.hpp"
#include "almanac/seasonality/stationarity.hpp"

#include "common/series_helpers.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using almanac::core::DecompositionModel;
using almanac::seasonality::augmentedDickeyFuller;
using almanac::seasonality::DecompositionAnalyzer;
using almanac::seasonality::DecompositionConfig;
using almanac::seasonality::ljungBox;
using almanac::seasonality::mackinnonPValue;

namespace {

std::vector<double> whiteNoise(std::size_t length, unsigned seed = 3) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	std::vector<double> data(length);
	for (auto &value : data) {
		value = noise(rng);
	}
	return data;
}

std::vector<double> autoregressive(std::size_t length, double phi, unsigned seed = 5) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	std::vector<double> data(length, 0.0);
	for (std::size_t i = 1; i < length; ++i) {
		data[i] = phi * data[i - 1] + noise(rng);
	}
	return data;
}

} // namespace

TEST_CASE("ADF rejects a unit root for white noise", "[seasonality][stationarity]") {
	const auto result = augmentedDickeyFuller(whiteNoise(500));
	CHECK(result.lags == 7);
	CHECK(result.observations == 499 - 7);
	CHECK(result.statistic < -3.43);
	CHECK(result.p_value < 0.01);
	CHECK(result.rejectsUnitRoot());
}

TEST_CASE("ADF does not reject for an accelerating trend", "[seasonality][stationarity]") {
	std::vector<double> data(200);
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] = 0.01 * static_cast<double>(i * i);
	}
	const auto result = augmentedDickeyFuller(data, 0);
	CHECK(result.lags == 0);
	CHECK(result.p_value > 0.05);
	CHECK_FALSE(result.rejectsUnitRoot());
}

TEST_CASE("ADF handles degenerate input", "[seasonality][stationarity]") {
	const auto constant = augmentedDickeyFuller(std::vector<double>(100, 4.0));
	CHECK(std::isnan(constant.statistic));
	CHECK(std::isnan(constant.p_value));
	CHECK_FALSE(constant.rejectsUnitRoot());

	CHECK_THROWS_AS(augmentedDickeyFuller({1.0, 2.0, 3.0}), std::invalid_argument);
	CHECK_THROWS_AS(augmentedDickeyFuller(whiteNoise(10), 5), std::invalid_argument);
}

TEST_CASE("MacKinnon p-values match the tabulated critical values", "[seasonality][stationarity]") {
	CHECK(mackinnonPValue(-2.86) == Catch::Approx(0.05).margin(0.005));
	CHECK(mackinnonPValue(-3.43) == Catch::Approx(0.01).margin(0.005));
	CHECK(mackinnonPValue(3.0) == 1.0);
	CHECK(mackinnonPValue(-20.0) == 0.0);
	CHECK(mackinnonPValue(-1.0) > mackinnonPValue(-2.0));
	CHECK(std::isnan(mackinnonPValue(std::nan(""))));
}

TEST_CASE("Ljung-Box statistic on a short sequence", "[seasonality][ljungbox]") {
	const auto result = ljungBox({1.0, 2.0, 3.0, 4.0, 5.0}, 1);
	CHECK(result.lags == 1);
	CHECK(result.statistic == Catch::Approx(1.4));
	CHECK(result.p_value == Catch::Approx(0.2367).margin(1e-3));
}

TEST_CASE("Ljung-Box separates autocorrelation from noise", "[seasonality][ljungbox]") {
	const auto persistent = ljungBox(autoregressive(500, 0.9));
	CHECK(persistent.p_value < 0.001);
	CHECK_FALSE(persistent.isWhiteNoise());

	const auto noise = ljungBox(whiteNoise(500));
	CHECK(noise.p_value > 0.001);

	const auto constant = ljungBox(std::vector<double>(50, 1.0));
	CHECK(std::isnan(constant.statistic));
	CHECK_FALSE(constant.isWhiteNoise());

	CHECK_THROWS_AS(ljungBox(whiteNoise(20), 0), std::invalid_argument);
	CHECK_THROWS_AS(ljungBox(whiteNoise(20), 20), std::invalid_argument);
}

TEST_CASE("Decomposition analyzer picks the period from history length", "[seasonality][analyzer]") {
	DecompositionAnalyzer analyzer;
	CHECK(analyzer.selectPeriod(600) == 252);
	CHECK(analyzer.selectPeriod(504) == 252);
	CHECK(analyzer.selectPeriod(300) == 21);
	CHECK(analyzer.selectPeriod(30) == 0);

	DecompositionConfig invalid;
	invalid.fallback_period = 1;
	CHECK_THROWS_AS(DecompositionAnalyzer(invalid), std::invalid_argument);
	invalid.fallback_period = 300;
	CHECK_THROWS_AS(DecompositionAnalyzer(invalid), std::invalid_argument);
}

TEST_CASE("Decomposition analyzer selects the model from level scaling", "[seasonality][analyzer]") {
	std::vector<double> level(200);
	for (std::size_t i = 0; i < level.size(); ++i) {
		const double sign = i % 2 == 0 ? 1.0 : -1.0;
		level[i] = 100.0 * std::pow(1.005, static_cast<double>(i)) * (1.0 + 0.02 * sign);
	}
	DecompositionAnalyzer analyzer;
	CHECK(analyzer.selectModel(level, 0.5) == DecompositionModel::Multiplicative);
	CHECK(analyzer.selectModel(level, 0.01) == DecompositionModel::Additive);

	auto negative = level;
	negative[3] = -1.0;
	CHECK(analyzer.selectModel(negative, 0.5) == DecompositionModel::Additive);
	CHECK(analyzer.selectModel(std::vector<double>(40, 100.0), 0.5) == DecompositionModel::Additive);
}

TEST_CASE("Decomposition analyzer summarises a flat series", "[seasonality][analyzer]") {
	const auto series = tests::helpers::prepare(tests::helpers::flatSeries(200));
	const auto summary = DecompositionAnalyzer().analyze(series);

	CHECK(summary.period == 21);
	CHECK(summary.model == DecompositionModel::Additive);
	CHECK(std::isnan(summary.level_adf_p_value));
	CHECK(summary.seasonal_strength == 0.0);
	CHECK(summary.seasonal_amplitude == Catch::Approx(0.0).margin(1e-9));
	CHECK_FALSE(summary.residual_stationary);
}

TEST_CASE("Decomposition analyzer uses the yearly period on long histories", "[seasonality][analyzer]") {
	const auto series = tests::helpers::prepare(tests::helpers::randomWalk(600));
	const auto summary = DecompositionAnalyzer().analyze(series);

	CHECK(summary.period == 252);
	CHECK(summary.seasonal_strength >= 0.0);
	CHECK(summary.seasonal_strength <= 1.0);
	CHECK(summary.trend_strength >= 0.0);
	CHECK(summary.trend_strength <= 1.0);
	CHECK(summary.seasonal_amplitude >= 0.0);
	CHECK(std::isfinite(summary.ljung_box_statistic));
}

TEST_CASE("Decomposition analyzer reports short histories", "[seasonality][analyzer]") {
	DecompositionConfig config;
	config.period = 30;
	config.fallback_period = 30;
	const auto series = tests::helpers::prepare(tests::helpers::flatSeries(50));
	CHECK_THROWS_AS(DecompositionAnalyzer(config).analyze(series), almanac::core::DecompositionError);
}
