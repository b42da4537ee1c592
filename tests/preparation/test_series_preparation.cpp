#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "almanac/core/errors.hpp"
#include "almanac/preparation/series_preparation.hpp"

#include "common/series_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using almanac::core::Date;
using almanac::core::InsufficientDataError;
using almanac::preparation::SeriesPreparer;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

TEST_CASE("Fifty observations are enough, forty-nine are not", "[preparation]") {
	const SeriesPreparer preparer;
	REQUIRE_NOTHROW(preparer.prepare("OK", tests::helpers::flatSeries(50)));

	try {
		preparer.prepare("SHORT", tests::helpers::flatSeries(49));
		FAIL("expected InsufficientDataError");
	} catch (const InsufficientDataError &e) {
		REQUIRE(e.required() == 50);
		REQUIRE(e.actual() == 49);
	}
}

TEST_CASE("Short histories are flagged as reduced", "[preparation]") {
	const SeriesPreparer preparer;
	const auto prepared = preparer.prepare("FLAT", tests::helpers::flatSeries(200));
	REQUIRE(prepared.reduced_history);
	REQUIRE(prepared.is_daily);
	REQUIRE(prepared.returns.size() == 199);

	const auto full = preparer.prepare("WALK", tests::helpers::randomWalk(600));
	REQUIRE_FALSE(full.reduced_history);
}

TEST_CASE("Returns carry calendar annotations and rolling volatility", "[preparation]") {
	const auto observations = tests::helpers::randomWalk(120);
	const auto prepared = tests::helpers::prepare(observations);

	const auto &first = prepared.returns.front();
	REQUIRE(first.date == observations[1].date);
	REQUIRE(first.daily_return == Catch::Approx(observations[1].close / observations[0].close - 1.0));
	REQUIRE(first.month == observations[1].date.month);
	REQUIRE(first.weekday == observations[1].date.weekday());
	REQUIRE(first.quarter == observations[1].date.quarter());

	REQUIRE(std::isnan(prepared.returns[18].rolling_volatility));
	REQUIRE_FALSE(std::isnan(prepared.returns[19].rolling_volatility));

	const auto &last = prepared.returns.back();
	REQUIRE(last.cumulative_return == Catch::Approx(observations.back().close / observations.front().close - 1.0));
}

TEST_CASE("Short gaps are forward-filled and long gaps dropped", "[preparation]") {
	auto observations = tests::helpers::flatSeries(80);
	for (std::size_t i = 0; i < 80; ++i) {
		observations[i].close = 100.0 + static_cast<double>(i);
	}
	observations[10].close = kNaN;
	observations[11].close = kNaN;
	for (std::size_t i = 30; i < 35; ++i) {
		observations[i].close = kNaN;
	}
	observations[0].close = kNaN;

	const auto prepared = tests::helpers::prepare(observations);
	REQUIRE(prepared.filled_rows == 2);
	REQUIRE(prepared.dropped_rows == 6);
	REQUIRE(prepared.size() == 74);
	REQUIRE(prepared.observations.front().date == observations[1].date);
	REQUIRE(prepared.observations[9].date == observations[10].date);
	REQUIRE(prepared.observations[9].close == 109.0);
}

TEST_CASE("Missing auxiliary fields fall back to the close", "[preparation]") {
	auto observations = tests::helpers::flatSeries(60);
	observations[5].open = kNaN;
	observations[5].volume = kNaN;
	const auto prepared = tests::helpers::prepare(observations);
	REQUIRE(prepared.observations[5].open == observations[5].close);
	REQUIRE(prepared.observations[5].volume == 0.0);
}

TEST_CASE("Malformed input is rejected", "[preparation]") {
	SECTION("unordered dates") {
		auto observations = tests::helpers::flatSeries(60);
		std::swap(observations[3].date, observations[4].date);
		REQUIRE_THROWS_AS(tests::helpers::prepare(observations), std::invalid_argument);
	}
	SECTION("negative volume") {
		auto observations = tests::helpers::flatSeries(60);
		observations[7].volume = -1.0;
		REQUIRE_THROWS_AS(tests::helpers::prepare(observations), std::invalid_argument);
	}
}

TEST_CASE("Weekly sampling is not daily", "[preparation]") {
	std::vector<Date> dates;
	auto date = Date(2015, 1, 5);
	for (int i = 0; i < 60; ++i) {
		dates.push_back(date);
		date = date.addDays(7);
	}
	const auto prepared =
	    tests::helpers::prepare(tests::helpers::fromCloses(dates, std::vector<double>(dates.size(), 50.0)));
	REQUIRE_FALSE(prepared.is_daily);
}
