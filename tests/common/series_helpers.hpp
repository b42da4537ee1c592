#pragma once

#include "almanac/core/calendar.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/core/time_series.hpp"
#include "almanac/preparation/series_preparation.hpp"

#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace tests::helpers {

/// Monday-to-Friday sessions starting at the first weekday on or after @p start.
inline std::vector<almanac::core::Date> weekdays(const almanac::core::Date &start, std::size_t count) {
	std::vector<almanac::core::Date> dates;
	dates.reserve(count);
	auto date = start;
	while (date.isWeekend()) {
		date = date.addDays(1);
	}
	while (dates.size() < count) {
		dates.push_back(date);
		date = date.nextWeekday();
	}
	return dates;
}

/// Weekday sessions from @p first_year-01-01 through @p last_year-12-31.
inline std::vector<almanac::core::Date> weekdaysBetween(int first_year, int last_year) {
	std::vector<almanac::core::Date> dates;
	auto date = almanac::core::Date(first_year, 1, 1);
	const auto end = almanac::core::Date(last_year, 12, 31);
	while (date <= end) {
		if (!date.isWeekend()) {
			dates.push_back(date);
		}
		date = date.addDays(1);
	}
	return dates;
}

inline std::vector<almanac::core::PriceObservation> fromCloses(const std::vector<almanac::core::Date> &dates,
                                                               const std::vector<double> &closes) {
	std::vector<almanac::core::PriceObservation> observations;
	observations.reserve(dates.size());
	for (std::size_t i = 0; i < dates.size(); ++i) {
		observations.push_back(almanac::core::PriceObservation::fromClose(dates[i], closes[i], 1000.0));
	}
	return observations;
}

/// Constant close on every session.
inline std::vector<almanac::core::PriceObservation> flatSeries(std::size_t count, double close = 100.0) {
	const auto dates = weekdays(almanac::core::Date(2020, 1, 1), count);
	return fromCloses(dates, std::vector<double>(count, close));
}

/// Flat prices except a +5% move on the first session of every December.
inline std::vector<almanac::core::PriceObservation> decemberJumpSeries(int first_year = 2014, int last_year = 2023) {
	const auto dates = weekdaysBetween(first_year, last_year);
	std::vector<double> closes;
	closes.reserve(dates.size());
	double price = 100.0;
	for (std::size_t i = 0; i < dates.size(); ++i) {
		const bool first_of_december = dates[i].month == 12 && (i == 0 || dates[i - 1].month != 12);
		if (first_of_december && i > 0) {
			price *= 1.05;
		}
		closes.push_back(price);
	}
	return fromCloses(dates, closes);
}

/// Geometric random walk with a mild yearly cycle in the drift.
inline std::vector<almanac::core::PriceObservation> randomWalk(std::size_t count, unsigned seed = 7,
                                                               double volatility = 0.01) {
	const auto dates = weekdays(almanac::core::Date(2015, 1, 1), count);
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, volatility);
	constexpr double pi = 3.14159265358979323846;

	std::vector<double> closes;
	closes.reserve(count);
	double price = 100.0;
	for (std::size_t i = 0; i < count; ++i) {
		const double drift = 0.0003 + 0.0005 * std::sin(2.0 * pi * static_cast<double>(dates[i].month) / 12.0);
		price *= 1.0 + drift + noise(rng);
		closes.push_back(price);
	}
	return fromCloses(dates, closes);
}

/// Daily returns drawn with @p before_sd up to @p split and @p after_sd afterwards.
inline almanac::core::ReturnSeries volatilityShift(std::size_t count, std::size_t split, double before_sd,
                                                   double after_sd, unsigned seed = 11) {
	const auto dates = weekdays(almanac::core::Date(2018, 1, 1), count);
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	almanac::core::ReturnSeries returns;
	returns.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		almanac::core::ReturnPoint point;
		point.date = dates[i];
		point.daily_return = noise(rng) * (i < split ? before_sd : after_sd);
		point.year = dates[i].year;
		point.month = dates[i].month;
		point.quarter = dates[i].quarter();
		point.weekday = dates[i].weekday();
		returns.push_back(point);
	}
	return returns;
}

inline almanac::core::PreparedSeries prepare(const std::vector<almanac::core::PriceObservation> &observations,
                                             const char *symbol = "TEST") {
	return almanac::preparation::SeriesPreparer().prepare(symbol, observations);
}

inline almanac::core::TimeSeries closesOf(const std::vector<almanac::core::PriceObservation> &observations) {
	std::vector<almanac::core::Date> dates;
	std::vector<double> values;
	for (const auto &obs : observations) {
		dates.push_back(obs.date);
		values.push_back(obs.close);
	}
	return almanac::core::TimeSeries(dates, values, "TEST");
}

} // namespace tests::helpers
