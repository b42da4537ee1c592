#pragma once

#include "almanac/core/calendar.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace almanac::core {

/**
 * @struct PriceObservation
 * @brief One daily OHLCV bar. A missing value is NaN.
 */
struct PriceObservation {
	Date date;
	double open = std::numeric_limits<double>::quiet_NaN();
	double high = std::numeric_limits<double>::quiet_NaN();
	double low = std::numeric_limits<double>::quiet_NaN();
	double close = std::numeric_limits<double>::quiet_NaN();
	double volume = std::numeric_limits<double>::quiet_NaN();

	static PriceObservation fromClose(const Date &date, double close, double volume = 0.0) {
		PriceObservation obs;
		obs.date = date;
		obs.open = close;
		obs.high = close;
		obs.low = close;
		obs.close = close;
		obs.volume = volume;
		return obs;
	}
};

/**
 * @struct ReturnPoint
 * @brief A daily return annotated with its calendar position.
 */
struct ReturnPoint {
	Date date;
	double daily_return = 0.0;
	/// Compounded return since the first observation.
	double cumulative_return = 0.0;
	/// Rolling standard deviation of daily returns; NaN during warm-up.
	double rolling_volatility = std::numeric_limits<double>::quiet_NaN();
	int year = 1970;
	unsigned month = 1;
	unsigned quarter = 1;
	unsigned weekday = 0;
};

using ReturnSeries = std::vector<ReturnPoint>;

/**
 * @struct PreparedSeries
 * @brief Cleaned observations plus the derived return series of one symbol.
 */
struct PreparedSeries {
	std::string symbol;
	std::vector<PriceObservation> observations;
	ReturnSeries returns;

	std::size_t filled_rows = 0;
	std::size_t dropped_rows = 0;

	/// True when the median spacing of the observations is daily (trading or calendar days).
	bool is_daily = true;

	/// True when less history than recommended is available; outputs are less reliable.
	bool reduced_history = false;

	std::size_t size() const {
		return observations.size();
	}

	bool empty() const {
		return observations.empty();
	}

	DateRange range() const {
		if (observations.empty()) {
			return DateRange{};
		}
		return DateRange{observations.front().date, observations.back().date};
	}

	std::vector<double> closes() const {
		std::vector<double> values;
		values.reserve(observations.size());
		for (const auto &obs : observations) {
			values.push_back(obs.close);
		}
		return values;
	}

	std::vector<Date> dates() const {
		std::vector<Date> values;
		values.reserve(observations.size());
		for (const auto &obs : observations) {
			values.push_back(obs.date);
		}
		return values;
	}

	std::vector<double> dailyReturns() const {
		std::vector<double> values;
		values.reserve(returns.size());
		for (const auto &point : returns) {
			values.push_back(point.daily_return);
		}
		return values;
	}
};

} // namespace almanac::core
