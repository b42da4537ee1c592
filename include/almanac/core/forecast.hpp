#pragma once

#include "almanac/core/calendar.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace almanac::core {

/**
 * @struct PredictionInterval
 * @brief Lower and upper bounds of a forecast at one confidence level.
 */
struct PredictionInterval {
	double level = 0.95;
	std::vector<double> lower;
	std::vector<double> upper;
};

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * This struct contains the point predictions, their dates and any number of
 * prediction intervals, one per requested confidence level.
 */
struct Forecast {
	using Series = std::vector<double>;

	std::vector<Date> dates;

	/// Point forecasts.
	Series point;

	/// Prediction intervals, ordered by ascending confidence level.
	std::vector<PredictionInterval> intervals;

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	/// Returns the interval for @p level.
	/// @throws std::out_of_range when the level was not requested.
	const PredictionInterval &interval(double level) const {
		for (const auto &candidate : intervals) {
			if (std::abs(candidate.level - level) < 1e-9) {
				return candidate;
			}
		}
		throw std::out_of_range("Prediction interval not available for requested level.");
	}
};

/**
 * @struct ForecastAccuracy
 * @brief Rolling-origin cross-validated accuracy of a forecaster at one horizon.
 */
struct ForecastAccuracy {
	/// Mean absolute percentage error in percent; empty when undefined.
	std::optional<double> mape;
	double mae = std::numeric_limits<double>::quiet_NaN();
	/// Fraction of forecasts whose direction relative to the forecast origin was correct.
	double directional_accuracy = std::numeric_limits<double>::quiet_NaN();
	std::size_t folds = 0;
};

/**
 * @struct ForecastResult
 * @brief Forecast of the closing price over one horizon plus its validated accuracy.
 */
struct ForecastResult {
	int horizon_days = 0;
	Forecast forecast;
	ForecastAccuracy accuracy;
	std::string model;
};

} // namespace almanac::core
