#pragma once

#include "almanac/core/forecast.hpp"
#include "almanac/core/time_series.hpp"

#include <functional>
#include <memory>
#include <string>

namespace almanac::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * This abstract base class defines the common structure for the forecasting
 * models of the engine. It ensures a consistent API for fitting models and
 * generating predictions, so that cross-validation can refit a fresh instance
 * per fold.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of sessions into the future.
	 * @param horizon The number of future sessions to predict.
	 * @return A Forecast object containing the point predictions and intervals.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "SeasonalTrend").
	 */
	virtual std::string getName() const = 0;
};

using ForecasterFactory = std::function<std::unique_ptr<IForecaster>()>;

} // namespace almanac::models
