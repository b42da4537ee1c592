#pragma once

#include "almanac/core/forecast.hpp"
#include "almanac/core/module_result.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/models/iforecaster.hpp"

#include <set>
#include <vector>

namespace almanac::forecast {

struct ForecastEngineConfig {
	/// Horizons in sessions.
	std::set<int> horizons = {30, 60, 90, 180, 365};
	std::vector<double> confidence_levels = {0.80, 0.95};
	int cv_max_folds = 5;
	int changepoint_count = 25;
	double changepoint_range = 0.8;
};

/**
 * @class ForecastEngine
 * @brief Forecasts the closing price at every requested horizon and validates each one.
 *
 * A horizon needs at least twice as many observations as sessions forecast and a
 * daily series. Accuracy comes from expanding-window cross-validation with
 * back-to-back test windows of the horizon's length.
 */
class ForecastEngine {
public:
	/// Uses a SeasonalTrendForecaster configured from @p config when no factory is given.
	explicit ForecastEngine(ForecastEngineConfig config = {}, models::ForecasterFactory factory = {});

	/// @throws core::ForecastUnavailableError when the horizon cannot be served from this history.
	core::ForecastResult forecast(const core::PreparedSeries &series, int horizon) const;

	/// One result per configured horizon, ascending; unavailable horizons carry module "forecast".
	std::vector<core::ModuleResult<core::ForecastResult>> forecastAll(const core::PreparedSeries &series) const;

	const ForecastEngineConfig &config() const {
		return config_;
	}

private:
	ForecastEngineConfig config_;
	models::ForecasterFactory factory_;
};

} // namespace almanac::forecast
