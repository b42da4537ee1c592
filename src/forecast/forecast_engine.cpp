#include "almanac/forecast/forecast_engine.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/core/time_series.hpp"
#include "almanac/models/seasonal_trend_forecaster.hpp"
#include "almanac/utils/cross_validation.hpp"
#include "almanac/utils/logging.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace almanac::forecast {

ForecastEngine::ForecastEngine(ForecastEngineConfig config, models::ForecasterFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
	for (int horizon : config_.horizons) {
		if (horizon <= 0) {
			throw std::invalid_argument("Forecast horizons must be positive.");
		}
	}
	if (config_.cv_max_folds <= 0) {
		throw std::invalid_argument("cv_max_folds must be positive.");
	}
	if (!factory_) {
		models::SeasonalTrendForecaster::Params params;
		params.changepoint_count = config_.changepoint_count;
		params.changepoint_range = config_.changepoint_range;
		params.confidence_levels = config_.confidence_levels;
		factory_ = [params]() -> std::unique_ptr<models::IForecaster> {
			return std::make_unique<models::SeasonalTrendForecaster>(params);
		};
	}
}

core::ForecastResult ForecastEngine::forecast(const core::PreparedSeries &series, int horizon) const {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	if (!series.is_daily) {
		throw core::ForecastUnavailableError(horizon, "series is not sampled daily");
	}
	const auto required = 2 * static_cast<std::size_t>(horizon);
	if (series.size() < required) {
		throw core::ForecastUnavailableError(horizon, "needs " + std::to_string(required) + " observations, have " +
		                                                  std::to_string(series.size()));
	}

	const core::TimeSeries ts(series.dates(), series.closes(), series.symbol);

	core::ForecastResult result;
	result.horizon_days = horizon;

	auto model = factory_();
	result.model = model->getName();
	try {
		model->fit(ts);
		result.forecast = model->predict(horizon);
	} catch (const std::exception &e) {
		throw core::ForecastUnavailableError(horizon, result.model + " failed: " + e.what());
	}

	const auto cv_config =
	    utils::CrossValidation::backToBack(static_cast<int>(ts.size()), horizon, config_.cv_max_folds);
	if (cv_config) {
		const auto cv = utils::CrossValidation::evaluate(ts, factory_, *cv_config);
		result.accuracy.folds = static_cast<std::size_t>(cv.successful_folds);
		result.accuracy.mae = cv.mae;
		result.accuracy.mape = cv.mape;
		result.accuracy.directional_accuracy =
		    cv.directional_accuracy.value_or(std::numeric_limits<double>::quiet_NaN());
	}

	ALMANAC_DEBUG("Forecast {}: {} sessions, {} CV folds", series.symbol, horizon, result.accuracy.folds);
	return result;
}

std::vector<core::ModuleResult<core::ForecastResult>>
ForecastEngine::forecastAll(const core::PreparedSeries &series) const {
	std::vector<core::ModuleResult<core::ForecastResult>> results;
	results.reserve(config_.horizons.size());
	for (int horizon : config_.horizons) {
		try {
			results.emplace_back(forecast(series, horizon));
		} catch (const core::ForecastUnavailableError &e) {
			ALMANAC_WARN("forecast: {}", e.what());
			results.push_back(core::ModuleResult<core::ForecastResult>::unavailable("forecast", e.what()));
		} catch (const std::exception &e) {
			const std::string reason = "horizon " + std::to_string(horizon) + ": " + e.what();
			ALMANAC_WARN("forecast: {}", reason);
			results.push_back(core::ModuleResult<core::ForecastResult>::unavailable("forecast", reason));
		}
	}
	return results;
}

} // namespace almanac::forecast
