#include "almanac/preparation/series_preparation.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/core/time_series.hpp"
#include "almanac/utils/logging.hpp"

#include <cmath>
#include <deque>
#include <stdexcept>

namespace almanac::preparation {

namespace {

bool isMissing(const core::PriceObservation &obs) {
	return std::isnan(obs.close) || obs.close <= 0.0;
}

bool isNegative(double value) {
	return !std::isnan(value) && value < 0.0;
}

core::PriceObservation normalise(core::PriceObservation obs) {
	if (std::isnan(obs.open)) {
		obs.open = obs.close;
	}
	if (std::isnan(obs.high)) {
		obs.high = obs.close;
	}
	if (std::isnan(obs.low)) {
		obs.low = obs.close;
	}
	if (std::isnan(obs.volume)) {
		obs.volume = 0.0;
	}
	return obs;
}

core::PriceObservation carryForward(const core::PriceObservation &previous, const core::Date &date) {
	return core::PriceObservation::fromClose(date, previous.close, 0.0);
}

} // namespace

SeriesPreparer::SeriesPreparer(PreparationConfig config) : config_(config) {
	if (config_.min_observations < 2) {
		throw std::invalid_argument("min_observations must be at least 2.");
	}
	if (config_.volatility_window < 2) {
		throw std::invalid_argument("volatility_window must be at least 2.");
	}
}

void SeriesPreparer::validate(const std::vector<core::PriceObservation> &observations) const {
	for (std::size_t i = 0; i < observations.size(); ++i) {
		const auto &obs = observations[i];
		if (i > 0 && !(observations[i - 1].date < obs.date)) {
			throw std::invalid_argument("Observation dates must be strictly increasing (at " + obs.date.toString() +
			                            ").");
		}
		if (isNegative(obs.open) || isNegative(obs.high) || isNegative(obs.low) || isNegative(obs.close) ||
		    isNegative(obs.volume)) {
			throw std::invalid_argument("Observation values must not be negative (at " + obs.date.toString() + ").");
		}
	}
}

core::PreparedSeries SeriesPreparer::prepare(const std::string &symbol,
                                             const std::vector<core::PriceObservation> &observations) const {
	validate(observations);

	core::PreparedSeries prepared;
	prepared.symbol = symbol;
	prepared.observations.reserve(observations.size());

	std::vector<core::Date> pending;
	auto flushPending = [&]() {
		if (pending.empty()) {
			return;
		}
		if (!prepared.observations.empty() && pending.size() <= config_.max_fill_gap) {
			const auto previous = prepared.observations.back();
			for (const auto &date : pending) {
				prepared.observations.push_back(carryForward(previous, date));
			}
			prepared.filled_rows += pending.size();
		} else {
			prepared.dropped_rows += pending.size();
		}
		pending.clear();
	};

	for (const auto &obs : observations) {
		if (isMissing(obs)) {
			pending.push_back(obs.date);
			continue;
		}
		flushPending();
		prepared.observations.push_back(normalise(obs));
	}
	flushPending();

	if (prepared.observations.size() < config_.min_observations) {
		throw core::InsufficientDataError(config_.min_observations, prepared.observations.size());
	}

	if (prepared.filled_rows > 0 || prepared.dropped_rows > 0) {
		ALMANAC_DEBUG("{}: forward-filled {} and dropped {} missing rows", symbol, prepared.filled_rows,
		              prepared.dropped_rows);
	}

	if (prepared.observations.size() < config_.recommended_observations) {
		prepared.reduced_history = true;
		ALMANAC_WARN("{}: only {} observations available ({} recommended); results are less reliable", symbol,
		             prepared.observations.size(), config_.recommended_observations);
	}

	const core::TimeSeries closes(prepared.dates(), prepared.closes(), symbol);
	prepared.is_daily = closes.medianSpacingDays() <= config_.max_daily_spacing_days;
	if (!prepared.is_daily) {
		ALMANAC_WARN("{}: median observation spacing {} days is not daily", symbol, closes.medianSpacingDays());
	}

	prepared.returns = computeReturns(prepared.observations, config_.volatility_window);
	return prepared;
}

core::ReturnSeries SeriesPreparer::computeReturns(const std::vector<core::PriceObservation> &observations,
                                                  std::size_t volatility_window) {
	core::ReturnSeries returns;
	if (observations.size() < 2) {
		return returns;
	}
	returns.reserve(observations.size() - 1);

	const double base = observations.front().close;
	std::deque<double> window;

	for (std::size_t i = 1; i < observations.size(); ++i) {
		const auto &obs = observations[i];
		core::ReturnPoint point;
		point.date = obs.date;
		point.daily_return = obs.close / observations[i - 1].close - 1.0;
		point.cumulative_return = obs.close / base - 1.0;
		point.year = obs.date.year;
		point.month = obs.date.month;
		point.quarter = obs.date.quarter();
		point.weekday = obs.date.weekday();

		window.push_back(point.daily_return);
		if (window.size() > volatility_window) {
			window.pop_front();
		}
		if (window.size() == volatility_window) {
			double sum = 0.0;
			for (double value : window) {
				sum += value;
			}
			const double n = static_cast<double>(volatility_window);
			const double window_mean = sum / n;
			double accum = 0.0;
			for (double value : window) {
				accum += (value - window_mean) * (value - window_mean);
			}
			point.rolling_volatility = std::sqrt(accum / (n - 1.0));
		}
		returns.push_back(point);
	}
	return returns;
}

} // namespace almanac::preparation
