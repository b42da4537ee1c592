#include "almanac/models/seasonal_trend_forecaster.hpp"
#include "almanac/stats/distributions.hpp"
#include "almanac/utils/least_squares.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace almanac::models {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr double kUnpenalised = 1e-8;
constexpr std::size_t kMinPoints = 10;

} // namespace

SeasonalTrendForecaster::Builder &SeasonalTrendForecaster::Builder::withChangepoints(int count, double range) {
	params_.changepoint_count = count;
	params_.changepoint_range = range;
	return *this;
}

SeasonalTrendForecaster::Builder &SeasonalTrendForecaster::Builder::withChangepointPenalty(double penalty) {
	params_.changepoint_penalty = penalty;
	return *this;
}

SeasonalTrendForecaster::Builder &SeasonalTrendForecaster::Builder::withSeasonalityPenalty(double penalty) {
	params_.seasonality_penalty = penalty;
	return *this;
}

SeasonalTrendForecaster::Builder &
SeasonalTrendForecaster::Builder::withSeasonalities(std::vector<FourierSeasonality> seasonalities) {
	params_.seasonalities = std::move(seasonalities);
	return *this;
}

SeasonalTrendForecaster::Builder &SeasonalTrendForecaster::Builder::withConfidenceLevels(std::vector<double> levels) {
	params_.confidence_levels = std::move(levels);
	return *this;
}

std::unique_ptr<SeasonalTrendForecaster> SeasonalTrendForecaster::Builder::build() const {
	return std::make_unique<SeasonalTrendForecaster>(params_);
}

SeasonalTrendForecaster::Builder SeasonalTrendForecaster::builder() {
	return Builder();
}

SeasonalTrendForecaster::SeasonalTrendForecaster() : SeasonalTrendForecaster(Params{}) {
}

SeasonalTrendForecaster::SeasonalTrendForecaster(Params params) : params_(std::move(params)) {
	if (params_.changepoint_count < 0) {
		throw std::invalid_argument("Changepoint count must not be negative.");
	}
	if (params_.changepoint_range <= 0.0 || params_.changepoint_range > 1.0) {
		throw std::invalid_argument("Changepoint range must lie in (0, 1].");
	}
	if (params_.changepoint_penalty < 0.0 || params_.seasonality_penalty < 0.0) {
		throw std::invalid_argument("Ridge penalties must not be negative.");
	}
	for (const auto &seasonality : params_.seasonalities) {
		if (seasonality.period_days <= 0.0 || seasonality.order <= 0) {
			throw std::invalid_argument("Seasonality '" + seasonality.name + "' needs a positive period and order.");
		}
	}
	for (double level : params_.confidence_levels) {
		if (level <= 0.0 || level >= 1.0) {
			throw std::invalid_argument("Confidence levels must lie in (0, 1).");
		}
	}
	std::sort(params_.confidence_levels.begin(), params_.confidence_levels.end());
}

Eigen::RowVectorXd SeasonalTrendForecaster::designRow(double day) const {
	std::size_t width = 2 + changepoints_.size();
	for (const auto &seasonality : active_) {
		width += 2 * static_cast<std::size_t>(seasonality.order);
	}
	Eigen::RowVectorXd row(static_cast<Eigen::Index>(width));

	const double t = day / span_days_;
	Eigen::Index col = 0;
	row(col++) = 1.0;
	row(col++) = t;
	for (double changepoint : changepoints_) {
		row(col++) = std::max(0.0, t - changepoint);
	}
	for (const auto &seasonality : active_) {
		for (int k = 1; k <= seasonality.order; ++k) {
			const double angle = kTwoPi * k * day / seasonality.period_days;
			row(col++) = std::sin(angle);
			row(col++) = std::cos(angle);
		}
	}
	return row;
}

void SeasonalTrendForecaster::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto &dates = ts.getDates();
	const std::size_t n = values.size();
	if (n < kMinPoints) {
		throw std::invalid_argument("SeasonalTrendForecaster needs at least 10 observations.");
	}
	for (double value : values) {
		if (!(value > 0.0)) {
			throw std::invalid_argument("SeasonalTrendForecaster requires strictly positive prices.");
		}
	}

	origin_ = dates.front();
	last_date_ = dates.back();
	span_days_ = std::max(1.0, static_cast<double>(last_date_.toSerial() - origin_.toSerial()));

	std::vector<double> days(n);
	for (std::size_t i = 0; i < n; ++i) {
		days[i] = static_cast<double>(dates[i].toSerial() - origin_.toSerial());
	}

	// Potential changepoints at evenly spaced observations of the leading history.
	changepoints_.clear();
	const auto history = static_cast<std::size_t>(std::floor(static_cast<double>(n) * params_.changepoint_range));
	const std::size_t count =
	    std::min<std::size_t>(static_cast<std::size_t>(params_.changepoint_count), history > 1 ? history - 1 : 0);
	for (std::size_t j = 1; j <= count; ++j) {
		const auto index = static_cast<std::size_t>(
		    std::llround(static_cast<double>(j) * static_cast<double>(history - 1) / static_cast<double>(count)));
		const double position = days[index] / span_days_;
		if (changepoints_.empty() || position > changepoints_.back()) {
			changepoints_.push_back(position);
		}
	}

	active_.clear();
	for (const auto &seasonality : params_.seasonalities) {
		if (span_days_ >= 2.0 * seasonality.period_days) {
			active_.push_back(seasonality);
		}
	}

	const Eigen::RowVectorXd first_row = designRow(0.0);
	const Eigen::Index p = first_row.size();
	Eigen::MatrixXd X(static_cast<Eigen::Index>(n), p);
	Eigen::VectorXd y(static_cast<Eigen::Index>(n));
	for (std::size_t i = 0; i < n; ++i) {
		X.row(static_cast<Eigen::Index>(i)) = designRow(days[i]);
		y(static_cast<Eigen::Index>(i)) = std::log(values[i]);
	}

	const double scale = static_cast<double>(n);
	Eigen::VectorXd penalty(p);
	penalty(0) = kUnpenalised * scale;
	penalty(1) = kUnpenalised * scale;
	Eigen::Index col = 2;
	for (std::size_t j = 0; j < changepoints_.size(); ++j) {
		penalty(col++) = params_.changepoint_penalty * scale + kUnpenalised;
	}
	for (; col < p; ++col) {
		penalty(col) = params_.seasonality_penalty * scale + kUnpenalised;
	}

	beta_ = utils::LeastSquares::ridge(X, y, penalty);

	const Eigen::VectorXd fitted_log = X * beta_;
	const Eigen::VectorXd residual = y - fitted_log;
	fitted_.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		fitted_[i] = std::exp(fitted_log(static_cast<Eigen::Index>(i)));
	}

	sigma_ = std::sqrt(residual.squaredNorm() / static_cast<double>(n - 1));
	double step_mean = 0.0;
	for (Eigen::Index i = 1; i < residual.size(); ++i) {
		step_mean += residual(i) - residual(i - 1);
	}
	step_mean /= static_cast<double>(n - 1);
	double step_var = 0.0;
	for (Eigen::Index i = 1; i < residual.size(); ++i) {
		const double d = residual(i) - residual(i - 1) - step_mean;
		step_var += d * d;
	}
	sigma_step_ = n > 2 ? std::sqrt(step_var / static_cast<double>(n - 2)) : 0.0;

	fitted_flag_ = true;
	ALMANAC_DEBUG("SeasonalTrend fitted on {} points: {} changepoints, {} seasonalities, sigma {:.5f}", n,
	              changepoints_.size(), active_.size(), sigma_);
}

core::Forecast SeasonalTrendForecaster::predict(int horizon) {
	if (!fitted_flag_) {
		throw std::runtime_error("SeasonalTrendForecaster must be fitted before predicting.");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	core::Forecast forecast;
	const auto h = static_cast<std::size_t>(horizon);
	forecast.dates.reserve(h);
	forecast.point.reserve(h);

	std::vector<double> means;
	std::vector<double> spreads;
	core::Date date = last_date_;
	for (std::size_t step = 1; step <= h; ++step) {
		date = date.nextWeekday();
		const double day = static_cast<double>(date.toSerial() - origin_.toSerial());
		const double mean = designRow(day).dot(beta_);
		forecast.dates.push_back(date);
		forecast.point.push_back(std::exp(mean));
		means.push_back(mean);
		spreads.push_back(std::sqrt(sigma_ * sigma_ + static_cast<double>(step) * sigma_step_ * sigma_step_));
	}

	for (double level : params_.confidence_levels) {
		const double z = stats::normalQuantile(0.5 + level / 2.0);
		core::PredictionInterval interval;
		interval.level = level;
		interval.lower.reserve(h);
		interval.upper.reserve(h);
		for (std::size_t i = 0; i < h; ++i) {
			interval.lower.push_back(std::exp(means[i] - z * spreads[i]));
			interval.upper.push_back(std::exp(means[i] + z * spreads[i]));
		}
		forecast.intervals.push_back(std::move(interval));
	}
	return forecast;
}

std::vector<std::string> SeasonalTrendForecaster::activeSeasonalities() const {
	std::vector<std::string> names;
	for (const auto &seasonality : active_) {
		names.push_back(seasonality.name);
	}
	return names;
}

} // namespace almanac::models
