#pragma once

#include "almanac/models/iforecaster.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <vector>

namespace almanac::models {

/**
 * @brief A Fourier seasonality with a custom periodicity in days.
 */
struct FourierSeasonality {
	std::string name;
	double period_days = 365.25;
	int order = 3;
};

/**
 * @class SeasonalTrendForecaster
 * @brief Additive trend plus seasonality model on the log price.
 *
 * log y(t) = g(t) + s(t) + e(t) where g is piecewise linear with potential
 * changepoints spread evenly over the first changepoint_range share of the
 * history, and s is a sum of Fourier series. Changepoint deltas and Fourier
 * coefficients are ridge-penalised; everything is solved in one Eigen
 * least-squares system. A seasonality enters the design only when the history
 * spans at least two of its periods.
 *
 * Forecast dates are the next Monday-to-Friday sessions. The variance at step h
 * is sigma^2 + h * sigma_step^2, with sigma^2 the residual variance and
 * sigma_step^2 the variance of its first differences, so intervals widen with
 * the horizon.
 */
class SeasonalTrendForecaster : public IForecaster {
public:
	struct Params {
		int changepoint_count = 25;
		double changepoint_range = 0.8;
		/// Ridge penalty per observation on changepoint deltas.
		double changepoint_penalty = 0.05;
		/// Ridge penalty per observation on Fourier coefficients.
		double seasonality_penalty = 0.01;
		std::vector<FourierSeasonality> seasonalities = {
		    {"yearly", 365.25, 6}, {"quarterly", 91.3125, 3}, {"monthly", 30.4375, 3}, {"weekly", 7.0, 2}};
		std::vector<double> confidence_levels = {0.80, 0.95};
	};

	class Builder {
	public:
		Builder &withChangepoints(int count, double range);
		Builder &withChangepointPenalty(double penalty);
		Builder &withSeasonalityPenalty(double penalty);
		Builder &withSeasonalities(std::vector<FourierSeasonality> seasonalities);
		Builder &withConfidenceLevels(std::vector<double> levels);
		std::unique_ptr<SeasonalTrendForecaster> build() const;

	private:
		Params params_;
	};

	static Builder builder();

	SeasonalTrendForecaster();
	explicit SeasonalTrendForecaster(Params params);

	/// @throws std::invalid_argument for fewer than 10 points or non-positive values.
	void fit(const core::TimeSeries &ts) override;

	/// @throws std::runtime_error when called before fit().
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "SeasonalTrend";
	}

	/// In-sample fitted prices.
	const std::vector<double> &fittedValues() const {
		return fitted_;
	}

	/// Names of the seasonalities that entered the design.
	std::vector<std::string> activeSeasonalities() const;

	double residualStdDev() const {
		return sigma_;
	}

	const Params &params() const {
		return params_;
	}

private:
	/// Design row for a point t days after the first observation.
	Eigen::RowVectorXd designRow(double day) const;

	Params params_;

	bool fitted_flag_ = false;
	core::Date origin_;
	core::Date last_date_;
	double span_days_ = 1.0;
	std::vector<double> changepoints_;
	std::vector<FourierSeasonality> active_;
	Eigen::VectorXd beta_;
	double sigma_ = 0.0;
	double sigma_step_ = 0.0;
	std::vector<double> fitted_;
};

} // namespace almanac::models
