#include "almanac/models/linear_model.hpp"
#include "almanac/utils/least_squares.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace almanac::models {

namespace {

constexpr double kMinScale = 1e-12;

} // namespace

LinearModel::LinearModel(ModelTask task, double lambda) : task_(task), lambda_(lambda) {
	if (lambda_ < 0.0) {
		throw std::invalid_argument("Ridge penalty must not be negative.");
	}
}

void LinearModel::fit(const features::Matrix &X, const std::vector<double> &y) {
	validateTrainingData(X, y);
	const auto n = static_cast<Eigen::Index>(X.size());
	const auto p = static_cast<Eigen::Index>(X.front().size());

	means_.assign(static_cast<std::size_t>(p), 0.0);
	scales_.assign(static_cast<std::size_t>(p), 0.0);
	for (Eigen::Index j = 0; j < p; ++j) {
		double sum = 0.0;
		for (const auto &row : X) {
			sum += row[static_cast<std::size_t>(j)];
		}
		const double m = sum / static_cast<double>(n);
		double accum = 0.0;
		for (const auto &row : X) {
			const double diff = row[static_cast<std::size_t>(j)] - m;
			accum += diff * diff;
		}
		means_[static_cast<std::size_t>(j)] = m;
		scales_[static_cast<std::size_t>(j)] = std::sqrt(accum / static_cast<double>(n));
	}

	Eigen::MatrixXd design(n, p);
	Eigen::VectorXd target(n);
	double target_mean = 0.0;
	for (const double value : y) {
		target_mean += value;
	}
	target_mean /= static_cast<double>(n);

	for (Eigen::Index i = 0; i < n; ++i) {
		const auto &row = X[static_cast<std::size_t>(i)];
		for (Eigen::Index j = 0; j < p; ++j) {
			const auto col = static_cast<std::size_t>(j);
			// Constant columns carry no information and are zeroed out.
			design(i, j) = scales_[col] > kMinScale ? (row[col] - means_[col]) / scales_[col] : 0.0;
		}
		target(i) = y[static_cast<std::size_t>(i)] - target_mean;
	}

	const Eigen::VectorXd penalty = Eigen::VectorXd::Constant(p, std::max(lambda_, kMinScale));
	const Eigen::VectorXd beta = utils::LeastSquares::ridge(design, target, penalty);

	coefficients_.assign(static_cast<std::size_t>(p), 0.0);
	for (Eigen::Index j = 0; j < p; ++j) {
		coefficients_[static_cast<std::size_t>(j)] = beta(j);
	}
	intercept_ = target_mean;
	fitted_ = true;
}

std::vector<double> LinearModel::decisionFunction(const features::Matrix &X) const {
	if (!fitted_) {
		throw std::runtime_error("LinearModel must be fitted before predicting.");
	}
	std::vector<double> scores;
	scores.reserve(X.size());
	for (const auto &row : X) {
		if (row.size() != coefficients_.size()) {
			throw std::invalid_argument("Prediction row width does not match the training data.");
		}
		double score = intercept_;
		for (std::size_t j = 0; j < row.size(); ++j) {
			if (scales_[j] > kMinScale) {
				score += coefficients_[j] * (row[j] - means_[j]) / scales_[j];
			}
		}
		scores.push_back(score);
	}
	return scores;
}

std::vector<double> LinearModel::predict(const features::Matrix &X) const {
	auto scores = decisionFunction(X);
	if (task_ == ModelTask::Classification) {
		for (auto &score : scores) {
			score = score > 0.5 ? 1.0 : 0.0;
		}
	}
	return scores;
}

std::vector<double> LinearModel::featureImportances() const {
	std::vector<double> importances;
	importances.reserve(coefficients_.size());
	for (double coefficient : coefficients_) {
		importances.push_back(std::abs(coefficient));
	}
	return normaliseImportances(std::move(importances));
}

LinearModelBuilder &LinearModelBuilder::withTask(ModelTask task) {
	task_ = task;
	return *this;
}

LinearModelBuilder &LinearModelBuilder::withLambda(double lambda) {
	lambda_ = lambda;
	return *this;
}

std::unique_ptr<LinearModel> LinearModelBuilder::build() const {
	return std::make_unique<LinearModel>(task_, lambda_);
}

} // namespace almanac::models
