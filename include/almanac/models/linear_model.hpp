#pragma once

#include "almanac/models/imodel.hpp"

#include <memory>
#include <vector>

namespace almanac::models {

/**
 * @class LinearModel
 * @brief Ridge regression on standardised columns; thresholded at 0.5 for classification.
 *
 * Serves as the linear baseline next to the tree ensembles. Importances are the
 * absolute standardised coefficients.
 */
class LinearModel final : public IModel {
public:
	explicit LinearModel(ModelTask task = ModelTask::Classification, double lambda = 1.0);

	void fit(const features::Matrix &X, const std::vector<double> &y) override;

	std::vector<double> predict(const features::Matrix &X) const override;

	/// Raw linear scores before thresholding.
	std::vector<double> decisionFunction(const features::Matrix &X) const;

	std::vector<double> featureImportances() const override;

	ModelTask task() const override {
		return task_;
	}

	std::string getName() const override {
		return task_ == ModelTask::Classification ? "RidgeClassifier" : "RidgeRegressor";
	}

	const std::vector<double> &coefficients() const {
		return coefficients_;
	}

	double intercept() const {
		return intercept_;
	}

private:
	ModelTask task_;
	double lambda_;
	bool fitted_ = false;

	std::vector<double> means_;
	std::vector<double> scales_;
	std::vector<double> coefficients_;
	double intercept_ = 0.0;
};

class LinearModelBuilder {
public:
	LinearModelBuilder &withTask(ModelTask task);
	LinearModelBuilder &withLambda(double lambda);
	std::unique_ptr<LinearModel> build() const;

private:
	ModelTask task_ = ModelTask::Classification;
	double lambda_ = 1.0;
};

} // namespace almanac::models
