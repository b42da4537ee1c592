#pragma once

#include "almanac/features/feature_engineering.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace almanac::models {

enum class ModelTask {
	Classification, ///< Binary labels 0/1.
	Regression
};

/**
 * @class IModel
 * @brief An interface for the supervised models used on engineered features.
 *
 * Classifiers are trained on 0/1 labels and predict labels; regressors predict
 * real values. Every model reports one importance per input column.
 */
class IModel {
public:
	virtual ~IModel() = default;

	/**
	 * @brief Fits the model.
	 * @param X Row-major design matrix.
	 * @param y One target per row.
	 * @throws std::invalid_argument when X and y disagree in length or X is empty.
	 */
	virtual void fit(const features::Matrix &X, const std::vector<double> &y) = 0;

	/**
	 * @brief Predicts one value per row of @p X.
	 * @throws std::runtime_error when called before fit().
	 */
	virtual std::vector<double> predict(const features::Matrix &X) const = 0;

	/// Non-negative importances, one per column, summing to one (all zero when nothing was learned).
	virtual std::vector<double> featureImportances() const = 0;

	virtual ModelTask task() const = 0;

	virtual std::string getName() const = 0;
};

using ModelFactory = std::function<std::unique_ptr<IModel>()>;

/// Validates that @p X is a non-empty rectangular matrix with one target per row.
void validateTrainingData(const features::Matrix &X, const std::vector<double> &y);

/// Scales @p values so they sum to one; leaves an all-zero vector untouched.
std::vector<double> normaliseImportances(std::vector<double> values);

} // namespace almanac::models
