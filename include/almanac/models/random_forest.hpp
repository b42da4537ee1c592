#pragma once

#include "almanac/models/decision_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace almanac::models {

/**
 * @class RandomForest
 * @brief Bagged CART trees with per-split column subsampling.
 *
 * Each tree is trained on a bootstrap sample drawn from a generator seeded
 * with the forest seed, so repeated fits on the same data are identical.
 */
class RandomForest final : public IModel {
public:
	class Builder {
	public:
		Builder &withTask(ModelTask task);
		Builder &withTrees(int trees);
		Builder &withMaxDepth(int depth);
		Builder &withMinSamplesLeaf(std::size_t samples);
		/// Columns per split; 0 picks sqrt(p) for classification and p/3 for regression.
		Builder &withMaxFeatures(std::size_t features);
		Builder &withBootstrap(bool bootstrap);
		Builder &withSeed(std::uint64_t seed);
		std::unique_ptr<RandomForest> build() const;

	private:
		ModelTask task_ = ModelTask::Classification;
		int trees_ = 100;
		int max_depth_ = 8;
		std::size_t min_samples_leaf_ = 5;
		std::size_t max_features_ = 0;
		bool bootstrap_ = true;
		std::uint64_t seed_ = 42;
	};

	static Builder builder();

	RandomForest(ModelTask task, int trees, int max_depth, std::size_t min_samples_leaf, std::size_t max_features,
	             bool bootstrap, std::uint64_t seed);

	void fit(const features::Matrix &X, const std::vector<double> &y) override;

	std::vector<double> predict(const features::Matrix &X) const override;

	/// Mean leaf class-1 frequency across trees (classification only).
	std::vector<double> predictProbability(const features::Matrix &X) const;

	std::vector<double> featureImportances() const override;

	ModelTask task() const override {
		return task_;
	}

	std::string getName() const override {
		return task_ == ModelTask::Classification ? "RandomForestClassifier" : "RandomForestRegressor";
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

private:
	std::vector<double> averageLeafValues(const features::Matrix &X) const;

	ModelTask task_;
	int n_trees_;
	int max_depth_;
	std::size_t min_samples_leaf_;
	std::size_t max_features_;
	bool bootstrap_;
	std::uint64_t seed_;

	std::vector<DecisionTree> trees_;
	std::vector<double> importances_;
};

} // namespace almanac::models
