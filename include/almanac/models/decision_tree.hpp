#pragma once

#include "almanac/models/imodel.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace almanac::models {

struct TreeConfig {
	ModelTask task = ModelTask::Classification;
	int max_depth = 8;
	std::size_t min_samples_split = 10;
	std::size_t min_samples_leaf = 5;
	/// Columns considered per split; 0 considers all of them.
	std::size_t max_features = 0;
	std::uint64_t seed = 42;
};

/**
 * @class DecisionTree
 * @brief A CART tree: Gini impurity for classification, squared error for regression.
 *
 * Importances are the total weighted impurity decrease credited to each column.
 */
class DecisionTree final : public IModel {
public:
	explicit DecisionTree(TreeConfig config = {});

	void fit(const features::Matrix &X, const std::vector<double> &y) override;

	/// Fits on the rows listed in @p sample (duplicates allowed, as for a bootstrap sample).
	void fit(const features::Matrix &X, const std::vector<double> &y, const std::vector<std::size_t> &sample);

	std::vector<double> predict(const features::Matrix &X) const override;

	/// Leaf value for one row: class-1 frequency for classification, mean target for regression.
	double predictValue(const features::Row &row) const;

	std::vector<double> featureImportances() const override;

	/// Unnormalised impurity decreases, one per column.
	const std::vector<double> &rawImportances() const {
		return importances_;
	}

	ModelTask task() const override {
		return config_.task;
	}

	std::string getName() const override {
		return "DecisionTree";
	}

	std::size_t nodeCount() const {
		return nodes_.size();
	}

	int depth() const {
		return depth_;
	}

private:
	struct Node {
		int feature = -1;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;

		bool isLeaf() const {
			return feature < 0;
		}
	};

	struct Split {
		int feature = -1;
		double threshold = 0.0;
		double gain = 0.0;
	};

	int build(const features::Matrix &X, const std::vector<double> &y, std::vector<std::size_t> &indices,
	          std::size_t begin, std::size_t end, int depth, std::mt19937_64 &rng);
	Split bestSplit(const features::Matrix &X, const std::vector<double> &y, const std::vector<std::size_t> &indices,
	                std::size_t begin, std::size_t end, std::mt19937_64 &rng) const;
	double impurity(const std::vector<double> &y, const std::vector<std::size_t> &indices, std::size_t begin,
	                std::size_t end) const;
	double leafValue(const std::vector<double> &y, const std::vector<std::size_t> &indices, std::size_t begin,
	                 std::size_t end) const;

	TreeConfig config_;
	std::vector<Node> nodes_;
	std::vector<double> importances_;
	std::size_t n_features_ = 0;
	int depth_ = 0;
};

} // namespace almanac::models
