#include "almanac/models/random_forest.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace almanac::models {

RandomForest::Builder &RandomForest::Builder::withTask(ModelTask task) {
	task_ = task;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withTrees(int trees) {
	trees_ = trees;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withMaxDepth(int depth) {
	max_depth_ = depth;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withMinSamplesLeaf(std::size_t samples) {
	min_samples_leaf_ = samples;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withMaxFeatures(std::size_t features) {
	max_features_ = features;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withBootstrap(bool bootstrap) {
	bootstrap_ = bootstrap;
	return *this;
}

RandomForest::Builder &RandomForest::Builder::withSeed(std::uint64_t seed) {
	seed_ = seed;
	return *this;
}

std::unique_ptr<RandomForest> RandomForest::Builder::build() const {
	return std::make_unique<RandomForest>(task_, trees_, max_depth_, min_samples_leaf_, max_features_, bootstrap_,
	                                      seed_);
}

RandomForest::Builder RandomForest::builder() {
	return Builder{};
}

RandomForest::RandomForest(ModelTask task, int trees, int max_depth, std::size_t min_samples_leaf,
                           std::size_t max_features, bool bootstrap, std::uint64_t seed)
    : task_(task), n_trees_(trees), max_depth_(max_depth), min_samples_leaf_(min_samples_leaf),
      max_features_(max_features), bootstrap_(bootstrap), seed_(seed) {
	if (n_trees_ < 1) {
		throw std::invalid_argument("RandomForest requires at least one tree.");
	}
	if (max_depth_ < 1) {
		throw std::invalid_argument("RandomForest max_depth must be at least 1.");
	}
}

void RandomForest::fit(const features::Matrix &X, const std::vector<double> &y) {
	validateTrainingData(X, y);
	const std::size_t n = X.size();
	const std::size_t p = X.front().size();

	std::size_t per_split = max_features_;
	if (per_split == 0) {
		per_split = task_ == ModelTask::Classification
		                ? static_cast<std::size_t>(std::sqrt(static_cast<double>(p)))
		                : p / 3;
		per_split = std::max<std::size_t>(per_split, 1);
	}

	trees_.clear();
	trees_.reserve(static_cast<std::size_t>(n_trees_));
	importances_.assign(p, 0.0);

	std::mt19937_64 rng(seed_);
	std::uniform_int_distribution<std::size_t> draw(0, n - 1);
	std::vector<std::size_t> sample(n);

	for (int t = 0; t < n_trees_; ++t) {
		for (std::size_t i = 0; i < n; ++i) {
			sample[i] = bootstrap_ ? draw(rng) : i;
		}

		TreeConfig config;
		config.task = task_;
		config.max_depth = max_depth_;
		config.min_samples_leaf = min_samples_leaf_;
		config.min_samples_split = 2 * min_samples_leaf_;
		config.max_features = per_split;
		config.seed = rng();

		DecisionTree tree(config);
		tree.fit(X, y, sample);
		const auto tree_importances = tree.featureImportances();
		for (std::size_t j = 0; j < p; ++j) {
			importances_[j] += tree_importances[j];
		}
		trees_.push_back(std::move(tree));
	}
	importances_ = normaliseImportances(importances_);

	ALMANAC_DEBUG("{} fitted {} trees on {} rows x {} columns", getName(), trees_.size(), n, p);
}

std::vector<double> RandomForest::averageLeafValues(const features::Matrix &X) const {
	if (trees_.empty()) {
		throw std::runtime_error("RandomForest must be fitted before predicting.");
	}
	std::vector<double> averages(X.size(), 0.0);
	for (const auto &tree : trees_) {
		for (std::size_t i = 0; i < X.size(); ++i) {
			averages[i] += tree.predictValue(X[i]);
		}
	}
	for (auto &value : averages) {
		value /= static_cast<double>(trees_.size());
	}
	return averages;
}

std::vector<double> RandomForest::predictProbability(const features::Matrix &X) const {
	if (task_ != ModelTask::Classification) {
		throw std::logic_error("predictProbability requires a classification forest.");
	}
	return averageLeafValues(X);
}

std::vector<double> RandomForest::predict(const features::Matrix &X) const {
	auto values = averageLeafValues(X);
	if (task_ == ModelTask::Classification) {
		for (auto &value : values) {
			value = value > 0.5 ? 1.0 : 0.0;
		}
	}
	return values;
}

std::vector<double> RandomForest::featureImportances() const {
	return importances_;
}

} // namespace almanac::models
