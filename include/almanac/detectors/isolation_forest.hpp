#pragma once

#include "almanac/features/feature_engineering.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace almanac::detectors {

class IsolationForestBuilder; // Forward declaration

/**
 * @class IsolationForest
 * @brief Unsupervised outlier scoring by random recursive partitioning.
 *
 * Each tree isolates a random subsample with axis-aligned cuts. Points that are
 * isolated after few cuts are anomalous. Scores follow the usual normalisation
 * 2^(-E[h(x)] / c(psi)) and lie in (0, 1]; higher means more anomalous.
 * Training is deterministic for a given seed.
 */
class IsolationForest {
public:
	friend class IsolationForestBuilder;

	/// @throws std::invalid_argument for an empty or ragged matrix.
	void fit(const features::Matrix &X);

	/// @throws std::runtime_error when called before fit().
	double score(const features::Row &row) const;

	std::vector<double> score(const features::Matrix &X) const;

	/**
	 * @brief Indices of the rows whose score is strictly above the (1 - contamination)
	 *        quantile of the training scores.
	 */
	std::vector<std::size_t> outliers(const features::Matrix &X, double contamination) const;

	std::string getName() const {
		return "IsolationForest";
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

private:
	IsolationForest(int trees, std::size_t subsample, std::uint64_t seed);

	struct Node {
		int feature = -1;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		std::size_t size = 0;
	};
	using Tree = std::vector<Node>;

	double pathLength(const Tree &tree, const features::Row &row) const;

	int tree_count_;
	std::size_t subsample_;
	std::uint64_t seed_;

	std::size_t sample_size_ = 0;
	std::size_t width_ = 0;
	std::vector<Tree> trees_;
};

/**
 * @class IsolationForestBuilder
 * @brief A builder for fluently configuring and creating IsolationForest instances.
 */
class IsolationForestBuilder {
public:
	IsolationForestBuilder &withTrees(int trees);
	IsolationForestBuilder &withSubsample(std::size_t subsample);
	IsolationForestBuilder &withSeed(std::uint64_t seed);

	/// @throws std::invalid_argument when trees or subsample is not positive.
	std::unique_ptr<IsolationForest> build() const;

private:
	int trees_ = 100;
	std::size_t subsample_ = 256;
	std::uint64_t seed_ = 42;
};

/// Average path length of an unsuccessful search in a binary search tree of @p n points.
double averagePathLength(std::size_t n);

} // namespace almanac::detectors
