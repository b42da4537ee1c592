#include "almanac/detectors/isolation_forest.hpp"
#include "almanac/stats/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace almanac::detectors {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;

struct Partition {
	std::vector<std::size_t> indices;
	int depth = 0;
	int node = 0;
};

} // namespace

double averagePathLength(std::size_t n) {
	if (n <= 1) {
		return 0.0;
	}
	if (n == 2) {
		return 1.0;
	}
	const double m = static_cast<double>(n);
	return 2.0 * (std::log(m - 1.0) + kEulerGamma) - 2.0 * (m - 1.0) / m;
}

IsolationForest::IsolationForest(int trees, std::size_t subsample, std::uint64_t seed)
    : tree_count_(trees), subsample_(subsample), seed_(seed) {
}

void IsolationForest::fit(const features::Matrix &X) {
	if (X.empty() || X.front().empty()) {
		throw std::invalid_argument("IsolationForest requires a non-empty feature matrix.");
	}
	width_ = X.front().size();
	for (const auto &row : X) {
		if (row.size() != width_) {
			throw std::invalid_argument("IsolationForest rows must all have the same width.");
		}
	}

	sample_size_ = std::min(subsample_, X.size());
	const int max_depth =
	    static_cast<int>(std::ceil(std::log2(static_cast<double>(std::max<std::size_t>(sample_size_, 2)))));

	std::mt19937_64 rng(seed_);
	trees_.clear();
	trees_.reserve(static_cast<std::size_t>(tree_count_));

	std::vector<std::size_t> all(X.size());
	std::iota(all.begin(), all.end(), 0);

	for (int t = 0; t < tree_count_; ++t) {
		// Partial Fisher-Yates: the first sample_size_ entries form the subsample.
		for (std::size_t i = 0; i < sample_size_; ++i) {
			std::uniform_int_distribution<std::size_t> pick(i, all.size() - 1);
			std::swap(all[i], all[pick(rng)]);
		}

		Tree tree;
		tree.push_back(Node{});
		Partition root;
		root.indices.assign(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(sample_size_));
		std::vector<Partition> stack;
		stack.push_back(std::move(root));

		while (!stack.empty()) {
			Partition part = std::move(stack.back());
			stack.pop_back();
			tree[static_cast<std::size_t>(part.node)].size = part.indices.size();
			if (part.indices.size() <= 1 || part.depth >= max_depth) {
				continue;
			}

			std::vector<std::size_t> splittable;
			std::vector<std::pair<double, double>> ranges(width_);
			for (std::size_t f = 0; f < width_; ++f) {
				double lo = X[part.indices.front()][f];
				double hi = lo;
				for (auto idx : part.indices) {
					lo = std::min(lo, X[idx][f]);
					hi = std::max(hi, X[idx][f]);
				}
				ranges[f] = {lo, hi};
				if (hi > lo) {
					splittable.push_back(f);
				}
			}
			if (splittable.empty()) {
				continue;
			}

			std::uniform_int_distribution<std::size_t> pick_feature(0, splittable.size() - 1);
			const auto feature = splittable[pick_feature(rng)];
			std::uniform_real_distribution<double> pick_threshold(ranges[feature].first, ranges[feature].second);
			const double threshold = pick_threshold(rng);

			Partition left{{}, part.depth + 1, 0};
			Partition right{{}, part.depth + 1, 0};
			for (auto idx : part.indices) {
				(X[idx][feature] < threshold ? left : right).indices.push_back(idx);
			}
			if (left.indices.empty() || right.indices.empty()) {
				continue;
			}

			left.node = static_cast<int>(tree.size());
			tree.push_back(Node{});
			right.node = static_cast<int>(tree.size());
			tree.push_back(Node{});

			auto &node = tree[static_cast<std::size_t>(part.node)];
			node.feature = static_cast<int>(feature);
			node.threshold = threshold;
			node.left = left.node;
			node.right = right.node;

			stack.push_back(std::move(left));
			stack.push_back(std::move(right));
		}
		trees_.push_back(std::move(tree));
	}
}

double IsolationForest::pathLength(const Tree &tree, const features::Row &row) const {
	int index = 0;
	double depth = 0.0;
	while (tree[static_cast<std::size_t>(index)].feature >= 0) {
		const auto &node = tree[static_cast<std::size_t>(index)];
		index = row[static_cast<std::size_t>(node.feature)] < node.threshold ? node.left : node.right;
		depth += 1.0;
	}
	return depth + averagePathLength(tree[static_cast<std::size_t>(index)].size);
}

double IsolationForest::score(const features::Row &row) const {
	if (trees_.empty()) {
		throw std::runtime_error("IsolationForest must be fitted before scoring.");
	}
	if (row.size() != width_) {
		throw std::invalid_argument("Scored row width does not match the training data.");
	}
	double total = 0.0;
	for (const auto &tree : trees_) {
		total += pathLength(tree, row);
	}
	const double mean_path = total / static_cast<double>(trees_.size());
	const double normaliser = averagePathLength(sample_size_);
	if (normaliser <= 0.0) {
		return 0.5;
	}
	return std::pow(2.0, -mean_path / normaliser);
}

std::vector<double> IsolationForest::score(const features::Matrix &X) const {
	std::vector<double> scores;
	scores.reserve(X.size());
	for (const auto &row : X) {
		scores.push_back(score(row));
	}
	return scores;
}

std::vector<std::size_t> IsolationForest::outliers(const features::Matrix &X, double contamination) const {
	if (contamination <= 0.0 || contamination >= 1.0) {
		throw std::invalid_argument("Contamination must lie in (0, 1).");
	}
	const auto scores = score(X);
	const double cutoff = stats::quantile(scores, 1.0 - contamination);
	std::vector<std::size_t> flagged;
	for (std::size_t i = 0; i < scores.size(); ++i) {
		if (scores[i] > cutoff) {
			flagged.push_back(i);
		}
	}
	return flagged;
}

IsolationForestBuilder &IsolationForestBuilder::withTrees(int trees) {
	trees_ = trees;
	return *this;
}

IsolationForestBuilder &IsolationForestBuilder::withSubsample(std::size_t subsample) {
	subsample_ = subsample;
	return *this;
}

IsolationForestBuilder &IsolationForestBuilder::withSeed(std::uint64_t seed) {
	seed_ = seed;
	return *this;
}

std::unique_ptr<IsolationForest> IsolationForestBuilder::build() const {
	if (trees_ <= 0) {
		throw std::invalid_argument("IsolationForest needs at least one tree.");
	}
	if (subsample_ < 2) {
		throw std::invalid_argument("IsolationForest subsample must be at least 2.");
	}
	return std::unique_ptr<IsolationForest>(new IsolationForest(trees_, subsample_, seed_));
}

} // namespace almanac::detectors
