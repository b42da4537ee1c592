#include "almanac/models/decision_tree.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace almanac::models {

namespace {

constexpr double kMinGain = 1e-12;

double gini(double positives, double count) {
	if (count <= 0.0) {
		return 0.0;
	}
	const double p = positives / count;
	return 2.0 * p * (1.0 - p);
}

double squaredError(double sum, double sum_sq, double count) {
	if (count <= 0.0) {
		return 0.0;
	}
	return std::max(0.0, sum_sq - sum * sum / count);
}

} // namespace

DecisionTree::DecisionTree(TreeConfig config) : config_(config) {
	if (config_.max_depth < 1) {
		throw std::invalid_argument("Tree max_depth must be at least 1.");
	}
	if (config_.min_samples_leaf < 1) {
		throw std::invalid_argument("Tree min_samples_leaf must be at least 1.");
	}
	config_.min_samples_split = std::max(config_.min_samples_split, 2 * config_.min_samples_leaf);
}

void DecisionTree::fit(const features::Matrix &X, const std::vector<double> &y) {
	std::vector<std::size_t> sample(X.size());
	std::iota(sample.begin(), sample.end(), 0);
	fit(X, y, sample);
}

void DecisionTree::fit(const features::Matrix &X, const std::vector<double> &y,
                       const std::vector<std::size_t> &sample) {
	validateTrainingData(X, y);
	if (sample.empty()) {
		throw std::invalid_argument("Tree training sample must not be empty.");
	}
	for (auto index : sample) {
		if (index >= X.size()) {
			throw std::out_of_range("Tree training sample index exceeds the matrix.");
		}
	}

	n_features_ = X.front().size();
	nodes_.clear();
	importances_.assign(n_features_, 0.0);
	depth_ = 0;

	std::vector<std::size_t> indices = sample;
	std::mt19937_64 rng(config_.seed);
	build(X, y, indices, 0, indices.size(), 0, rng);
}

double DecisionTree::impurity(const std::vector<double> &y, const std::vector<std::size_t> &indices,
                              std::size_t begin, std::size_t end) const {
	const double count = static_cast<double>(end - begin);
	if (config_.task == ModelTask::Classification) {
		double positives = 0.0;
		for (std::size_t i = begin; i < end; ++i) {
			positives += y[indices[i]] > 0.5 ? 1.0 : 0.0;
		}
		return gini(positives, count);
	}
	double sum = 0.0;
	double sum_sq = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		const double value = y[indices[i]];
		sum += value;
		sum_sq += value * value;
	}
	return squaredError(sum, sum_sq, count) / count;
}

double DecisionTree::leafValue(const std::vector<double> &y, const std::vector<std::size_t> &indices,
                               std::size_t begin, std::size_t end) const {
	double sum = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		const double value = y[indices[i]];
		sum += config_.task == ModelTask::Classification ? (value > 0.5 ? 1.0 : 0.0) : value;
	}
	return sum / static_cast<double>(end - begin);
}

DecisionTree::Split DecisionTree::bestSplit(const features::Matrix &X, const std::vector<double> &y,
                                            const std::vector<std::size_t> &indices, std::size_t begin,
                                            std::size_t end, std::mt19937_64 &rng) const {
	std::vector<int> candidates(n_features_);
	std::iota(candidates.begin(), candidates.end(), 0);
	std::size_t considered = n_features_;
	if (config_.max_features > 0 && config_.max_features < n_features_) {
		// Partial Fisher-Yates: the first max_features entries are a uniform sample.
		for (std::size_t i = 0; i < config_.max_features; ++i) {
			std::uniform_int_distribution<std::size_t> pick(i, n_features_ - 1);
			std::swap(candidates[i], candidates[pick(rng)]);
		}
		considered = config_.max_features;
	}

	const std::size_t count = end - begin;
	const double total = static_cast<double>(count);
	const double parent = impurity(y, indices, begin, end);

	Split best;
	std::vector<std::pair<double, double>> column(count);

	for (std::size_t c = 0; c < considered; ++c) {
		const int feature = candidates[c];
		for (std::size_t i = 0; i < count; ++i) {
			const auto row = indices[begin + i];
			column[i] = {X[row][static_cast<std::size_t>(feature)], y[row]};
		}
		std::sort(column.begin(), column.end(),
		          [](const auto &a, const auto &b) { return a.first < b.first; });
		if (column.front().first == column.back().first) {
			continue;
		}

		double total_sum = 0.0;
		double total_sq = 0.0;
		double total_pos = 0.0;
		for (const auto &entry : column) {
			total_sum += entry.second;
			total_sq += entry.second * entry.second;
			total_pos += entry.second > 0.5 ? 1.0 : 0.0;
		}

		double left_sum = 0.0;
		double left_sq = 0.0;
		double left_pos = 0.0;
		for (std::size_t i = 0; i + 1 < count; ++i) {
			const double target = column[i].second;
			left_sum += target;
			left_sq += target * target;
			left_pos += target > 0.5 ? 1.0 : 0.0;

			const std::size_t n_left = i + 1;
			const std::size_t n_right = count - n_left;
			if (n_left < config_.min_samples_leaf) {
				continue;
			}
			if (n_right < config_.min_samples_leaf) {
				break;
			}
			if (column[i].first == column[i + 1].first) {
				continue;
			}

			const double nl = static_cast<double>(n_left);
			const double nr = static_cast<double>(n_right);
			double child;
			if (config_.task == ModelTask::Classification) {
				child = (nl * gini(left_pos, nl) + nr * gini(total_pos - left_pos, nr)) / total;
			} else {
				child = (squaredError(left_sum, left_sq, nl) +
				         squaredError(total_sum - left_sum, total_sq - left_sq, nr)) /
				        total;
			}
			const double gain = parent - child;
			if (gain > best.gain + kMinGain) {
				best.feature = feature;
				best.threshold = 0.5 * (column[i].first + column[i + 1].first);
				best.gain = gain;
			}
		}
	}
	return best;
}

int DecisionTree::build(const features::Matrix &X, const std::vector<double> &y, std::vector<std::size_t> &indices,
                        std::size_t begin, std::size_t end, int depth, std::mt19937_64 &rng) {
	const int node_index = static_cast<int>(nodes_.size());
	nodes_.emplace_back();
	nodes_[node_index].value = leafValue(y, indices, begin, end);
	depth_ = std::max(depth_, depth);

	const std::size_t count = end - begin;
	if (depth >= config_.max_depth || count < config_.min_samples_split) {
		return node_index;
	}
	if (impurity(y, indices, begin, end) <= kMinGain) {
		return node_index;
	}

	const auto split = bestSplit(X, y, indices, begin, end, rng);
	if (split.feature < 0 || split.gain <= kMinGain) {
		return node_index;
	}

	const auto feature = static_cast<std::size_t>(split.feature);
	const auto middle = std::partition(indices.begin() + static_cast<std::ptrdiff_t>(begin),
	                                   indices.begin() + static_cast<std::ptrdiff_t>(end),
	                                   [&](std::size_t row) { return X[row][feature] <= split.threshold; });
	const auto mid = static_cast<std::size_t>(middle - indices.begin());
	if (mid == begin || mid == end) {
		return node_index;
	}

	importances_[feature] += split.gain * static_cast<double>(count);

	const int left = build(X, y, indices, begin, mid, depth + 1, rng);
	const int right = build(X, y, indices, mid, end, depth + 1, rng);
	nodes_[node_index].feature = split.feature;
	nodes_[node_index].threshold = split.threshold;
	nodes_[node_index].left = left;
	nodes_[node_index].right = right;
	return node_index;
}

double DecisionTree::predictValue(const features::Row &row) const {
	if (nodes_.empty()) {
		throw std::runtime_error("DecisionTree must be fitted before predicting.");
	}
	if (row.size() != n_features_) {
		throw std::invalid_argument("Prediction row width does not match the training data.");
	}
	int index = 0;
	while (!nodes_[index].isLeaf()) {
		const auto &node = nodes_[index];
		index = row[static_cast<std::size_t>(node.feature)] <= node.threshold ? node.left : node.right;
	}
	return nodes_[index].value;
}

std::vector<double> DecisionTree::predict(const features::Matrix &X) const {
	std::vector<double> predictions;
	predictions.reserve(X.size());
	for (const auto &row : X) {
		const double value = predictValue(row);
		if (config_.task == ModelTask::Classification) {
			predictions.push_back(value > 0.5 ? 1.0 : 0.0);
		} else {
			predictions.push_back(value);
		}
	}
	return predictions;
}

std::vector<double> DecisionTree::featureImportances() const {
	return normaliseImportances(importances_);
}

} // namespace almanac::models
