#include "almanac/models/imodel.hpp"

#include <numeric>
#include <stdexcept>

namespace almanac::models {

void validateTrainingData(const features::Matrix &X, const std::vector<double> &y) {
	if (X.empty()) {
		throw std::invalid_argument("Training matrix must not be empty.");
	}
	if (X.size() != y.size()) {
		throw std::invalid_argument("Training matrix and targets must have the same number of rows.");
	}
	const auto width = X.front().size();
	if (width == 0) {
		throw std::invalid_argument("Training matrix must have at least one column.");
	}
	for (const auto &row : X) {
		if (row.size() != width) {
			throw std::invalid_argument("Training matrix rows must have equal width.");
		}
	}
}

std::vector<double> normaliseImportances(std::vector<double> values) {
	const double total = std::accumulate(values.begin(), values.end(), 0.0);
	if (total <= 0.0) {
		return values;
	}
	for (auto &value : values) {
		value /= total;
	}
	return values;
}

} // namespace almanac::models
