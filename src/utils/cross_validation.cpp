#include "almanac/utils/cross_validation.hpp"
#include "almanac/utils/logging.hpp"
#include "almanac/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace almanac::utils {

std::vector<std::tuple<int, int, int, int>> CrossValidation::generateFolds(int n_samples, const CVConfig &config) {
	if (config.horizon <= 0 || config.step <= 0 || config.initial_window <= 0) {
		throw std::invalid_argument("CV horizon, step and initial window must be positive.");
	}
	if (n_samples < config.initial_window + config.horizon) {
		throw std::invalid_argument(
		    "Time series too short for cross-validation. Need at least initial_window + horizon samples.");
	}

	std::vector<std::tuple<int, int, int, int>> folds;

	int pos = config.initial_window;

	while (pos + config.horizon <= n_samples) {
		int train_start, train_end;

		if (config.strategy == CVStrategy::EXPANDING) {
			// Expanding window: train from beginning to current position
			train_start = 0;
			train_end = pos;
		} else {
			// Rolling window: fixed-size window
			int window_size = (config.max_window > 0) ? std::min(config.max_window, pos) : config.initial_window;
			train_start = pos - window_size;
			train_end = pos;
		}

		folds.emplace_back(train_start, train_end, pos, pos + config.horizon);

		pos += config.step;
	}

	if (config.max_folds > 0 && folds.size() > static_cast<std::size_t>(config.max_folds)) {
		folds.erase(folds.begin(), folds.end() - config.max_folds);
	}

	return folds;
}

std::optional<CVConfig> CrossValidation::backToBack(int n_samples, int horizon, int max_folds) {
	if (horizon <= 0 || max_folds <= 0) {
		throw std::invalid_argument("Horizon and fold count must be positive.");
	}
	const int folds = std::min(max_folds, (n_samples - horizon) / horizon);
	if (folds < 1) {
		return std::nullopt;
	}
	CVConfig config;
	config.horizon = horizon;
	config.step = horizon;
	config.initial_window = n_samples - folds * horizon;
	config.strategy = CVStrategy::EXPANDING;
	config.max_folds = folds;
	return config;
}

CVResults CrossValidation::evaluate(const core::TimeSeries &ts, const models::ForecasterFactory &model_factory,
                                    const CVConfig &config) {
	const auto &data = ts.getValues();
	const int n_samples = static_cast<int>(data.size());

	auto fold_indices = generateFolds(n_samples, config);

	if (fold_indices.empty()) {
		throw std::runtime_error("No CV folds generated. Check configuration.");
	}

	CVResults results;
	results.folds.reserve(fold_indices.size());

	int fold_id = 0;
	for (const auto &[train_start, train_end, test_start, test_end] : fold_indices) {
		CVFold fold;
		fold.fold_id = fold_id++;
		fold.train_start = train_start;
		fold.train_end = train_end;
		fold.test_start = test_start;
		fold.test_end = test_end;
		fold.origin = data[static_cast<std::size_t>(train_end - 1)];

		const auto train_ts = ts.slice(static_cast<std::size_t>(train_start), static_cast<std::size_t>(train_end));

		auto model = model_factory();
		try {
			model->fit(train_ts);
			fold.forecasts = model->predict(test_end - test_start).point;
		} catch (const std::exception &e) {
			ALMANAC_WARN("CV fold {} ({}) failed: {}", fold.fold_id, model->getName(), e.what());
			fold.failed = true;
			fold.mae = std::numeric_limits<double>::quiet_NaN();
			results.folds.push_back(std::move(fold));
			continue;
		}

		fold.actuals.assign(data.begin() + test_start, data.begin() + test_end);
		fold.mae = Metrics::mae(fold.actuals, fold.forecasts);
		fold.mape = Metrics::mape(fold.actuals, fold.forecasts);
		fold.directional_accuracy = Metrics::directionalAccuracy(fold.origin, fold.actuals, fold.forecasts);

		results.folds.push_back(std::move(fold));
	}

	results.computeAggregatedMetrics();

	return results;
}

void CVResults::computeAggregatedMetrics() {
	std::vector<double> all_forecasts;
	std::vector<double> all_actuals;
	double directional_sum = 0.0;
	int directional_count = 0;
	successful_folds = 0;

	for (const auto &fold : folds) {
		if (fold.failed) {
			continue;
		}
		++successful_folds;
		all_forecasts.insert(all_forecasts.end(), fold.forecasts.begin(), fold.forecasts.end());
		all_actuals.insert(all_actuals.end(), fold.actuals.begin(), fold.actuals.end());
		if (fold.directional_accuracy) {
			directional_sum += *fold.directional_accuracy;
			++directional_count;
		}
	}

	total_forecasts = static_cast<int>(all_forecasts.size());

	if (total_forecasts == 0) {
		mae = std::numeric_limits<double>::quiet_NaN();
		mape.reset();
		directional_accuracy.reset();
		return;
	}

	mae = Metrics::mae(all_actuals, all_forecasts);
	mape = Metrics::mape(all_actuals, all_forecasts);
	if (directional_count > 0) {
		directional_accuracy = directional_sum / directional_count;
	} else {
		directional_accuracy.reset();
	}
}

} // namespace almanac::utils
