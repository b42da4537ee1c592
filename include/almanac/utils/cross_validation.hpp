#pragma once

#include "almanac/core/time_series.hpp"
#include "almanac/models/iforecaster.hpp"

#include <optional>
#include <tuple>
#include <vector>

namespace almanac::utils {

/**
 * @brief Time series cross-validation strategy
 */
enum class CVStrategy {
	ROLLING,  // Fixed-size rolling window
	EXPANDING // Expanding window (cumulative)
};

/**
 * @brief Configuration for time series cross-validation
 */
struct CVConfig {
	int horizon = 1;         // Forecast horizon
	int initial_window = 50; // Initial training window size
	int step = 1;            // Step size between folds
	CVStrategy strategy = CVStrategy::EXPANDING;

	// For rolling window: maximum window size (0 = use initial_window)
	int max_window = 0;

	// Keep only the most recent folds (0 = all)
	int max_folds = 0;
};

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;
	int train_start = 0;
	int train_end = 0; // exclusive
	int test_start = 0;
	int test_end = 0; // exclusive

	std::vector<double> forecasts;
	std::vector<double> actuals;
	double origin = 0.0; // Last training value

	bool failed = false;
	double mae = 0.0;
	std::optional<double> mape;
	std::optional<double> directional_accuracy;
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;

	// Aggregated over the forecasts of all successful folds
	double mae = 0.0;
	std::optional<double> mape;
	// Mean of the defined per-fold directional accuracies
	std::optional<double> directional_accuracy;

	int total_forecasts = 0;
	int successful_folds = 0;

	void computeAggregatedMetrics();
};

/**
 * @brief Time series cross-validation utility
 */
class CrossValidation {
public:
	/**
	 * @brief Perform cross-validation on a time series
	 *
	 * A fold whose model fails to fit or predict is logged and marked failed;
	 * aggregated metrics use the remaining folds.
	 *
	 * @param ts Time series to validate
	 * @param model_factory Function that creates a new model instance for each fold
	 * @param config CV configuration
	 * @return CVResults with fold-wise and aggregated metrics
	 */
	static CVResults evaluate(const core::TimeSeries &ts, const models::ForecasterFactory &model_factory,
	                          const CVConfig &config = CVConfig{});

	/**
	 * @brief Generate CV fold indices
	 *
	 * @param n_samples Total number of samples
	 * @param config CV configuration
	 * @return Vector of (train_start, train_end, test_start, test_end) tuples
	 */
	static std::vector<std::tuple<int, int, int, int>> generateFolds(int n_samples, const CVConfig &config);

	/**
	 * @brief Expanding-window configuration with at most @p max_folds back-to-back
	 *        test windows of @p horizon ending at the last sample.
	 * @return nullopt when not even one fold fits with a training window of at least one horizon.
	 */
	static std::optional<CVConfig> backToBack(int n_samples, int horizon, int max_folds);
};

} // namespace almanac::utils
