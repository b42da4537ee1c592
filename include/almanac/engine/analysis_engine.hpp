#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/config.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/models/iforecaster.hpp"
#include "almanac/utils/analysis_cache.hpp"

#include <memory>
#include <string>
#include <vector>

namespace almanac::engine {

/**
 * @class AnalysisEngine
 * @brief Runs every analysis module over one symbol's price history.
 *
 * Preparation, seasonal statistics and feature engineering run first. Pattern
 * detection, anomaly detection, decomposition, structural breaks, regime
 * classification and forecasting then run independently, concurrently when
 * parallel_modules is set, and the insight aggregator assembles their outputs.
 *
 * Any module failure (model training, decomposition, forecast horizons or an
 * unexpected exception inside a module) is logged and recorded as an
 * unavailable section. Insufficient input data and invalid configuration
 * propagate to the caller.
 */
class AnalysisEngine {
public:
	/// @param cache Optional feature-matrix cache shared across runs.
	/// @param forecaster Forecaster used per horizon; SeasonalTrendForecaster when empty.
	explicit AnalysisEngine(core::AnalysisConfig config = {}, std::shared_ptr<utils::AnalysisCache> cache = nullptr,
	                        models::ForecasterFactory forecaster = {});

	/**
	 * @throws core::ConfigurationError when the configuration is invalid.
	 * @throws core::InsufficientDataError when too few usable observations remain.
	 */
	core::AnalysisResult analyze(const std::string &symbol,
	                             const std::vector<core::PriceObservation> &observations) const;

	const core::AnalysisConfig &config() const {
		return config_;
	}

private:
	core::AnalysisConfig config_;
	std::shared_ptr<utils::AnalysisCache> cache_;
	models::ForecasterFactory forecaster_;
};

} // namespace almanac::engine
