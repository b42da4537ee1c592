#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/finding.hpp"
#include "almanac/core/market_state.hpp"
#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <vector>

namespace almanac::regime {

struct RegimeConfig {
	std::size_t window = 20;
	/// Rolling volatility above this percentile of its history is highVol.
	double high_vol_percentile = 0.70;
	/// Rolling mean daily return beyond +/- this value is bull/bear.
	double trend_threshold = 0.001;
	/// Sessions a new state must persist before the regime switches.
	std::size_t min_run = 10;
};

struct RegimeClassification {
	core::RegimeSummary summary;
	core::Findings findings;
};

/**
 * @class RegimeClassifier
 * @brief Labels every session with a volatility and a trend regime.
 *
 * Raw states come from rolling statistics over the configured window. A switch
 * is accepted only once the new raw state has held for min_run consecutive
 * sessions; the new regime then starts at the first session of that run, so
 * short-lived excursions never produce a segment.
 */
class RegimeClassifier {
public:
	explicit RegimeClassifier(RegimeConfig config = {});

	/// Segments plus regime findings for the regime in force on the latest date.
	RegimeClassification classify(const core::ReturnSeries &returns) const;

	/// Applies the persistence rule to a sequence of raw states.
	static std::vector<core::Regime> smooth(const std::vector<core::Regime> &raw, std::size_t min_run);

	const RegimeConfig &config() const {
		return config_;
	}

private:
	RegimeConfig config_;
};

} // namespace almanac::regime
