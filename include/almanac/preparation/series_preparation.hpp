#pragma once

#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace almanac::preparation {

struct PreparationConfig {
	/// Fewer usable observations than this abort the analysis.
	std::size_t min_observations = 50;
	/// Fewer usable observations than this flag the series as reduced-history.
	std::size_t recommended_observations = 500;
	/// Longest run of missing sessions that is forward-filled instead of dropped.
	std::size_t max_fill_gap = 3;
	/// Window of the rolling volatility annotation.
	std::size_t volatility_window = 20;
	/// Median spacing (days) up to which a series counts as daily.
	double max_daily_spacing_days = 5.0;
};

/**
 * @class SeriesPreparer
 * @brief Validates raw daily observations and derives the annotated return series.
 *
 * A row is missing when its close is NaN or not positive. Short runs of
 * missing rows that follow a valid row are forward-filled from it; longer runs
 * and leading missing rows are dropped. Other NaN fields of a valid row fall
 * back to the close (prices) or zero (volume).
 */
class SeriesPreparer {
public:
	explicit SeriesPreparer(PreparationConfig config = {});

	/**
	 * @brief Cleans @p observations and computes returns with calendar annotations.
	 * @throws std::invalid_argument when dates are not strictly increasing or a value is negative.
	 * @throws core::InsufficientDataError when fewer than min_observations rows remain usable.
	 */
	core::PreparedSeries prepare(const std::string &symbol,
	                             const std::vector<core::PriceObservation> &observations) const;

	const PreparationConfig &config() const {
		return config_;
	}

	/// Simple returns, compounded cumulative returns and rolling volatility of @p observations.
	static core::ReturnSeries computeReturns(const std::vector<core::PriceObservation> &observations,
	                                         std::size_t volatility_window);

private:
	void validate(const std::vector<core::PriceObservation> &observations) const;

	PreparationConfig config_;
};

} // namespace almanac::preparation
