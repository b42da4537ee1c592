#pragma once

#include "almanac/core/calendar.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace almanac::core {

enum class RegimeDimension {
	Volatility,
	Trend
};

enum class Regime {
	LowVol,
	HighVol,
	Bull,
	Bear,
	Neutral
};

std::string toString(RegimeDimension dimension);
std::string toString(Regime regime);

/**
 * @struct RegimeSegment
 * @brief A maximal run of sessions sharing one regime along one dimension.
 */
struct RegimeSegment {
	RegimeDimension dimension = RegimeDimension::Volatility;
	Regime regime = Regime::LowVol;
	Date start;
	Date end;
	std::size_t length = 0;
};

enum class BreakType {
	MeanShift,
	VolatilityShift
};

std::string toString(BreakType type);

/**
 * @struct StructuralBreak
 * @brief A detected shift in the level or the dispersion of daily returns.
 */
struct StructuralBreak {
	Date date;
	BreakType type = BreakType::MeanShift;
	/// Mean difference (after - before) or volatility ratio (after / before).
	double magnitude = 0.0;
	/// The z-statistic that crossed the sensitivity threshold.
	double test_statistic = 0.0;
};

} // namespace almanac::core
