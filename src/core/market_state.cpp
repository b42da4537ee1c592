#include "almanac/core/market_state.hpp"

namespace almanac::core {

std::string toString(RegimeDimension dimension) {
	switch (dimension) {
	case RegimeDimension::Volatility:
		return "volatility";
	case RegimeDimension::Trend:
		return "trend";
	}
	return "unknown";
}

std::string toString(Regime regime) {
	switch (regime) {
	case Regime::LowVol:
		return "lowVol";
	case Regime::HighVol:
		return "highVol";
	case Regime::Bull:
		return "bull";
	case Regime::Bear:
		return "bear";
	case Regime::Neutral:
		return "neutral";
	}
	return "unknown";
}

std::string toString(BreakType type) {
	switch (type) {
	case BreakType::MeanShift:
		return "meanShift";
	case BreakType::VolatilityShift:
		return "volatilityShift";
	}
	return "unknown";
}

} // namespace almanac::core
