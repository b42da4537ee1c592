#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace almanac::utils {

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	/// Percentage error averaged over non-zero actuals; nullopt when every actual is zero.
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * Share of steps whose forecast move from @p origin has the same sign as the
	 * realised move. Steps where the realised move is exactly zero are skipped;
	 * nullopt when none remain.
	 */
	static std::optional<double> directionalAccuracy(double origin, const std::vector<double> &actual,
	                                                 const std::vector<double> &predicted);

	// Prediction interval coverage
	static double coverage(const std::vector<double> &actual, const std::vector<double> &lower,
	                       const std::vector<double> &upper);
};

} // namespace almanac::utils
