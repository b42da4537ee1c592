#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace almanac::seasonality {

struct AdfResult {
    double statistic = std::numeric_limits<double>::quiet_NaN();
    /// MacKinnon (1994) approximate p-value; NaN for a constant series.
    double p_value = std::numeric_limits<double>::quiet_NaN();
    std::size_t lags = 0;
    std::size_t observations = 0;

    bool rejectsUnitRoot(double alpha = 0.05) const { return p_value < alpha; }
};

/**
 * Augmented Dickey-Fuller test with a constant.
 *
 * Regresses dy_t on [1, y_{t-1}, dy_{t-1} .. dy_{t-k}] and reports the t-ratio
 * of the y_{t-1} coefficient. The lag order defaults to floor(cbrt(n - 1)),
 * capped at 12.
 *
 * @throws std::invalid_argument when the series is too short for the lag order.
 */
AdfResult augmentedDickeyFuller(const std::vector<double>& values, int lags = -1);

/// MacKinnon approximate p-value of an ADF t-statistic (constant, one variable).
double mackinnonPValue(double statistic);

struct LjungBoxResult {
    double statistic = std::numeric_limits<double>::quiet_NaN();
    double p_value = std::numeric_limits<double>::quiet_NaN();
    int lags = 0;

    bool isWhiteNoise(double alpha = 0.05) const { return p_value >= alpha; }
};

/**
 * Ljung-Box portmanteau test Q = n(n+2) sum rho_k^2 / (n-k), compared against
 * chi-square with @p lags degrees of freedom. Statistic and p-value are NaN for a
 * constant series.
 *
 * @throws std::invalid_argument when @p lags is not positive or not below the length.
 */
LjungBoxResult ljungBox(const std::vector<double>& values, int lags = 10);

} // namespace almanac::seasonality
