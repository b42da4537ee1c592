#include "almanac/seasonality/stationarity.hpp"
#include "almanac/stats/distributions.hpp"
#include "almanac/utils/least_squares.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kTauMax = 2.74;
constexpr double kTauMin = -18.83;
constexpr double kTauStar = -1.61;
constexpr double kSmallP[] = {2.1659, 1.4412, 0.038269};
constexpr double kLargeP[] = {1.7339, 0.93202, -0.12745, -0.010368};

constexpr double kMinVariance = 1e-20;

template <std::size_t N>
double polynomial(const double (&coefficients)[N], double x) {
    double result = 0.0;
    for (std::size_t i = N; i-- > 0;) {
        result = result * x + coefficients[i];
    }
    return result;
}

} // namespace

namespace almanac::seasonality {

double mackinnonPValue(double statistic) {
    if (std::isnan(statistic)) {
        return statistic;
    }
    if (statistic > kTauMax) {
        return 1.0;
    }
    if (statistic < kTauMin) {
        return 0.0;
    }
    if (statistic <= kTauStar) {
        return stats::normalCdf(polynomial(kSmallP, statistic));
    }
    return stats::normalCdf(polynomial(kLargeP, statistic));
}

AdfResult augmentedDickeyFuller(const std::vector<double>& values, int lags) {
    const std::size_t n = values.size();
    if (lags < 0) {
        lags = std::min(12, static_cast<int>(std::floor(std::cbrt(static_cast<double>(n > 0 ? n - 1 : 0)))));
    }
    const auto k = static_cast<std::size_t>(lags);
    const std::size_t columns = 2 + k;
    if (n < k + 2 || n - k - 1 <= columns) {
        throw std::invalid_argument("Series too short for the augmented Dickey-Fuller regression.");
    }

    std::vector<double> diff(n - 1);
    for (std::size_t i = 1; i < n; ++i) {
        diff[i - 1] = values[i] - values[i - 1];
    }

    // Rows t = k .. n-2 of the differenced series.
    const std::size_t rows = diff.size() - k;
    Eigen::MatrixXd X(rows, columns);
    Eigen::VectorXd y(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        const std::size_t t = r + k;
        y(r) = diff[t];
        X(r, 0) = 1.0;
        X(r, 1) = values[t];
        for (std::size_t j = 1; j <= k; ++j) {
            X(r, 1 + j) = diff[t - j];
        }
    }

    AdfResult result;
    result.lags = k;
    result.observations = rows;

    const Eigen::VectorXd centred = X.col(1).array() - X.col(1).mean();
    if (centred.squaredNorm() / static_cast<double>(rows) < kMinVariance) {
        return result;
    }

    const Eigen::VectorXd beta = utils::LeastSquares::ols(X, y);
    const Eigen::VectorXd residual = y - X * beta;
    const double dof = static_cast<double>(rows - columns);
    const double sigma2 = residual.squaredNorm() / dof;
    if (sigma2 < kMinVariance) {
        return result;
    }
    const Eigen::VectorXd se = utils::LeastSquares::olsStandardErrors(X, sigma2);
    if (!(se(1) > 0.0)) {
        return result;
    }
    result.statistic = beta(1) / se(1);
    result.p_value = mackinnonPValue(result.statistic);
    return result;
}

LjungBoxResult ljungBox(const std::vector<double>& values, int lags) {
    const std::size_t n = values.size();
    if (lags <= 0 || static_cast<std::size_t>(lags) >= n) {
        throw std::invalid_argument("Ljung-Box lag count must be positive and below the series length.");
    }

    LjungBoxResult result;
    result.lags = lags;

    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(n);
    double denom = 0.0;
    for (double v : values) {
        denom += (v - mean) * (v - mean);
    }
    if (denom / static_cast<double>(n) < kMinVariance) {
        return result;
    }

    double q = 0.0;
    for (int k = 1; k <= lags; ++k) {
        double num = 0.0;
        for (std::size_t t = static_cast<std::size_t>(k); t < n; ++t) {
            num += (values[t] - mean) * (values[t - static_cast<std::size_t>(k)] - mean);
        }
        const double rho = num / denom;
        q += rho * rho / static_cast<double>(n - static_cast<std::size_t>(k));
    }
    const double nn = static_cast<double>(n);
    result.statistic = nn * (nn + 2.0) * q;
    result.p_value = stats::chiSquareSurvival(result.statistic, static_cast<double>(lags));
    return result;
}

} // namespace almanac::seasonality
