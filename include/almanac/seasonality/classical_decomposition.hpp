#pragma once

#include "almanac/core/analysis_result.hpp"

#include <cstddef>
#include <vector>

namespace almanac::seasonality {

/**
 * Classical moving-average decomposition.
 *
 * The trend is a centred moving average of one full period (a 2 x period
 * average for even periods), so it is undefined (NaN) for the first and last
 * half period. The seasonal component is the phase average of the detrended
 * series, normalised to sum to zero (additive) or average one
 * (multiplicative), and repeated over the whole series.
 */
class ClassicalDecomposition {
public:
    class Builder {
    public:
        Builder& withPeriod(std::size_t period);
        Builder& withModel(core::DecompositionModel model);
        ClassicalDecomposition build() const;

    private:
        std::size_t period_ = 252;
        core::DecompositionModel model_ = core::DecompositionModel::Additive;
    };

    static Builder builder();

    explicit ClassicalDecomposition(std::size_t period,
                                    core::DecompositionModel model = core::DecompositionModel::Additive);

    /// @throws std::invalid_argument with fewer than two full periods, or non-positive
    ///         values under the multiplicative model.
    void fit(const std::vector<double>& values);

    const std::vector<double>& trend() const { return trend_; }
    const std::vector<double>& seasonal() const { return seasonal_; }
    const std::vector<double>& residual() const { return residual_; }

    /// Residual values where the trend is defined.
    std::vector<double> finiteResidual() const;

    /// 1 - Var(R) / Var(S + R), computed in log space for the multiplicative model.
    double seasonalStrength() const;
    double trendStrength() const;

    /// Range of the seasonal component over one cycle.
    double seasonalAmplitude() const;

    /// Least-squares slope of the defined trend per step, divided by its mean level.
    double trendSlope() const;

    std::size_t period() const { return period_; }
    core::DecompositionModel model() const { return model_; }

private:
    std::size_t period_;
    core::DecompositionModel model_;

    std::vector<double> trend_;
    std::vector<double> seasonal_;
    std::vector<double> residual_;
};

} // namespace almanac::seasonality
