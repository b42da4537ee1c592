#pragma once

#include "almanac/core/analysis_result.hpp"
#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <vector>

namespace almanac::seasonality {

struct DecompositionConfig {
    std::size_t period = 252;
    /// Used when the history holds fewer than two full primary periods.
    std::size_t fallback_period = 21;
    int ljung_box_lags = 10;
    double alpha = 0.05;
    /// Correlation between segment level and segment dispersion above which
    /// fluctuations are treated as proportional to the level.
    double scale_correlation = 0.5;
};

/**
 * Decomposes the closing-price level and runs residual diagnostics.
 *
 * The decomposition is descriptive: it feeds the analysis summary and emits no
 * findings.
 */
class DecompositionAnalyzer {
public:
    explicit DecompositionAnalyzer(DecompositionConfig config = {});

    /// @throws core::DecompositionError when fewer than two fallback periods are available.
    core::DecompositionSummary analyze(const core::PreparedSeries& series) const;

    /// Period used for a series of @p length sessions; 0 when none fits.
    std::size_t selectPeriod(std::size_t length) const;

    /// Multiplicative when the level has a unit root, is positive and its
    /// dispersion scales with it.
    core::DecompositionModel selectModel(const std::vector<double>& level, double level_adf_p_value) const;

    const DecompositionConfig& config() const { return config_; }

private:
    DecompositionConfig config_;
};

} // namespace almanac::seasonality
