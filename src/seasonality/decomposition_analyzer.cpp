#include "almanac/seasonality/decomposition_analyzer.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/seasonality/classical_decomposition.hpp"
#include "almanac/seasonality/stationarity.hpp"
#include "almanac/stats/descriptive.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace almanac::seasonality {

DecompositionAnalyzer::DecompositionAnalyzer(DecompositionConfig config) : config_(config) {
    if (config_.fallback_period < 2 || config_.period < config_.fallback_period) {
        throw std::invalid_argument("Decomposition periods must satisfy 2 <= fallback <= period.");
    }
}

std::size_t DecompositionAnalyzer::selectPeriod(std::size_t length) const {
    if (length >= 2 * config_.period) {
        return config_.period;
    }
    if (length >= 2 * config_.fallback_period) {
        return config_.fallback_period;
    }
    return 0;
}

core::DecompositionModel DecompositionAnalyzer::selectModel(const std::vector<double>& level,
                                                            double level_adf_p_value) const {
    const bool unit_root = !(level_adf_p_value < config_.alpha);
    const bool positive = std::all_of(level.begin(), level.end(), [](double v) { return v > 0.0; });
    if (!unit_root || !positive) {
        return core::DecompositionModel::Additive;
    }

    // Segment level against segment dispersion of session-to-session moves.
    std::vector<double> levels;
    std::vector<double> dispersions;
    const std::size_t width = config_.fallback_period;
    for (std::size_t start = 0; start + width <= level.size(); start += width) {
        double sum = 0.0;
        std::vector<double> moves;
        for (std::size_t i = start; i < start + width; ++i) {
            sum += level[i];
            if (i > start) {
                moves.push_back(std::abs(level[i] - level[i - 1]));
            }
        }
        levels.push_back(sum / static_cast<double>(width));
        dispersions.push_back(stats::mean(moves));
    }
    if (levels.size() < 3) {
        return core::DecompositionModel::Additive;
    }
    const double rho = stats::correlation(levels, dispersions);
    return rho > config_.scale_correlation ? core::DecompositionModel::Multiplicative
                                           : core::DecompositionModel::Additive;
}

core::DecompositionSummary DecompositionAnalyzer::analyze(const core::PreparedSeries& series) const {
    const auto level = series.closes();
    const std::size_t period = selectPeriod(level.size());
    if (period == 0) {
        throw core::DecompositionError("Decomposition needs at least " + std::to_string(2 * config_.fallback_period) +
                                       " observations, got " + std::to_string(level.size()) + ".");
    }
    if (period != config_.period) {
        ALMANAC_DEBUG("Decomposition: history too short for period {}, using {}", config_.period, period);
    }

    core::DecompositionSummary summary;
    summary.period = period;
    summary.ljung_box_lags = config_.ljung_box_lags;

    const auto level_adf = augmentedDickeyFuller(level);
    summary.level_adf_statistic = level_adf.statistic;
    summary.level_adf_p_value = level_adf.p_value;
    summary.model = selectModel(level, level_adf.p_value);

    auto decomposition = ClassicalDecomposition::builder().withPeriod(period).withModel(summary.model).build();
    decomposition.fit(level);

    summary.seasonal_strength = decomposition.seasonalStrength();
    summary.trend_strength = decomposition.trendStrength();
    summary.trend_slope = decomposition.trendSlope();
    summary.seasonal_amplitude = decomposition.seasonalAmplitude();

    const auto residual = decomposition.finiteResidual();
    try {
        const auto residual_adf = augmentedDickeyFuller(residual);
        summary.residual_adf_statistic = residual_adf.statistic;
        summary.residual_adf_p_value = residual_adf.p_value;
        summary.residual_stationary = residual_adf.rejectsUnitRoot(config_.alpha);

        const auto lb = ljungBox(residual, config_.ljung_box_lags);
        summary.ljung_box_statistic = lb.statistic;
        summary.ljung_box_p_value = lb.p_value;
        summary.residual_white_noise = lb.isWhiteNoise(config_.alpha);
    } catch (const std::invalid_argument& e) {
        throw core::DecompositionError(std::string("Residual diagnostics failed: ") + e.what());
    }

    ALMANAC_INFO("Decomposition: period {}, {} model, seasonal strength {:.3f}, residual {}", period,
                 core::toString(summary.model), summary.seasonal_strength,
                 summary.residual_stationary ? "stationary" : "non-stationary");
    return summary;
}

} // namespace almanac::seasonality
