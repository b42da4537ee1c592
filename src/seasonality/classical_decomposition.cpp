#include "almanac/seasonality/classical_decomposition.hpp"
#include "almanac/stats/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double strength(const std::vector<double>& component, const std::vector<double>& remainder) {
    std::vector<double> combined;
    std::vector<double> rest;
    for (std::size_t i = 0; i < component.size(); ++i) {
        if (std::isfinite(component[i]) && std::isfinite(remainder[i])) {
            combined.push_back(component[i] + remainder[i]);
            rest.push_back(remainder[i]);
        }
    }
    if (combined.size() < 2) {
        return 0.0;
    }
    const double var_total = almanac::stats::sampleVariance(combined);
    if (!(var_total > 0.0)) {
        return 0.0;
    }
    return std::max(0.0, 1.0 - almanac::stats::sampleVariance(rest) / var_total);
}

std::vector<double> logOf(const std::vector<double>& values) {
    std::vector<double> out(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = std::isfinite(values[i]) && values[i] > 0.0 ? std::log(values[i]) : kNaN;
    }
    return out;
}

} // namespace

namespace almanac::seasonality {

ClassicalDecomposition::Builder& ClassicalDecomposition::Builder::withPeriod(std::size_t period) {
    period_ = period;
    return *this;
}

ClassicalDecomposition::Builder& ClassicalDecomposition::Builder::withModel(core::DecompositionModel model) {
    model_ = model;
    return *this;
}

ClassicalDecomposition ClassicalDecomposition::Builder::build() const {
    return ClassicalDecomposition(period_, model_);
}

ClassicalDecomposition::Builder ClassicalDecomposition::builder() {
    return Builder();
}

ClassicalDecomposition::ClassicalDecomposition(std::size_t period, core::DecompositionModel model)
    : period_(period), model_(model) {
    if (period_ < 2) {
        throw std::invalid_argument("Decomposition period must be at least 2.");
    }
}

void ClassicalDecomposition::fit(const std::vector<double>& values) {
    const std::size_t n = values.size();
    if (n < 2 * period_) {
        throw std::invalid_argument("Classical decomposition needs at least two full periods.");
    }
    const bool multiplicative = model_ == core::DecompositionModel::Multiplicative;
    if (multiplicative) {
        for (double v : values) {
            if (!(v > 0.0)) {
                throw std::invalid_argument("Multiplicative decomposition requires strictly positive values.");
            }
        }
    }

    // Centred moving average with weights 1/p (odd) or 1/2p at both ends (even).
    trend_.assign(n, kNaN);
    const std::size_t half = period_ / 2;
    const bool even = period_ % 2 == 0;
    std::vector<double> prefix(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + values[i];
    }
    for (std::size_t i = half; i + half < n; ++i) {
        double sum = prefix[i + half + 1] - prefix[i - half];
        if (even) {
            sum -= 0.5 * (values[i - half] + values[i + half]);
        }
        trend_[i] = sum / static_cast<double>(period_);
    }

    std::vector<double> phase_sum(period_, 0.0);
    std::vector<std::size_t> phase_count(period_, 0);
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(trend_[i])) {
            continue;
        }
        const double detrended = multiplicative ? values[i] / trend_[i] : values[i] - trend_[i];
        phase_sum[i % period_] += detrended;
        ++phase_count[i % period_];
    }
    std::vector<double> pattern(period_, multiplicative ? 1.0 : 0.0);
    double centre = 0.0;
    for (std::size_t p = 0; p < period_; ++p) {
        if (phase_count[p] > 0) {
            pattern[p] = phase_sum[p] / static_cast<double>(phase_count[p]);
        }
        centre += pattern[p];
    }
    centre /= static_cast<double>(period_);
    for (auto& value : pattern) {
        value = multiplicative ? value / centre : value - centre;
    }

    seasonal_.resize(n);
    residual_.assign(n, kNaN);
    for (std::size_t i = 0; i < n; ++i) {
        seasonal_[i] = pattern[i % period_];
        if (std::isfinite(trend_[i])) {
            residual_[i] = multiplicative ? values[i] / (trend_[i] * seasonal_[i])
                                          : values[i] - trend_[i] - seasonal_[i];
        }
    }
}

std::vector<double> ClassicalDecomposition::finiteResidual() const {
    std::vector<double> out;
    out.reserve(residual_.size());
    for (double value : residual_) {
        if (std::isfinite(value)) {
            out.push_back(value);
        }
    }
    return out;
}

double ClassicalDecomposition::seasonalStrength() const {
    if (seasonal_.empty()) {
        throw std::runtime_error("Classical decomposition not fitted.");
    }
    if (model_ == core::DecompositionModel::Multiplicative) {
        return strength(logOf(seasonal_), logOf(residual_));
    }
    return strength(seasonal_, residual_);
}

double ClassicalDecomposition::trendStrength() const {
    if (trend_.empty()) {
        throw std::runtime_error("Classical decomposition not fitted.");
    }
    if (model_ == core::DecompositionModel::Multiplicative) {
        return strength(logOf(trend_), logOf(residual_));
    }
    return strength(trend_, residual_);
}

double ClassicalDecomposition::seasonalAmplitude() const {
    if (seasonal_.empty()) {
        throw std::runtime_error("Classical decomposition not fitted.");
    }
    const auto last = seasonal_.begin() + static_cast<std::ptrdiff_t>(period_);
    const auto bounds = std::minmax_element(seasonal_.begin(), last);
    return *bounds.second - *bounds.first;
}

double ClassicalDecomposition::trendSlope() const {
    double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
    std::size_t m = 0;
    for (std::size_t i = 0; i < trend_.size(); ++i) {
        if (!std::isfinite(trend_[i])) {
            continue;
        }
        const double x = static_cast<double>(i);
        sx += x;
        sy += trend_[i];
        sxx += x * x;
        sxy += x * trend_[i];
        ++m;
    }
    if (m < 2) {
        return kNaN;
    }
    const double mm = static_cast<double>(m);
    const double denom = mm * sxx - sx * sx;
    const double level = sy / mm;
    if (denom <= 0.0 || level == 0.0) {
        return kNaN;
    }
    return (mm * sxy - sx * sy) / denom / std::abs(level);
}

} // namespace almanac::seasonality
