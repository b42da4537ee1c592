#include "almanac/changepoint/structural_breaks.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace almanac::changepoint {

namespace {

constexpr double kMinVariance = 1e-18;

struct Candidate {
    std::size_t index;
    double z;
    double magnitude;
};

struct WindowMoments {
    double mean;
    double variance;
};

WindowMoments moments(const std::vector<double> &prefix, const std::vector<double> &prefix_sq, std::size_t begin,
                      std::size_t end) {
    const double n = static_cast<double>(end - begin);
    const double sum = prefix[end] - prefix[begin];
    const double sum_sq = prefix_sq[end] - prefix_sq[begin];
    const double mean = sum / n;
    const double variance = std::max(0.0, (sum_sq - n * mean * mean) / (n - 1.0));
    return {mean, variance};
}

std::vector<Candidate> collapse(const std::vector<Candidate> &candidates, std::size_t cooldown) {
    std::vector<Candidate> kept;
    for (const auto &candidate : candidates) {
        if (!kept.empty() && candidate.index - kept.back().index < cooldown) {
            if (std::abs(candidate.z) > std::abs(kept.back().z)) {
                kept.back() = candidate;
            }
            continue;
        }
        kept.push_back(candidate);
    }
    return kept;
}

} // namespace

StructuralBreakDetector StructuralBreakDetector::Builder::build() const {
    return StructuralBreakDetector(window_, sensitivity_, min_window_);
}

StructuralBreakDetector::Builder StructuralBreakDetector::builder() {
    return Builder();
}

StructuralBreakDetector::StructuralBreakDetector(std::size_t window, double sensitivity, std::size_t min_window)
    : window_(window), sensitivity_(sensitivity), min_window_(min_window) {
    if (!(sensitivity_ > 0.0)) {
        throw std::invalid_argument("Structural break sensitivity must be positive.");
    }
    if (min_window_ < 3) {
        throw std::invalid_argument("Structural break windows need at least three sessions.");
    }
}

std::size_t StructuralBreakDetector::effectiveWindow(std::size_t length) const {
    const std::size_t window = std::min(window_, length / 4);
    return window >= min_window_ ? window : 0;
}

std::vector<core::StructuralBreak> StructuralBreakDetector::detect(const core::ReturnSeries &returns) const {
    const std::size_t n = returns.size();
    const std::size_t w = effectiveWindow(n);
    if (w == 0) {
        ALMANAC_DEBUG("Structural breaks: {} returns are too few for a {}-session window", n, min_window_);
        return {};
    }

    std::vector<double> prefix(n + 1, 0.0);
    std::vector<double> prefix_sq(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        const double r = returns[i].daily_return;
        prefix[i + 1] = prefix[i] + r;
        prefix_sq[i + 1] = prefix_sq[i] + r * r;
    }

    const double wd = static_cast<double>(w);
    const double log_ratio_se = std::sqrt(4.0 / (wd - 1.0));

    std::vector<Candidate> mean_candidates;
    std::vector<Candidate> vol_candidates;
    for (std::size_t t = w; t + w <= n; ++t) {
        const auto before = moments(prefix, prefix_sq, t - w, t);
        const auto after = moments(prefix, prefix_sq, t, t + w);

        const double se = std::sqrt(before.variance / wd + after.variance / wd);
        if (se > std::sqrt(kMinVariance)) {
            const double z = (after.mean - before.mean) / se;
            if (std::abs(z) > sensitivity_) {
                mean_candidates.push_back({t, z, after.mean - before.mean});
            }
        }

        if (before.variance > kMinVariance && after.variance > kMinVariance) {
            const double z = std::log(after.variance / before.variance) / log_ratio_se;
            if (std::abs(z) > sensitivity_) {
                vol_candidates.push_back({t, z, std::sqrt(after.variance / before.variance)});
            }
        }
    }

    std::vector<core::StructuralBreak> breaks;
    for (const auto &c : collapse(mean_candidates, w)) {
        breaks.push_back({returns[c.index].date, core::BreakType::MeanShift, c.magnitude, c.z});
    }
    for (const auto &c : collapse(vol_candidates, w)) {
        breaks.push_back({returns[c.index].date, core::BreakType::VolatilityShift, c.magnitude, c.z});
    }
    std::stable_sort(breaks.begin(), breaks.end(),
                     [](const core::StructuralBreak &a, const core::StructuralBreak &b) { return a.date < b.date; });

    ALMANAC_DEBUG("Structural breaks: {} mean shifts, {} volatility shifts (window {})",
                  std::count_if(breaks.begin(), breaks.end(),
                                [](const core::StructuralBreak &b) { return b.type == core::BreakType::MeanShift; }),
                  std::count_if(breaks.begin(), breaks.end(),
                                [](const core::StructuralBreak &b) {
                                    return b.type == core::BreakType::VolatilityShift;
                                }),
                  w);
    return breaks;
}

} // namespace almanac::changepoint
