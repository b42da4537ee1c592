#pragma once

#include "almanac/core/market_state.hpp"
#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <vector>

namespace almanac::changepoint {

class StructuralBreakDetector {
public:
    class Builder {
    public:
        Builder &window(std::size_t value) {
            window_ = value;
            return *this;
        }

        /// z-threshold both tests must exceed.
        Builder &sensitivity(double value) {
            sensitivity_ = value;
            return *this;
        }

        Builder &minWindow(std::size_t value) {
            min_window_ = value;
            return *this;
        }

        StructuralBreakDetector build() const;

    private:
        std::size_t window_ = 63;
        double sensitivity_ = 2.0;
        std::size_t min_window_ = 20;
    };

    static Builder builder();

    /**
     * Compares adjacent windows of daily returns at every split point.
     *
     * The effective window is min(window, n / 4); below the minimum window no
     * breaks are reported. A split is a mean-shift candidate when the Welch z of
     * the two window means exceeds the sensitivity, and a volatility-shift
     * candidate when the z of the log variance ratio does. Candidates of one type
     * closer than one window to each other collapse into the strongest.
     */
    std::vector<core::StructuralBreak> detect(const core::ReturnSeries &returns) const;

    std::size_t effectiveWindow(std::size_t length) const;

private:
    StructuralBreakDetector(std::size_t window, double sensitivity, std::size_t min_window);

    std::size_t window_;
    double sensitivity_;
    std::size_t min_window_;
};

} // namespace almanac::changepoint
