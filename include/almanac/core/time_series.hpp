#pragma once

#include "almanac/core/calendar.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace almanac::core {

/**
 * @class TimeSeries
 * @brief A univariate sequence of values keyed by civil dates.
 *
 * Dates and values are stored in separate vectors for cache-efficient
 * numerical processing. The number of dates always matches the number of
 * values and dates are strictly increasing.
 */
class TimeSeries {
public:
	using Value = double;

	TimeSeries() = default;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param dates A vector of strictly increasing dates.
	 * @param values A vector of corresponding values.
	 * @param label Optional name of the series.
	 * @throws std::invalid_argument If the sizes differ or dates are not increasing.
	 */
	TimeSeries(std::vector<Date> dates, std::vector<Value> values, std::string label = {})
	    : dates_(std::move(dates)), values_(std::move(values)), label_(std::move(label)) {
		if (dates_.size() != values_.size()) {
			throw std::invalid_argument("Dates and values vectors must have the same size.");
		}
		for (std::size_t i = 1; i < dates_.size(); ++i) {
			if (!(dates_[i - 1] < dates_[i])) {
				throw std::invalid_argument("TimeSeries dates must be strictly increasing.");
			}
		}
	}

	const std::vector<Date> &getDates() const {
		return dates_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	std::size_t size() const {
		return dates_.size();
	}

	bool empty() const {
		return dates_.empty();
	}

	const Date &front() const {
		if (empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return dates_.front();
	}

	const Date &back() const {
		if (empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return dates_.back();
	}

	/// Returns the half-open range [start, end) as a new series.
	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start must not exceed end.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end exceeds the time series length.");
		}
		std::vector<Date> sliced_dates(dates_.begin() + static_cast<std::ptrdiff_t>(start),
		                               dates_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));
		return TimeSeries(std::move(sliced_dates), std::move(sliced_values), label_);
	}

	/// Median spacing in days between consecutive dates, 0 for fewer than two points.
	double medianSpacingDays() const {
		if (dates_.size() < 2) {
			return 0.0;
		}
		std::vector<std::int64_t> gaps;
		gaps.reserve(dates_.size() - 1);
		for (std::size_t i = 1; i < dates_.size(); ++i) {
			gaps.push_back(dates_[i].toSerial() - dates_[i - 1].toSerial());
		}
		const auto mid = gaps.begin() + static_cast<std::ptrdiff_t>(gaps.size() / 2);
		std::nth_element(gaps.begin(), mid, gaps.end());
		if (gaps.size() % 2 == 1) {
			return static_cast<double>(*mid);
		}
		const auto upper = *mid;
		const auto lower = *std::max_element(gaps.begin(), mid);
		return 0.5 * static_cast<double>(lower + upper);
	}

private:
	std::vector<Date> dates_;
	std::vector<Value> values_;
	std::string label_;
};

} // namespace almanac::core
