#pragma once

#include "almanac/core/calendar.hpp"
#include "almanac/core/price_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace almanac::features {

using Row = std::vector<double>;
using Matrix = std::vector<Row>;

/**
 * @class FeatureSchema
 * @brief The fixed, versioned list of engineered features.
 *
 * Continuous market features come first, followed by one-hot calendar
 * indicators. Consumers address columns by index; the version changes whenever
 * the list does.
 */
class FeatureSchema {
public:
	static constexpr int kVersion = 1;

	static std::string version() {
		return "v" + std::to_string(kVersion);
	}

	static const std::vector<std::string> &names();

	static std::size_t size() {
		return names().size();
	}

	/// @throws std::out_of_range for an unknown name.
	static std::size_t indexOf(const std::string &name);

	/// Indices of the month, quarter, weekday and month-start indicators.
	static const std::vector<std::size_t> &calendarIndices();

	/// Indices of the price-derived features.
	static const std::vector<std::size_t> &continuousIndices();

	static bool isCalendar(std::size_t index);

	/// Calendar scope of an indicator column, e.g. month_12 -> (Month, 12). Empty for other columns.
	static std::optional<std::pair<core::CalendarPeriod, int>> calendarScope(std::size_t index);
};

/**
 * @struct FeatureVector
 * @brief Features of one session plus the next session's return as training target.
 */
struct FeatureVector {
	core::Date date;
	Row values;
	/// Return of the following session; empty on the last row.
	std::optional<double> forward_return;

	bool labelled() const {
		return forward_return.has_value();
	}

	/// 1 when the next session closed higher, 0 otherwise.
	int direction() const {
		return forward_return && *forward_return > 0.0 ? 1 : 0;
	}
};

/**
 * @class FeatureMatrix
 * @brief Immutable collection of feature rows, one per session after warm-up.
 */
class FeatureMatrix {
public:
	FeatureMatrix() = default;
	FeatureMatrix(std::string symbol, std::vector<FeatureVector> rows);

	const std::string &symbol() const {
		return symbol_;
	}

	std::string schemaVersion() const {
		return FeatureSchema::version();
	}

	const std::vector<std::string> &featureNames() const {
		return FeatureSchema::names();
	}

	const std::vector<FeatureVector> &rows() const {
		return rows_;
	}

	std::size_t size() const {
		return rows_.size();
	}

	bool empty() const {
		return rows_.empty();
	}

	/// Number of leading rows that carry a forward return.
	std::size_t labelledCount() const;

	/// Row-major values of rows [begin, end) restricted to @p columns (all columns when empty).
	Matrix values(std::size_t begin, std::size_t end, const std::vector<std::size_t> &columns = {}) const;

	/// Directions (0/1) of rows [begin, end).
	std::vector<int> directions(std::size_t begin, std::size_t end) const;

	/// Forward returns of rows [begin, end); rows without one are skipped.
	std::vector<double> forwardReturns(std::size_t begin, std::size_t end) const;

	/// Values of a single column over all rows.
	std::vector<double> column(std::size_t index) const;

private:
	std::string symbol_;
	std::vector<FeatureVector> rows_;
};

/**
 * @class FeatureEngineer
 * @brief Derives the schema features from a prepared series.
 *
 * Sessions whose lagged or rolling inputs are not yet defined are excluded
 * rather than zero-filled, so the first row is the first session with a full
 * look-back.
 */
class FeatureEngineer {
public:
	FeatureMatrix build(const core::PreparedSeries &series) const;
};

} // namespace almanac::features
