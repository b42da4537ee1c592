#pragma once

#include "almanac/core/calendar.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace almanac::core {

enum class FindingCategory {
	Seasonal,
	Regime,
	Risk,
	Strategy,
	Anomaly
};

std::string toString(FindingCategory category);
FindingCategory parseFindingCategory(const std::string &text);

/**
 * @struct FindingScope
 * @brief Where a finding applies: whole series, a set of calendar periods or a dated range.
 */
struct FindingScope {
	enum class Kind {
		Global,
		Calendar,
		Dated
	};

	Kind kind = Kind::Global;

	CalendarPeriod period_kind = CalendarPeriod::Month;
	/// Sorted calendar period values, e.g. {12} for December.
	std::vector<int> periods;

	std::optional<DateRange> range;

	static FindingScope global() {
		return FindingScope{};
	}

	static FindingScope calendar(CalendarPeriod kind, std::vector<int> values);

	static FindingScope dated(const DateRange &range) {
		FindingScope scope;
		scope.kind = Kind::Dated;
		scope.range = range;
		return scope;
	}

	/// True when both scopes refer to at least one common period or date.
	bool overlaps(const FindingScope &other) const;

	std::string toString() const;

	/// Parses the representation produced by toString().
	/// @throws std::invalid_argument on malformed input.
	static FindingScope parse(const std::string &text);

	bool operator==(const FindingScope &other) const;
};

/**
 * @struct PatternFinding
 * @brief A scored, human-readable statement about the series.
 */
struct PatternFinding {
	using Metric = std::pair<std::string, double>;

	std::string label;
	std::string description;
	/// Blended confidence in [0, 1].
	double confidence = 0.0;
	/// Ordered supporting evidence (name, value).
	std::vector<Metric> metrics;
	FindingCategory category = FindingCategory::Seasonal;
	/// Name of the module that produced the finding.
	std::string source;
	FindingScope scope;
	/// Number of other findings merged into this one during aggregation.
	int corroborations = 0;

	std::optional<double> metric(const std::string &name) const {
		for (const auto &entry : metrics) {
			if (entry.first == name) {
				return entry.second;
			}
		}
		return std::nullopt;
	}
};

using Findings = std::vector<PatternFinding>;

} // namespace almanac::core
