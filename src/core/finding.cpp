#include "almanac/core/finding.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace almanac::core {

std::string toString(FindingCategory category) {
	switch (category) {
	case FindingCategory::Seasonal:
		return "seasonal";
	case FindingCategory::Regime:
		return "regime";
	case FindingCategory::Risk:
		return "risk";
	case FindingCategory::Strategy:
		return "strategy";
	case FindingCategory::Anomaly:
		return "anomaly";
	}
	return "unknown";
}

FindingCategory parseFindingCategory(const std::string &text) {
	if (text == "seasonal") {
		return FindingCategory::Seasonal;
	}
	if (text == "regime") {
		return FindingCategory::Regime;
	}
	if (text == "risk") {
		return FindingCategory::Risk;
	}
	if (text == "strategy") {
		return FindingCategory::Strategy;
	}
	if (text == "anomaly") {
		return FindingCategory::Anomaly;
	}
	throw std::invalid_argument("Unknown finding category '" + text + "'.");
}

FindingScope FindingScope::calendar(CalendarPeriod kind, std::vector<int> values) {
	FindingScope scope;
	scope.kind = Kind::Calendar;
	scope.period_kind = kind;
	std::sort(values.begin(), values.end());
	values.erase(std::unique(values.begin(), values.end()), values.end());
	scope.periods = std::move(values);
	return scope;
}

bool FindingScope::overlaps(const FindingScope &other) const {
	if (kind != other.kind) {
		return false;
	}
	switch (kind) {
	case Kind::Global:
		return true;
	case Kind::Calendar: {
		if (period_kind != other.period_kind) {
			return false;
		}
		for (int value : periods) {
			if (std::binary_search(other.periods.begin(), other.periods.end(), value)) {
				return true;
			}
		}
		return false;
	}
	case Kind::Dated:
		return range.has_value() && other.range.has_value() && range->overlaps(*other.range);
	}
	return false;
}

std::string FindingScope::toString() const {
	switch (kind) {
	case Kind::Global:
		return "global";
	case Kind::Calendar: {
		std::ostringstream out;
		out << core::toString(period_kind) << ':';
		for (std::size_t i = 0; i < periods.size(); ++i) {
			if (i > 0) {
				out << ';';
			}
			out << periods[i];
		}
		return out.str();
	}
	case Kind::Dated:
		if (!range) {
			return "dated:";
		}
		return "dated:" + range->start.toString() + "/" + range->end.toString();
	}
	return "global";
}

FindingScope FindingScope::parse(const std::string &text) {
	if (text == "global") {
		return global();
	}
	const auto colon = text.find(':');
	if (colon == std::string::npos) {
		throw std::invalid_argument("Malformed finding scope '" + text + "'.");
	}
	const std::string head = text.substr(0, colon);
	const std::string body = text.substr(colon + 1);

	if (head == "dated") {
		const auto slash = body.find('/');
		if (slash == std::string::npos) {
			throw std::invalid_argument("Malformed dated scope '" + text + "'.");
		}
		return dated(DateRange{Date::parse(body.substr(0, slash)), Date::parse(body.substr(slash + 1))});
	}

	CalendarPeriod period_kind;
	if (head == "month") {
		period_kind = CalendarPeriod::Month;
	} else if (head == "quarter") {
		period_kind = CalendarPeriod::Quarter;
	} else if (head == "weekday") {
		period_kind = CalendarPeriod::Weekday;
	} else {
		throw std::invalid_argument("Unknown scope kind '" + head + "'.");
	}

	std::vector<int> values;
	std::stringstream stream(body);
	std::string token;
	while (std::getline(stream, token, ';')) {
		if (!token.empty()) {
			values.push_back(std::stoi(token));
		}
	}
	return calendar(period_kind, std::move(values));
}

bool FindingScope::operator==(const FindingScope &other) const {
	if (kind != other.kind) {
		return false;
	}
	switch (kind) {
	case Kind::Global:
		return true;
	case Kind::Calendar:
		return period_kind == other.period_kind && periods == other.periods;
	case Kind::Dated:
		return range.has_value() == other.range.has_value() && (!range || *range == *other.range);
	}
	return false;
}

} // namespace almanac::core
