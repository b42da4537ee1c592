#pragma once

#include <cstdint>
#include <string>

namespace almanac::core {

/**
 * @brief Calendar grouping used by the seasonal statistics and finding scopes.
 */
enum class CalendarPeriod {
	Month,   ///< 1..12
	Quarter, ///< 1..4
	Weekday  ///< 0 = Monday .. 6 = Sunday
};

std::string toString(CalendarPeriod period);

/**
 * @struct Date
 * @brief A proleptic Gregorian civil date.
 *
 * Daily market data carries no time of day, so observations are keyed by a
 * plain civil date. Conversions to and from a serial day count (days since
 * 1970-01-01) make gap arithmetic and weekday computation exact.
 */
struct Date {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;

	Date() = default;
	Date(int y, unsigned m, unsigned d);

	/// Builds a date from a serial day count relative to 1970-01-01.
	static Date fromSerial(std::int64_t days);

	/// Parses an ISO `YYYY-MM-DD` string.
	/// @throws std::invalid_argument on malformed input.
	static Date parse(const std::string &text);

	std::int64_t toSerial() const;

	/// 0 = Monday .. 6 = Sunday.
	unsigned weekday() const;

	unsigned quarter() const {
		return (month - 1) / 3 + 1;
	}

	bool isWeekend() const {
		return weekday() >= 5;
	}

	/// Returns the next Monday-to-Friday session after this date.
	Date nextWeekday() const;

	Date addDays(std::int64_t days) const {
		return fromSerial(toSerial() + days);
	}

	std::string toString() const;

	bool operator==(const Date &other) const {
		return year == other.year && month == other.month && day == other.day;
	}
	bool operator!=(const Date &other) const {
		return !(*this == other);
	}
	bool operator<(const Date &other) const {
		return toSerial() < other.toSerial();
	}
	bool operator<=(const Date &other) const {
		return toSerial() <= other.toSerial();
	}
	bool operator>(const Date &other) const {
		return other < *this;
	}
	bool operator>=(const Date &other) const {
		return other <= *this;
	}
};

/// Number of days in the given month of the given year.
unsigned daysInMonth(int year, unsigned month);

/// English month name for 1..12.
const char *monthName(unsigned month);

/// English weekday name for 0 (Monday) .. 6 (Sunday).
const char *weekdayName(unsigned weekday);

/// Human-readable label of a calendar period value ("December", "Q4", "Friday").
std::string periodLabel(CalendarPeriod kind, int period);

/**
 * @struct DateRange
 * @brief Closed interval of civil dates.
 */
struct DateRange {
	Date start;
	Date end;

	bool contains(const Date &date) const {
		return start <= date && date <= end;
	}

	bool overlaps(const DateRange &other) const {
		return start <= other.end && other.start <= end;
	}

	bool operator==(const DateRange &other) const {
		return start == other.start && end == other.end;
	}
};

} // namespace almanac::core
