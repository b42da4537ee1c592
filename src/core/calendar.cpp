#include "almanac/core/calendar.hpp"

#include <cstdio>
#include <stdexcept>

namespace almanac::core {

namespace {

// Civil-from-days and days-from-civil after H. Hinnant's chrono algorithms.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr const char *kMonthNames[] = {"January", "February", "March",     "April",   "May",      "June",
                                       "July",    "August",   "September", "October", "November", "December"};

constexpr const char *kWeekdayNames[] = {"Monday", "Tuesday", "Wednesday", "Thursday",
                                         "Friday", "Saturday", "Sunday"};

} // namespace

std::string toString(CalendarPeriod period) {
	switch (period) {
	case CalendarPeriod::Month:
		return "month";
	case CalendarPeriod::Quarter:
		return "quarter";
	case CalendarPeriod::Weekday:
		return "weekday";
	}
	return "unknown";
}

unsigned daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in 1..12.");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

const char *monthName(unsigned month) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in 1..12.");
	}
	return kMonthNames[month - 1];
}

const char *weekdayName(unsigned weekday) {
	if (weekday > 6) {
		throw std::invalid_argument("Weekday must be in 0..6.");
	}
	return kWeekdayNames[weekday];
}

std::string periodLabel(CalendarPeriod kind, int period) {
	switch (kind) {
	case CalendarPeriod::Month:
		return monthName(static_cast<unsigned>(period));
	case CalendarPeriod::Quarter:
		return "Q" + std::to_string(period);
	case CalendarPeriod::Weekday:
		return weekdayName(static_cast<unsigned>(period));
	}
	return std::to_string(period);
}

Date::Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
	if (m < 1 || m > 12) {
		throw std::invalid_argument("Date month must be in 1..12.");
	}
	if (d < 1 || d > daysInMonth(y, m)) {
		throw std::invalid_argument("Date day is out of range for its month.");
	}
}

Date Date::fromSerial(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	Date result;
	result.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
	result.month = m;
	result.day = d;
	return result;
}

Date Date::parse(const std::string &text) {
	int y = 0;
	unsigned m = 0;
	unsigned d = 0;
	char tail = '\0';
	if (std::sscanf(text.c_str(), "%d-%u-%u%c", &y, &m, &d, &tail) != 3) {
		throw std::invalid_argument("Date must be formatted as YYYY-MM-DD: '" + text + "'.");
	}
	return Date(y, m, d);
}

std::int64_t Date::toSerial() const {
	return daysFromCivil(year, month, day);
}

unsigned Date::weekday() const {
	// 1970-01-01 was a Thursday (index 3 with Monday = 0).
	const std::int64_t serial = toSerial();
	const std::int64_t shifted = (serial + 3) % 7;
	return static_cast<unsigned>(shifted < 0 ? shifted + 7 : shifted);
}

Date Date::nextWeekday() const {
	Date next = addDays(1);
	while (next.isWeekend()) {
		next = next.addDays(1);
	}
	return next;
}

std::string Date::toString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
	return buffer;
}

} // namespace almanac::core
