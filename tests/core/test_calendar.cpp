#include <catch2/catch_test_macros.hpp>

#include "almanac/core/calendar.hpp"
#include "almanac/core/time_series.hpp"

#include <stdexcept>

using almanac::core::CalendarPeriod;
using almanac::core::Date;
using almanac::core::DateRange;

TEST_CASE("Date serial conversion round trips", "[core][calendar]") {
	REQUIRE(Date(1970, 1, 1).toSerial() == 0);
	REQUIRE(Date(2000, 3, 1).toSerial() == 11017);
	REQUIRE(Date::fromSerial(11017) == Date(2000, 3, 1));
	REQUIRE(Date::fromSerial(-1) == Date(1969, 12, 31));
	REQUIRE(Date(2024, 2, 29).addDays(1) == Date(2024, 3, 1));
}

TEST_CASE("Date weekday and quarter", "[core][calendar]") {
	REQUIRE(Date(1970, 1, 1).weekday() == 3);
	REQUIRE(Date(2024, 1, 1).weekday() == 0);
	REQUIRE(Date(2023, 12, 31).isWeekend());
	REQUIRE(Date(2023, 12, 29).nextWeekday() == Date(2024, 1, 1));
	REQUIRE(Date(2023, 11, 15).quarter() == 4);
	REQUIRE(Date(2023, 4, 1).quarter() == 2);
}

TEST_CASE("Date parsing and formatting", "[core][calendar]") {
	REQUIRE(Date::parse("2021-07-04") == Date(2021, 7, 4));
	REQUIRE(Date(2021, 7, 4).toString() == "2021-07-04");
	REQUIRE_THROWS_AS(Date::parse("2021/07/04"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2021-02-30"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date(2021, 13, 1), std::invalid_argument);
}

TEST_CASE("Period labels", "[core][calendar]") {
	REQUIRE(almanac::core::periodLabel(CalendarPeriod::Month, 12) == "December");
	REQUIRE(almanac::core::periodLabel(CalendarPeriod::Quarter, 4) == "Q4");
	REQUIRE(almanac::core::periodLabel(CalendarPeriod::Weekday, 4) == "Friday");
	REQUIRE(almanac::core::daysInMonth(2023, 2) == 28);
	REQUIRE(almanac::core::daysInMonth(2000, 2) == 29);
	REQUIRE(almanac::core::daysInMonth(1900, 2) == 28);
}

TEST_CASE("Date ranges overlap when they share a day", "[core][calendar]") {
	const DateRange first{Date(2020, 1, 1), Date(2020, 1, 31)};
	const DateRange second{Date(2020, 1, 31), Date(2020, 2, 15)};
	const DateRange third{Date(2020, 2, 1), Date(2020, 2, 15)};
	REQUIRE(first.overlaps(second));
	REQUIRE_FALSE(first.overlaps(third));
	REQUIRE(first.contains(Date(2020, 1, 15)));
}

TEST_CASE("TimeSeries rejects unordered dates", "[core][time_series]") {
	using almanac::core::TimeSeries;
	REQUIRE_THROWS_AS(TimeSeries({Date(2020, 1, 2), Date(2020, 1, 1)}, {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeries({Date(2020, 1, 1)}, {1.0, 2.0}), std::invalid_argument);

	const TimeSeries ts({Date(2020, 1, 6), Date(2020, 1, 7), Date(2020, 1, 8), Date(2020, 1, 13)}, {1.0, 2.0, 3.0, 4.0});
	REQUIRE(ts.medianSpacingDays() == 1.0);
	const auto tail = ts.slice(2, 4);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.getValues().front() == 3.0);
	REQUIRE_THROWS_AS(ts.slice(1, 5), std::out_of_range);
}
