#include <iostream>
#include <string>
#include <chrono>

#include <date/date.h>

#include "../src/aviation_decoder/validity_resolver.h"

using namespace aerodata;
using namespace date;
using namespace std::chrono;

int main()
{
	int failures = 0;
	auto check = [&failures](bool condition, const std::string& what) {
		std::cout << what << ": " << std::boolalpha << condition << "\n";
		if (!condition)
			failures++;
	};

	auto dayTime = parseDayTimeGroup("201250Z");
	check(dayTime && dayTime->_day == 20 && dayTime->_hour == 12 && dayTime->_minute == 50, "day-time group");
	check(!parseDayTimeGroup("201250"), "a day-time group ends with Z");
	auto period = parsePeriodGroup("1606/1608");
	check(period && period->first._day == 16 && period->first._hour == 6 &&
	      period->second._day == 16 && period->second._hour == 8, "period group");
	check(!parsePeriodGroup("16/08"), "a period group has four digits on each side");

	{
		ValidityResolver resolver{sys_days{2024_y/September/15} + 10h};
		auto window = resolver.resolveWindow({30, 12}, {2, 6});
		check(window && window->_start == sys_days{2024_y/September/30} + 12h &&
		      window->_end == sys_days{2024_y/October/2} + 6h, "3012/0206 ends in the next month");
		if (window)
			std::cout << window->_start << " - " << window->_end << "\n";

		auto point = resolver.resolve({16, 6});
		check(point && *point == sys_days{2024_y/September/16} + 6h, "a point in the reference month");
	}

	{
		ValidityResolver resolver{sys_days{2024_y/December/15} + 10h};
		auto window = resolver.resolveWindow({30, 12}, {2, 6});
		check(window && window->_end == sys_days{2025_y/January/2} + 6h, "December wraps to January of the next year");
	}

	{
		ValidityResolver resolver{sys_days{2024_y/June/16}};
		auto window = resolver.resolveWindow({16, 6}, {16, 24});
		check(window && window->_end == sys_days{2024_y/June/17}, "hour 24 is midnight of the next day");
		check(!resolver.resolve({16, 24, 30}), "hour 24 only with zero minutes");
		check(!resolver.resolve({16, 25}), "hour 25 does not exist");
		check(!resolver.resolveWindow({16, 6}, {16, 6}), "an empty window is rejected");
	}

	{
		ValidityResolver resolver{sys_days{2023_y/February/10}};
		check(!resolver.resolve({30, 12}), "there is no 30 February");
		check(!resolver.resolve({0, 12}), "there is no day 0");
		check(!resolver.resolveWindow({30, 12}, {2, 6}), "a window starting on a missing day is rejected");
	}

	{
		ValidityResolver resolver{sys_days{2024_y/December/31} + 10h};
		auto point = resolver.resolveAfterReference({1, 6});
		check(point && *point == sys_days{2025_y/January/1} + 6h, "a forecast point past the end of the year");
		point = resolver.resolveAfterReference({31, 12});
		check(point && *point == sys_days{2024_y/December/31} + 12h, "a forecast point later the same day");

		auto window = resolver.resolveChangeGroupWindow({31, 18}, {1, 24});
		check(window && window->_start == sys_days{2024_y/December/31} + 18h &&
		      window->_end == sys_days{2025_y/January/2}, "a change group across the new year");
	}

	{
		ValidityResolver resolver{sys_days{2024_y/November/1} + 5min};
		auto point = resolver.resolveBeforeReference({31, 23, 55});
		check(point && *point == sys_days{2024_y/October/31} + 23h + 55min, "an observation from the previous month");
		point = resolver.resolveBeforeReference({1, 0, 0});
		check(point && *point == sys_days{2024_y/November/1}, "an observation from the same day");
	}

	{
		ValidityResolver resolver{sys_days{2024_y/March/25} + 11h};
		auto point = resolver.resolveAfterReference({5, 0});
		check(point && *point == sys_days{2024_y/March/5}, "a gap of exactly 20 days stays in the month");
		point = resolver.resolveAfterReference({4, 0});
		check(point && *point == sys_days{2024_y/April/4}, "a gap over 20 days goes to the next month");
	}

	std::cout << (failures ? "FAILED" : "OK") << std::endl;
	return failures ? 1 : 0;
}
