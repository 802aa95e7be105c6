#include "validity_resolver.h"

#include <string>
#include <regex>
#include <chrono>
#include <optional>

#include <date/date.h>

namespace aerodata
{

namespace chrono = std::chrono;

std::optional<DayTime> parseDayTimeGroup(const std::string& group)
{
	static const std::regex dayTime{"(\\d{2})(\\d{2})(\\d{2})Z"};

	std::smatch match;
	if (!std::regex_match(group, match, dayTime))
		return std::optional<DayTime>();
	return DayTime{std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str())};
}

std::optional<std::pair<DayTime, DayTime>> parsePeriodGroup(const std::string& group)
{
	static const std::regex period{"(\\d{2})(\\d{2})/(\\d{2})(\\d{2})"};

	std::smatch match;
	if (!std::regex_match(group, match, period))
		return std::optional<std::pair<DayTime, DayTime>>();
	return std::make_pair(
		DayTime{std::stoi(match[1].str()), std::stoi(match[2].str())},
		DayTime{std::stoi(match[3].str()), std::stoi(match[4].str())}
	);
}

ValidityResolver::ValidityResolver(const date::sys_seconds& reference)
{
	date::year_month_day ymd{date::floor<date::days>(reference)};
	_referenceMonth = ymd.year() / ymd.month();
	_referenceDay = static_cast<int>(static_cast<unsigned int>(ymd.day()));
}

std::optional<date::sys_seconds> ValidityResolver::build(const date::year_month& month, const DayTime& point)
{
	if (point._day < 1 || point._day > 31 ||
	    point._hour < 0 || point._hour > 24 ||
	    point._minute < 0 || point._minute > 59)
		return std::optional<date::sys_seconds>();

	// 24 is used for the end of a validity period, meaning midnight
	if (point._hour == 24 && point._minute != 0)
		return std::optional<date::sys_seconds>();

	date::year_month_day ymd = month / date::day(static_cast<unsigned int>(point._day));
	if (!ymd.ok())
		return std::optional<date::sys_seconds>();

	return date::sys_seconds{date::sys_days{ymd}} + chrono::hours(point._hour) + chrono::minutes(point._minute);
}

date::year_month ValidityResolver::monthAfterReference(int day) const
{
	if (day < _referenceDay - MONTH_WRAP_THRESHOLD)
		return _referenceMonth + date::months(1);
	return _referenceMonth;
}

std::optional<date::sys_seconds> ValidityResolver::resolve(const DayTime& point) const
{
	return build(_referenceMonth, point);
}

std::optional<date::sys_seconds> ValidityResolver::resolveAfterReference(const DayTime& point) const
{
	return build(monthAfterReference(point._day), point);
}

std::optional<date::sys_seconds> ValidityResolver::resolveBeforeReference(const DayTime& point) const
{
	if (point._day > _referenceDay + MONTH_WRAP_THRESHOLD)
		return build(_referenceMonth - date::months(1), point);
	return build(_referenceMonth, point);
}

std::optional<ValidityWindow> ValidityResolver::makeWindow(const std::optional<date::sys_seconds>& start,
	const date::year_month& endMonth, const DayTime& end)
{
	if (!start)
		return std::optional<ValidityWindow>();

	std::optional<date::sys_seconds> to = build(endMonth, end);
	if (!to || *to < *start)
		to = build(endMonth + date::months(1), end);

	if (!to || *to <= *start)
		return std::optional<ValidityWindow>();
	return ValidityWindow{*start, *to};
}

std::optional<ValidityWindow> ValidityResolver::resolveWindow(const DayTime& start, const DayTime& end) const
{
	return makeWindow(build(_referenceMonth, start), _referenceMonth, end);
}

std::optional<ValidityWindow> ValidityResolver::resolveChangeGroupWindow(const DayTime& start, const DayTime& end) const
{
	return makeWindow(resolveAfterReference(start), monthAfterReference(end._day), end);
}

}
