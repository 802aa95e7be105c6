#ifndef VALIDITY_RESOLVER_H
#define VALIDITY_RESOLVER_H

#include <optional>
#include <utility>
#include <string>

#include <date/date.h>

#include "validity_window.h"

namespace aerodata
{

/**
 * A point in time as coded in aeronautical reports: the day of the month,
 * the hour and possibly the minutes, year and month are implicit
 */
struct DayTime
{
	int _day;
	int _hour;
	int _minute = 0;
};

/**
 * @brief Parse an issuance or observation time group (ddhhmmZ)
 */
std::optional<DayTime> parseDayTimeGroup(const std::string& group);

/**
 * @brief Parse a validity period group (ddHH/ddHH)
 */
std::optional<std::pair<DayTime, DayTime>> parsePeriodGroup(const std::string& group);

/**
 * @brief Resolve the day/hour codes of a report into timestamps, using a
 * reference timestamp to supply the year and month
 *
 * The reference is typically the time line of the bulletin, or the issuance
 * time of the TAF. Months are handled as calendar months, moving forward
 * from December goes to January of the next year.
 */
class ValidityResolver
{
public:
	/**
	 * A day smaller than the reference day by more than this number of days
	 * is considered to be in the next month, a day greater by more than
	 * this number of days is in the previous month
	 */
	static constexpr int MONTH_WRAP_THRESHOLD = 20;

	explicit ValidityResolver(const date::sys_seconds& reference);

	/**
	 * @brief Resolve a point in the reference month
	 *
	 * @return The timestamp, or nothing if the day does not exist in the
	 * reference month or the hour or minutes are out of range
	 */
	std::optional<date::sys_seconds> resolve(const DayTime& point) const;

	/**
	 * @brief Resolve a point expected to come at or after the reference,
	 * moving it to the next month if its day has wrapped
	 */
	std::optional<date::sys_seconds> resolveAfterReference(const DayTime& point) const;

	/**
	 * @brief Resolve a point expected to come at or before the reference,
	 * moving it to the previous month if its day has wrapped
	 */
	std::optional<date::sys_seconds> resolveBeforeReference(const DayTime& point) const;

	/**
	 * @brief Resolve a validity period in the reference month
	 *
	 * If the end falls before the start, it is moved to the following
	 * month (for instance 3012/0206).
	 *
	 * @return The window or nothing if either end cannot be resolved or the
	 * window would be empty
	 */
	std::optional<ValidityWindow> resolveWindow(const DayTime& start, const DayTime& end) const;

	/**
	 * @brief Resolve the validity period of a change group, both ends
	 * may have wrapped to the next month relatively to the reference
	 */
	std::optional<ValidityWindow> resolveChangeGroupWindow(const DayTime& start, const DayTime& end) const;

private:
	date::year_month _referenceMonth;
	int _referenceDay;

	date::year_month monthAfterReference(int day) const;

	static std::optional<date::sys_seconds> build(const date::year_month& month, const DayTime& point);
	static std::optional<ValidityWindow> makeWindow(const std::optional<date::sys_seconds>& start,
		const date::year_month& endMonth, const DayTime& end);
};

}

#endif /* VALIDITY_RESOLVER_H */
