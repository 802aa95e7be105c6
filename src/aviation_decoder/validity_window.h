#ifndef VALIDITY_WINDOW_H
#define VALIDITY_WINDOW_H

#include <date/date.h>

namespace aerodata
{

/**
 * A period of validity, always non-empty: _end is strictly after _start
 */
struct ValidityWindow
{
	date::sys_seconds _start;
	date::sys_seconds _end;
};

}

#endif /* VALIDITY_WINDOW_H */
