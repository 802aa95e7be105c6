#ifndef PRESSURE_H
#define PRESSURE_H

#include <optional>

namespace aerodata
{

struct Pressure
{
	/**
	 * Altimeter setting (QNH) in hPa, reports in inches of mercury are
	 * converted
	 */
	std::optional<int> _qnh;
};

}

#endif /* PRESSURE_H */
