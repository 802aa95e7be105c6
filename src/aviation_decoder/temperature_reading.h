#ifndef TEMPERATURE_READING_H
#define TEMPERATURE_READING_H

#include <optional>

namespace aerodata
{

struct TemperatureReading
{
	//! Air temperature, in Celsius degrees
	std::optional<int> _airTemperature;
	//! Dew point, in Celsius degrees
	std::optional<int> _dewPoint;
};

}

#endif /* TEMPERATURE_READING_H */
