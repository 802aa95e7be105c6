#ifndef METAR_MESSAGE_H
#define METAR_MESSAGE_H

#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

#include "field_extractor.h"
#include "temperature_reading.h"
#include "pressure.h"

namespace aerodata
{

struct MetarMessage : public SurfaceConditions
{
	/**
	 * Routine report or special report issued between two routine ones
	 */
	enum class Kind
	{
		METAR, SPECI
	};

	Kind _kind = Kind::METAR;
	std::string _stationIcao;
	//! The report, groups separated by single spaces
	std::string _rawText;
	date::sys_seconds _observationTime;
	//! Fully automated report (AUTO)
	bool _automatic = false;
	//! Corrected report (COR)
	bool _corrected = false;

	TemperatureReading _temperature;
	Pressure _pressure;
};

}

#endif /* METAR_MESSAGE_H */
