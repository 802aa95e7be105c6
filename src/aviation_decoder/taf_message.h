#ifndef TAF_MESSAGE_H
#define TAF_MESSAGE_H

#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

#include "field_extractor.h"
#include "validity_window.h"

namespace aerodata
{

struct ForecastSegment : public SurfaceConditions
{
	/**
	 * The change group opening the segment, INIT for the initial
	 * conditions of the forecast
	 */
	enum class Type
	{
		INIT, BECMG, TEMPO, PROB, FM
	};

	Type _type = Type::INIT;
	//! Probability of occurrence, in percents, for PROBnn groups only
	std::optional<int> _probability;
	/**
	 * The explicit period of the change group, or the period of the
	 * whole forecast when the change group gives none
	 */
	std::optional<ValidityWindow> _validity;
	//! The groups of the segment, the change group included
	std::string _rawText;
};

struct TafMessage
{
	std::string _stationIcao;
	//! The forecast, groups separated by single spaces
	std::string _rawText;
	date::sys_seconds _emissionTime;
	//! Unset when the forecast has no validity period group
	std::optional<ValidityWindow> _validity;
	bool _amended = false;
	bool _corrected = false;
	//! Missing forecast (NIL)
	bool _nil = false;
	//! Cancelled forecast (CNL)
	bool _cancelled = false;

	/**
	 * The initial conditions then each change group, in the order of the
	 * forecast, each segment amends the ones before it
	 */
	std::vector<ForecastSegment> _segments;
};

}

#endif /* TAF_MESSAGE_H */
