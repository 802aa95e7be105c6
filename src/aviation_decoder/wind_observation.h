#ifndef WIND_OBSERVATION_H
#define WIND_OBSERVATION_H

#include <optional>

namespace aerodata
{

struct WindObservation
{
	/**
	 * Unit of wind speed, given as a suffix of the wind group
	 */
	enum class Unit
	{
		KNOTS, METERS_PER_SECOND
	};

	/**
	 * Direction the wind blows from, in degrees, unset when the
	 * direction is variable (VRB) or not available (///)
	 */
	std::optional<int> _direction;
	bool _variable = false;
	std::optional<int> _speed;
	std::optional<int> _gustSpeed;
	Unit _unit = Unit::KNOTS;

	//! Extreme directions of the wind sector, from the dddVddd group
	std::optional<int> _variableFrom;
	std::optional<int> _variableTo;
};

struct WindVariation
{
	int _from;
	int _to;
};

}

#endif /* WIND_OBSERVATION_H */
