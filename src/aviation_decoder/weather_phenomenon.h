#ifndef WEATHER_PHENOMENON_H
#define WEATHER_PHENOMENON_H

#include <string>
#include <optional>

namespace aerodata
{

struct WeatherPhenomenon
{
	/**
	 * Qualifier prefixed to the phenomenon group, moderate phenomena
	 * have none
	 */
	enum class Intensity
	{
		LIGHT = '-',
		HEAVY = '+',
		VICINITY = 'V'
	};

	enum class Category
	{
		PRECIPITATION, OBSCURATION, OTHER, VICINITY, UNKNOWN
	};

	//! Descriptors and phenomena, without the intensity prefix (SHRA, FZFG...)
	std::string _code;
	std::optional<Intensity> _intensity;
	Category _category = Category::UNKNOWN;
};

}

#endif /* WEATHER_PHENOMENON_H */
