#ifndef FIELD_EXTRACTOR_H
#define FIELD_EXTRACTOR_H

#include <string>
#include <optional>
#include <variant>
#include <vector>

#include "wind_observation.h"
#include "cloud_layer.h"
#include "weather_phenomenon.h"
#include "temperature_reading.h"
#include "pressure.h"

namespace aerodata
{

/**
 * Visibility reported as "10 km or more", CAVOK and clear sky indicators
 * are mapped to it
 */
constexpr int UNLIMITED_VISIBILITY = 9999;

struct Visibility
{
	//! Prevailing visibility, in meters
	int _distance;
};

/**
 * NSC, SKC and CLR tell both about the clouds and the visibility
 */
struct ClearSky
{
	CloudLayer _layer;
	int _visibility;
};

/**
 * @brief One decoded group, the alternative tells which grammar claimed it
 */
using Field = std::variant<
	WindObservation,
	WindVariation,
	Visibility,
	ClearSky,
	CloudLayer,
	WeatherPhenomenon,
	TemperatureReading,
	Pressure
>;

/**
 * @brief The fields common to an observation and to a forecast segment
 */
struct SurfaceConditions
{
	std::optional<WindObservation> _wind;
	//! Prevailing visibility in meters, 9999 for 10 km or more
	std::optional<int> _visibility;
	std::vector<CloudLayer> _clouds;
	std::vector<WeatherPhenomenon> _phenomena;
};

std::optional<WindObservation> extractWind(const std::string& group);
std::optional<WindVariation> extractWindVariation(const std::string& group);
std::optional<int> extractVisibility(const std::string& group);
std::optional<CloudLayer> extractCloudLayer(const std::string& group);
std::optional<WeatherPhenomenon> extractWeatherPhenomenon(const std::string& group);
std::optional<TemperatureReading> extractTemperature(const std::string& group);
std::optional<Pressure> extractPressure(const std::string& group);

/**
 * @brief Give the category of a phenomenon code (RA, SHRA, BR, TS...)
 *
 * @param code The code, without its intensity prefix
 * @param vicinity Whether the phenomenon is reported in the vicinity (VC)
 * @return The category, UNKNOWN for codes absent from the WMO tables
 */
WeatherPhenomenon::Category categorize(const std::string& code, bool vicinity = false);

/**
 * @brief Tell whether a group is one of the keywords structuring a report
 * (change groups, amendment or correction markers...)
 */
bool isStructuralKeyword(const std::string& group);

/**
 * @brief Decode one group
 *
 * The grammars are tried in this order: wind, wind variation, visibility,
 * clouds, weather phenomena, temperature, pressure. The first one that
 * recognizes the group claims it.
 *
 * @param group A group from a METAR or a TAF
 * @return The decoded field or nothing if the group matches no grammar
 */
std::optional<Field> classify(const std::string& group);

/**
 * @brief Decode the group at \a it, together with the next one when they
 * form a single visibility in statute miles and fraction ("1 1/2SM")
 *
 * @param it The group to decode, moved to the last group used
 * @param end The end of the groups
 * @return The decoded field or nothing if the group matches no grammar
 */
std::optional<Field> classify(std::vector<std::string>::const_iterator& it,
	std::vector<std::string>::const_iterator end);

/**
 * @brief Record a decoded field into some conditions
 *
 * Wind and visibility are only taken from the first group that reports
 * them, cloud layers and phenomena accumulate.
 *
 * @return False if the field does not belong to \a conditions or if it
 * was already known
 */
bool accumulate(SurfaceConditions& conditions, const Field& field);

}

#endif /* FIELD_EXTRACTOR_H */
