/**
 * @file record_serializer.cpp
 * @brief Conversion of decoded reports to property trees
 * @date 2026-09-22
 */
/*
 * Copyright (C) 2026  SAS Météo Concept <contact@meteo-concept.fr>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>
#include <optional>
#include <utility>

#include <boost/property_tree/ptree.hpp>
#include <date/date.h>

#include "record_serializer.h"

namespace aerodata
{

namespace
{
template<typename T>
void putOptional(pt::ptree& tree, const std::string& path, const std::optional<T>& value)
{
	if (value)
		tree.put(path, *value);
	else
		tree.put(path, "");
}

std::string toIsoString(const date::sys_seconds& time)
{
	return date::format("%FT%TZ", time);
}

pt::ptree windToPropertyTree(const std::optional<WindObservation>& wind)
{
	pt::ptree result;
	if (!wind) {
		result.put("direction", "");
		result.put("variable", "");
		result.put("speed", "");
		result.put("gust", "");
		result.put("unit", "");
		result.put("variable_from", "");
		result.put("variable_to", "");
		return result;
	}

	putOptional(result, "direction", wind->_direction);
	result.put("variable", wind->_variable);
	putOptional(result, "speed", wind->_speed);
	putOptional(result, "gust", wind->_gustSpeed);
	result.put("unit", toString(wind->_unit));
	putOptional(result, "variable_from", wind->_variableFrom);
	putOptional(result, "variable_to", wind->_variableTo);
	return result;
}

void putConditions(pt::ptree& tree, const SurfaceConditions& conditions)
{
	tree.add_child("wind", windToPropertyTree(conditions._wind));
	putOptional(tree, "visibility", conditions._visibility);

	pt::ptree clouds;
	for (const CloudLayer& layer : conditions._clouds) {
		pt::ptree l;
		l.put("coverage", toString(layer._coverage));
		putOptional(l, "base_height", layer._baseHeight);
		l.put("convective", layer._convective);
		clouds.push_back(std::make_pair("", l));
	}
	tree.add_child("clouds", clouds);

	pt::ptree phenomena;
	for (const WeatherPhenomenon& phenomenon : conditions._phenomena) {
		pt::ptree p;
		p.put("code", phenomenon._code);
		p.put("intensity", phenomenon._intensity ? toString(*phenomenon._intensity) : "");
		p.put("category", toString(phenomenon._category));
		phenomena.push_back(std::make_pair("", p));
	}
	tree.add_child("phenomena", phenomena);
}

void putWindow(pt::ptree& tree, const std::optional<ValidityWindow>& window)
{
	tree.put("valid_from", window ? toIsoString(window->_start) : "");
	tree.put("valid_to", window ? toIsoString(window->_end) : "");
}
}

const char* toString(WindObservation::Unit unit)
{
	return unit == WindObservation::Unit::METERS_PER_SECOND ? "MPS" : "KT";
}

const char* toString(CloudLayer::Coverage coverage)
{
	switch (coverage) {
		case CloudLayer::Coverage::FEW: return "FEW";
		case CloudLayer::Coverage::SCT: return "SCT";
		case CloudLayer::Coverage::BKN: return "BKN";
		case CloudLayer::Coverage::OVC: return "OVC";
		case CloudLayer::Coverage::NSC: return "NSC";
		case CloudLayer::Coverage::NCD: return "NCD";
		case CloudLayer::Coverage::CLR: return "CLR";
		case CloudLayer::Coverage::SKC: return "SKC";
	}
	return "";
}

const char* toString(WeatherPhenomenon::Intensity intensity)
{
	switch (intensity) {
		case WeatherPhenomenon::Intensity::LIGHT: return "-";
		case WeatherPhenomenon::Intensity::HEAVY: return "+";
		case WeatherPhenomenon::Intensity::VICINITY: return "VC";
	}
	return "";
}

const char* toString(WeatherPhenomenon::Category category)
{
	switch (category) {
		case WeatherPhenomenon::Category::PRECIPITATION: return "precipitation";
		case WeatherPhenomenon::Category::OBSCURATION: return "obscuration";
		case WeatherPhenomenon::Category::OTHER: return "other";
		case WeatherPhenomenon::Category::VICINITY: return "vicinity";
		case WeatherPhenomenon::Category::UNKNOWN: return "unknown";
	}
	return "";
}

const char* toString(ForecastSegment::Type type)
{
	switch (type) {
		case ForecastSegment::Type::INIT: return "INIT";
		case ForecastSegment::Type::BECMG: return "BECMG";
		case ForecastSegment::Type::TEMPO: return "TEMPO";
		case ForecastSegment::Type::PROB: return "PROB";
		case ForecastSegment::Type::FM: return "FM";
	}
	return "";
}

pt::ptree toPropertyTree(const MetarMessage& metar)
{
	pt::ptree result;
	result.put("station", metar._stationIcao);
	result.put("kind", metar._kind == MetarMessage::Kind::SPECI ? "SPECI" : "METAR");
	result.put("raw", metar._rawText);
	result.put("observation_time", toIsoString(metar._observationTime));
	result.put("automatic", metar._automatic);
	result.put("corrected", metar._corrected);
	putConditions(result, metar);
	putOptional(result, "temperature", metar._temperature._airTemperature);
	putOptional(result, "dew_point", metar._temperature._dewPoint);
	putOptional(result, "qnh", metar._pressure._qnh);
	return result;
}

pt::ptree toPropertyTree(const TafMessage& taf, const std::vector<ForecastSegment>& segments, const std::string& tafId)
{
	pt::ptree result;
	result.put("id", tafId);
	result.put("station", taf._stationIcao);
	result.put("raw", taf._rawText);
	result.put("emission_time", toIsoString(taf._emissionTime));
	putWindow(result, taf._validity);
	result.put("amended", taf._amended);
	result.put("corrected", taf._corrected);
	result.put("nil", taf._nil);
	result.put("cancelled", taf._cancelled);

	pt::ptree segmentsTree;
	for (const ForecastSegment& segment : segments) {
		pt::ptree s;
		s.put("type", toString(segment._type));
		putOptional(s, "probability", segment._probability);
		putWindow(s, segment._validity);
		s.put("raw", segment._rawText);
		putConditions(s, segment);
		segmentsTree.push_back(std::make_pair("", s));
	}
	result.add_child("segments", segmentsTree);

	return result;
}

}
