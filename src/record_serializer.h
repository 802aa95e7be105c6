/**
 * @file record_serializer.h
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

#ifndef RECORD_SERIALIZER_H
#define RECORD_SERIALIZER_H

#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "aviation_decoder/metar_message.h"
#include "aviation_decoder/taf_message.h"

namespace aerodata
{

namespace pt = boost::property_tree;

const char* toString(WindObservation::Unit unit);
const char* toString(CloudLayer::Coverage coverage);
const char* toString(WeatherPhenomenon::Intensity intensity);
const char* toString(WeatherPhenomenon::Category category);
const char* toString(ForecastSegment::Type type);

/**
 * @brief Build the document describing a METAR
 *
 * All the fields are present, the unknown ones have an empty value.
 */
pt::ptree toPropertyTree(const MetarMessage& metar);

/**
 * @brief Build the document describing a TAF and its segments
 *
 * @param taf The forecast
 * @param segments The segments of the forecast
 * @param tafId The identifier the forecast is stored under
 */
pt::ptree toPropertyTree(const TafMessage& taf, const std::vector<ForecastSegment>& segments, const std::string& tafId);

}

#endif /* RECORD_SERIALIZER_H */
