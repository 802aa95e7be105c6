/**
 * @file noaa_bulletin.cpp
 * @brief Implementation of the NoaaBulletin class
 * @date 2026-09-14
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

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <date/date.h>

#include "noaa_bulletin.h"
#include "aviation_decoder/tokenizer.h"
#include "aviation_decoder/metar_parser.h"

namespace aerodata
{

NoaaBulletin::NoaaBulletin(std::istream& input, Product product) :
	_product(product),
	_valid(false)
{
	std::vector<std::string> lines;
	std::string line;
	while (std::getline(input, line)) {
		auto begin = line.find_first_not_of(" \t\r");
		if (begin == std::string::npos)
			continue;
		auto end = line.find_last_not_of(" \t\r");
		lines.emplace_back(line.substr(begin, end - begin + 1));
	}

	if (lines.size() < 2)
		return;

	std::istringstream timestamp{lines.front()};
	timestamp >> date::parse("%Y/%m/%d %H:%M", _referenceTime);
	if (timestamp.fail())
		return;

	if (_product == Product::METAR) {
		_body = lines[1];
	} else {
		_body = join(lines.cbegin() + 1, lines.cend());
	}

	// The station is the first group after the report type and its
	// amendment/correction markers
	for (const std::string& group : tokenize(_body)) {
		if (group == "METAR" || group == "SPECI" || group == "TAF" || group == "AMD" || group == "COR")
			continue;
		if (isStationIcao(group)) {
			_stationIcao = group;
			_valid = true;
		}
		break;
	}
}

}
