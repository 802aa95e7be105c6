/**
 * @file noaa_bulletin.h
 * @brief Definition of the NoaaBulletin class
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

#ifndef NOAA_BULLETIN_H
#define NOAA_BULLETIN_H

#include <iostream>
#include <string>

#include <date/date.h>

namespace aerodata
{

/**
 * @brief A METAR or TAF file as published per station by the NOAA
 * (tgftp.nws.noaa.gov/data/observations/metar/stations/XXXX.TXT and
 * tgftp.nws.noaa.gov/data/forecasts/taf/stations/XXXX.TXT)
 *
 * The first line is the time of the bulletin, in UTC, in the format
 * "YYYY/MM/DD HH:MM". A METAR follows on the second line, a TAF spans all
 * the remaining lines.
 */
class NoaaBulletin
{
public:
	enum class Product
	{
		METAR, TAF
	};

	/**
	 * @brief Read and split a station file
	 *
	 * @param input The content of the file
	 * @param product What the file is expected to contain
	 */
	NoaaBulletin(std::istream& input, Product product);

	/**
	 * @brief Tell whether the file contained a timestamp line, a report
	 * and a valid station code
	 */
	inline operator bool() const {
		return _valid;
	}

	inline Product getProduct() const {
		return _product;
	}

	inline const std::string& getStationIcao() const {
		return _stationIcao;
	}

	inline date::sys_seconds getReferenceTime() const {
		return _referenceTime;
	}

	inline const std::string& getBody() const {
		return _body;
	}

private:
	Product _product;
	std::string _stationIcao;
	date::sys_seconds _referenceTime;
	std::string _body;
	bool _valid;
};

}

#endif /* NOAA_BULLETIN_H */
