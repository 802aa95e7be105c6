/**
 * @file decoder_standalone.h
 * @brief Definition of the DecoderStandalone class
 * @date 2026-09-28
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

#ifndef DECODER_STANDALONE_H
#define DECODER_STANDALONE_H

#include <iostream>
#include <string>
#include <vector>
#include <set>

#include "noaa_bulletin.h"
#include "record_store.h"

namespace aerodata
{

/**
 * @brief Decode NOAA station files and feed the decoded reports to a
 * record store
 */
class DecoderStandalone
{
public:
	/**
	 * @brief Construct the decoder
	 *
	 * @param store The storage of decoded reports
	 * @param stations If not empty, only these stations are processed
	 * @param ignoredStations Stations never processed
	 * @param verbose Whether to log a summary of each decoded report
	 */
	DecoderStandalone(RecordStore& store, const std::set<std::string>& stations,
		const std::set<std::string>& ignoredStations, bool verbose);

	/**
	 * @brief Decode one station file
	 *
	 * @return True if a report has been decoded and stored
	 */
	bool process(const std::string& file, NoaaBulletin::Product product);

	/**
	 * @brief Decode the content of one station file
	 *
	 * @param input The content of the file
	 * @param product What the file is expected to contain
	 * @param name The name of the file, for the logs
	 * @return True if a report has been decoded and stored
	 */
	bool process(std::istream& input, NoaaBulletin::Product product, const std::string& name);

	inline int getProcessed() const { return _processed; }
	inline int getMetarSuccess() const { return _metarSuccess; }
	inline int getTafSuccess() const { return _tafSuccess; }

private:
	RecordStore& _store;
	std::set<std::string> _stations;
	std::set<std::string> _ignoredStations;
	bool _verbose;

	int _processed = 0;
	int _metarSuccess = 0;
	int _tafSuccess = 0;

	bool isWanted(const std::string& icao) const;
	bool processMetar(const NoaaBulletin& bulletin);
	bool processTaf(const NoaaBulletin& bulletin);
};

}

#endif /* DECODER_STANDALONE_H */
