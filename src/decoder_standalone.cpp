/**
 * @file decoder_standalone.cpp
 * @brief Implementation of the DecoderStandalone class
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

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <set>
#include <exception>

#include <systemd/sd-daemon.h>
#include <date/date.h>

#include "decoder_standalone.h"
#include "noaa_bulletin.h"
#include "record_store.h"
#include "aviation_decoder/metar_parser.h"
#include "aviation_decoder/taf_parser.h"
#include "aviation_decoder/decoding_issue.h"

namespace aerodata
{

namespace
{
const char* toString(DecodingIssue::Kind kind)
{
	switch (kind) {
		case DecodingIssue::Kind::MALFORMED_TOKEN: return "unrecognized group";
		case DecodingIssue::Kind::MISSING_VALIDITY_GROUP: return "no validity period";
		case DecodingIssue::Kind::EMPTY_OR_TRUNCATED_BODY: return "empty or truncated report";
	}
	return "";
}

void logIssues(const char* tag, const std::string& icao, const std::vector<DecodingIssue>& issues)
{
	for (const DecodingIssue& issue : issues) {
		std::cout << SD_DEBUG << tag << " measurement: "
			<< icao << ": " << toString(issue._kind);
		if (!issue._group.empty())
			std::cout << " '" << issue._group << "'";
		std::cout << std::endl;
	}
}
}

DecoderStandalone::DecoderStandalone(RecordStore& store, const std::set<std::string>& stations,
	const std::set<std::string>& ignoredStations, bool verbose) :
		_store(store),
		_stations(stations),
		_ignoredStations(ignoredStations),
		_verbose(verbose)
{
}

bool DecoderStandalone::isWanted(const std::string& icao) const
{
	if (_ignoredStations.count(icao))
		return false;
	return _stations.empty() || _stations.count(icao);
}

bool DecoderStandalone::process(const std::string& file, NoaaBulletin::Product product)
{
	const char* tag = product == NoaaBulletin::Product::METAR ? "[METAR]" : "[TAF]";

	std::ifstream input{file};
	if (!input) {
		std::cerr << SD_ERR << tag << " management: "
			<< "Cannot open " << file << std::endl;
		return false;
	}

	return process(input, product, file);
}

bool DecoderStandalone::process(std::istream& input, NoaaBulletin::Product product, const std::string& name)
{
	const char* tag = product == NoaaBulletin::Product::METAR ? "[METAR]" : "[TAF]";

	NoaaBulletin bulletin{input, product};
	if (!bulletin) {
		std::cerr << SD_WARNING << tag << " measurement: "
			<< "Bulletin in " << name << " looks invalid, discarding..." << std::endl;
		return false;
	}

	if (!isWanted(bulletin.getStationIcao())) {
		std::cout << SD_DEBUG << tag << " management: "
			<< "Station " << bulletin.getStationIcao() << " skipped" << std::endl;
		return false;
	}

	_processed++;
	if (_processed % 10 == 0) {
		std::cout << SD_INFO << tag << " management: "
			<< _processed << " bulletins processed" << std::endl;
	}

	return product == NoaaBulletin::Product::METAR ? processMetar(bulletin) : processTaf(bulletin);
}

bool DecoderStandalone::processMetar(const NoaaBulletin& bulletin)
{
	MetarParser parser;
	if (!parser.parse(bulletin.getBody(), bulletin.getReferenceTime())) {
		std::cerr << SD_WARNING << "[METAR] measurement: "
			<< "Record for " << bulletin.getStationIcao() << " looks invalid, discarding..." << std::endl;
		return false;
	}

	const MetarMessage& m = parser.getDecodedMessage();
	if (_verbose) {
		std::cout << SD_DEBUG << "[METAR] measurement: "
			<< m._stationIcao << " observed at " << date::format("%F %H:%M", m._observationTime)
			<< ", " << m._clouds.size() << " cloud layers, "
			<< m._phenomena.size() << " phenomena" << std::endl;
		logIssues("[METAR]", m._stationIcao, parser.getIssues());
	}

	if (!_store.upsertMetar(m)) {
		std::cerr << SD_ERR << "[METAR] management: "
			<< "Failed to store the METAR of " << m._stationIcao << std::endl;
		return false;
	}

	_metarSuccess++;
	return true;
}

bool DecoderStandalone::processTaf(const NoaaBulletin& bulletin)
{
	TafParser parser;
	if (!parser.parse(bulletin.getBody(), bulletin.getReferenceTime())) {
		std::cerr << SD_WARNING << "[TAF] measurement: "
			<< "Record for " << bulletin.getStationIcao() << " looks invalid, discarding..." << std::endl;
		return false;
	}

	const TafMessage& m = parser.getDecodedMessage();
	if (_verbose) {
		std::cout << SD_DEBUG << "[TAF] measurement: "
			<< m._stationIcao << " issued at " << date::format("%F %H:%M", m._emissionTime)
			<< ", " << m._segments.size() << " segments" << std::endl;
		logIssues("[TAF]", m._stationIcao, parser.getIssues());
	}

	auto id = _store.replaceTaf(m);
	if (!id) {
		std::cerr << SD_ERR << "[TAF] management: "
			<< "Failed to store the TAF of " << m._stationIcao << std::endl;
		return false;
	}

	_tafSuccess++;
	return true;
}

}
