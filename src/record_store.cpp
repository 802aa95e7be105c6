/**
 * @file record_store.cpp
 * @brief Implementation of the MemoryRecordStore class
 * @date 2026-09-21
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
#include <string>
#include <vector>
#include <map>
#include <optional>

#include <systemd/sd-daemon.h>

#include "record_store.h"

namespace aerodata
{

const std::vector<ForecastSegment> MemoryRecordStore::NO_SEGMENT;

bool MemoryRecordStore::upsertMetar(const MetarMessage& metar)
{
	if (metar._stationIcao.empty())
		return false;

	_metars[metar._stationIcao] = metar;
	std::cout << SD_DEBUG << "[METAR] store: "
		<< "METAR of " << metar._stationIcao << " stored" << std::endl;
	return true;
}

std::optional<std::string> MemoryRecordStore::replaceTaf(const TafMessage& taf)
{
	if (taf._stationIcao.empty())
		return std::optional<std::string>();

	auto current = _currentTafs.find(taf._stationIcao);
	if (current != _currentTafs.end()) {
		std::cout << SD_DEBUG << "[TAF] store: "
			<< "Discarding TAF " << current->second << " and its "
			<< _segments[current->second].size() << " segments" << std::endl;
		_segments.erase(current->second);
		_tafs.erase(current->second);
	}

	std::string id = taf._stationIcao + "-" + std::to_string(++_tafCounter);

	TafMessage stored = taf;
	_segments[id] = std::move(stored._segments);
	stored._segments.clear();
	_tafs[id] = std::move(stored);
	_currentTafs[taf._stationIcao] = id;

	std::cout << SD_DEBUG << "[TAF] store: "
		<< "TAF " << id << " stored with " << _segments[id].size() << " segments" << std::endl;
	return id;
}

const MetarMessage* MemoryRecordStore::getMetar(const std::string& icao) const
{
	auto it = _metars.find(icao);
	return it == _metars.end() ? nullptr : &it->second;
}

std::optional<std::string> MemoryRecordStore::getCurrentTafId(const std::string& icao) const
{
	auto it = _currentTafs.find(icao);
	if (it == _currentTafs.end())
		return std::optional<std::string>();
	return it->second;
}

const TafMessage* MemoryRecordStore::getTaf(const std::string& tafId) const
{
	auto it = _tafs.find(tafId);
	return it == _tafs.end() ? nullptr : &it->second;
}

const std::vector<ForecastSegment>& MemoryRecordStore::getSegments(const std::string& tafId) const
{
	auto it = _segments.find(tafId);
	return it == _segments.end() ? NO_SEGMENT : it->second;
}

}
