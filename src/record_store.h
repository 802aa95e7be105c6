/**
 * @file record_store.h
 * @brief Definition of the RecordStore and MemoryRecordStore classes
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

#ifndef RECORD_STORE_H
#define RECORD_STORE_H

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "aviation_decoder/metar_message.h"
#include "aviation_decoder/taf_message.h"

namespace aerodata
{

/**
 * @brief The interface to the storage of decoded reports
 *
 * Only the latest report of each station is kept: a METAR replaces the
 * previous METAR of the same station and a TAF replaces the previous TAF,
 * segments included.
 */
class RecordStore
{
public:
	virtual ~RecordStore() = default;

	/**
	 * @brief Insert the METAR of a station, replacing the one already
	 * stored if any
	 *
	 * @return True if the METAR has been stored
	 */
	virtual bool upsertMetar(const MetarMessage& metar) = 0;

	/**
	 * @brief Store a new TAF for a station, the previous TAF of the
	 * station and all its segments are discarded first
	 *
	 * @return The identifier generated for the new TAF, nothing if it
	 * could not be stored
	 */
	virtual std::optional<std::string> replaceTaf(const TafMessage& taf) = 0;
};

/**
 * @brief A RecordStore keeping everything in memory, the content is lost
 * when the store is destroyed
 */
class MemoryRecordStore : public RecordStore
{
public:
	bool upsertMetar(const MetarMessage& metar) override;
	std::optional<std::string> replaceTaf(const TafMessage& taf) override;

	const MetarMessage* getMetar(const std::string& icao) const;
	std::optional<std::string> getCurrentTafId(const std::string& icao) const;
	/**
	 * @brief Get a TAF by its identifier, the segments are not part of the
	 * returned message, get them with getSegments()
	 */
	const TafMessage* getTaf(const std::string& tafId) const;
	const std::vector<ForecastSegment>& getSegments(const std::string& tafId) const;

	inline const std::map<std::string, MetarMessage>& getMetars() const {
		return _metars;
	}

	inline const std::map<std::string, std::string>& getCurrentTafIds() const {
		return _currentTafs;
	}

	inline std::size_t getSegmentCount() const {
		std::size_t count = 0;
		for (auto&& segments : _segments)
			count += segments.second.size();
		return count;
	}

private:
	std::map<std::string, MetarMessage> _metars;
	//! The current TAF identifier of each station
	std::map<std::string, std::string> _currentTafs;
	std::map<std::string, TafMessage> _tafs;
	std::map<std::string, std::vector<ForecastSegment>> _segments;
	unsigned long _tafCounter = 0;

	static const std::vector<ForecastSegment> NO_SEGMENT;
};

}

#endif /* RECORD_STORE_H */
