#ifndef METAR_PARSER_H
#define METAR_PARSER_H

#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

#include "metar_message.h"
#include "decoding_issue.h"

namespace aerodata
{

class MetarParser
{
private:
	MetarMessage _message;
	std::vector<std::string> _groups;
	std::vector<DecodingIssue> _issues;

	bool parseHeader(decltype(_groups)::const_iterator& it, const date::sys_seconds& reference);
	void parseBody(decltype(_groups)::const_iterator& it);

public:
	MetarParser();

	/**
	 * @brief Decode a METAR or SPECI report
	 *
	 * @param body The report, starting with the optional METAR/SPECI
	 * marker or the station code
	 * @param reference The time line of the bulletin, used to resolve the
	 * month and year of the observation
	 * @return False if the report is too short to contain even the station
	 * code and the observation time, in which case no message is decoded
	 */
	bool parse(const std::string& body, const date::sys_seconds& reference);

	const MetarMessage& getDecodedMessage() const {
		return _message;
	}

	const std::vector<DecodingIssue>& getIssues() const {
		return _issues;
	}
};

/**
 * @brief Decode a METAR report
 *
 * @return The decoded report, or nothing for an empty or truncated report
 */
std::optional<MetarMessage> parseMetar(const std::string& body, const date::sys_seconds& reference);

/**
 * @brief Tell whether a group looks like an ICAO location indicator
 */
bool isStationIcao(const std::string& group);

}

#endif /* METAR_PARSER_H */
