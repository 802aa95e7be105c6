#ifndef TAF_PARSER_H
#define TAF_PARSER_H

#include <string>
#include <vector>
#include <optional>

#include <date/date.h>

#include "taf_message.h"
#include "decoding_issue.h"
#include "validity_resolver.h"

namespace aerodata
{

/**
 * @brief Decoder for Terminal Aerodrome Forecasts
 *
 * The body of the forecast is cut in segments by a state machine whose
 * state is the type of the segment currently open. Each change group
 * (BECMG, TEMPO, PROBnn, FMddhhmm) closes the current segment and opens a
 * new one. The end of the forecast closes the last segment.
 */
class TafParser
{
private:
	using Iterator = std::vector<std::string>::const_iterator;

	TafMessage _message;
	std::vector<std::string> _groups;
	std::vector<DecodingIssue> _issues;

	bool parseHeader(Iterator& it, const date::sys_seconds& reference);
	void parseSegments(Iterator& it);
	std::optional<ForecastSegment> openSegment(const std::string& group, const ValidityResolver& resolver);
	void closeSegment(ForecastSegment& segment, const std::vector<std::string>& span);

public:
	TafParser();

	/**
	 * @brief Decode a TAF
	 *
	 * @param body The forecast, starting with the optional TAF marker or
	 * the station code, possibly spanning several lines
	 * @param reference The time line of the bulletin, used to resolve the
	 * month and year of the issuance time
	 * @return False if the forecast is too short to contain even the
	 * station code and the issuance time, in which case no message is
	 * decoded
	 */
	bool parse(const std::string& body, const date::sys_seconds& reference);

	const TafMessage& getDecodedMessage() const {
		return _message;
	}

	const std::vector<DecodingIssue>& getIssues() const {
		return _issues;
	}
};

/**
 * @brief Decode a TAF
 *
 * @return The decoded forecast, or nothing for an empty or truncated
 * forecast
 */
std::optional<TafMessage> parseTaf(const std::string& body, const date::sys_seconds& reference);

}

#endif /* TAF_PARSER_H */
