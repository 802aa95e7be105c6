#include "metar_parser.h"
#include "metar_message.h"
#include "tokenizer.h"
#include "field_extractor.h"
#include "validity_resolver.h"

#include <vector>
#include <string>
#include <regex>
#include <variant>
#include <optional>

#include <date/date.h>

namespace aerodata
{

bool isStationIcao(const std::string& group)
{
	static const std::regex icao{"[A-Z][A-Z0-9]{3}"};
	return std::regex_match(group, icao);
}

MetarParser::MetarParser()
{
}

bool MetarParser::parseHeader(decltype(_groups)::const_iterator& it, const date::sys_seconds& reference)
{
	if (it == _groups.cend())
		return false;

	// Type of report, not always given
	if (*it == "METAR" || *it == "SPECI") {
		_message._kind = *it == "SPECI" ? MetarMessage::Kind::SPECI : MetarMessage::Kind::METAR;
		++it;
		if (it == _groups.cend())
			return false;
	}

	// ICAO
	if (*it == "COR") {
		_message._corrected = true;
		++it;
		if (it == _groups.cend())
			return false;
	}
	if (!isStationIcao(*it))
		return false;
	_message._stationIcao = *it;
	++it;
	if (it == _groups.cend())
		return false;

	// Observation time, day of the month, hour and minutes
	_message._observationTime = reference;
	std::optional<DayTime> observation = parseDayTimeGroup(*it);
	if (!observation) {
		// not the time group, leave it to the body
		_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
		return true;
	}

	ValidityResolver resolver{reference};
	std::optional<date::sys_seconds> time = resolver.resolveBeforeReference(*observation);
	if (time)
		_message._observationTime = *time;
	else
		_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
	++it;

	return true;
}

void MetarParser::parseBody(decltype(_groups)::const_iterator& it)
{
	bool hasTemperature = false;
	bool hasPressure = false;

	for (; it != _groups.cend() ; ++it) {
		const std::string& s = *it;

		// Remarks are in free form, not decoded, and the trend is a
		// forecast, not part of the observation
		if (s == "RMK" || s == "TEMPO" || s == "BECMG")
			break;

		if (s == "AUTO") {
			_message._automatic = true;
			continue;
		}
		if (s == "COR") {
			_message._corrected = true;
			continue;
		}
		if (isStructuralKeyword(s))
			continue;

		std::optional<Field> field = classify(it, _groups.cend());
		if (!field) {
			_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, s});
			continue;
		}

		if (accumulate(_message, *field))
			continue;

		if (auto temperature = std::get_if<TemperatureReading>(&*field)) {
			if (!hasTemperature) {
				_message._temperature = *temperature;
				hasTemperature = true;
			}
		} else if (auto pressure = std::get_if<Pressure>(&*field)) {
			if (!hasPressure) {
				_message._pressure = *pressure;
				hasPressure = true;
			}
		}
	}
}

bool MetarParser::parse(const std::string& body, const date::sys_seconds& reference)
{
	_message = MetarMessage{};
	_issues.clear();
	_groups = tokenize(body);
	_message._rawText = join(_groups);

	auto it = _groups.cbegin();
	if (!parseHeader(it, reference)) {
		_issues.push_back({DecodingIssue::Kind::EMPTY_OR_TRUNCATED_BODY, ""});
		return false;
	}

	parseBody(it);
	return true;
}

std::optional<MetarMessage> parseMetar(const std::string& body, const date::sys_seconds& reference)
{
	MetarParser parser;
	if (!parser.parse(body, reference))
		return std::optional<MetarMessage>();
	return parser.getDecodedMessage();
}

}
