#include "taf_parser.h"
#include "taf_message.h"
#include "metar_parser.h"
#include "tokenizer.h"
#include "field_extractor.h"
#include "validity_resolver.h"

#include <vector>
#include <string>
#include <regex>
#include <utility>
#include <optional>
#include <iterator>

#include <date/date.h>

namespace aerodata
{

TafParser::TafParser()
{
}

bool TafParser::parseHeader(Iterator& it, const date::sys_seconds& reference)
{
	if (it != _groups.cend() && *it == "TAF")
		++it;

	while (it != _groups.cend() && (*it == "AMD" || *it == "COR")) {
		if (*it == "AMD")
			_message._amended = true;
		else
			_message._corrected = true;
		++it;
	}

	// ICAO
	if (it == _groups.cend() || !isStationIcao(*it))
		return false;
	_message._stationIcao = *it;
	++it;
	if (it == _groups.cend())
		return false;

	// Issuance time
	_message._emissionTime = reference;
	std::optional<DayTime> issuance = parseDayTimeGroup(*it);
	if (issuance) {
		ValidityResolver resolver{reference};
		std::optional<date::sys_seconds> emission = resolver.resolveBeforeReference(*issuance);
		if (emission)
			_message._emissionTime = *emission;
		else
			_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
		++it;
	} else {
		_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
	}

	// Validity period of the whole forecast
	std::optional<std::pair<DayTime, DayTime>> period;
	if (it != _groups.cend())
		period = parsePeriodGroup(*it);
	if (!period) {
		_issues.push_back({DecodingIssue::Kind::MISSING_VALIDITY_GROUP, ""});
		return true;
	}

	ValidityResolver resolver{_message._emissionTime};
	_message._validity = resolver.resolveChangeGroupWindow(period->first, period->second);
	if (!_message._validity)
		_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
	++it;

	return true;
}

std::optional<ForecastSegment> TafParser::openSegment(const std::string& group, const ValidityResolver& resolver)
{
	static const std::regex probability{"PROB(\\d{2})"};
	static const std::regex from{"FM(\\d{2})(\\d{2})(\\d{2})"};

	ForecastSegment segment;
	std::smatch match;

	if (group == "BECMG") {
		segment._type = ForecastSegment::Type::BECMG;
	} else if (group == "TEMPO") {
		segment._type = ForecastSegment::Type::TEMPO;
	} else if (std::regex_match(group, match, probability)) {
		segment._type = ForecastSegment::Type::PROB;
		segment._probability = std::stoi(match[1].str());
	} else if (std::regex_match(group, match, from)) {
		segment._type = ForecastSegment::Type::FM;
		DayTime start{std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str())};
		std::optional<date::sys_seconds> begin = resolver.resolveAfterReference(start);
		if (!begin)
			_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, group});
		// There is no end to a FM group, it lasts until the end of the
		// forecast
		else if (_message._validity && _message._validity->_end > *begin)
			segment._validity = ValidityWindow{*begin, _message._validity->_end};
		return segment;
	} else {
		return std::optional<ForecastSegment>();
	}

	segment._validity = _message._validity;
	return segment;
}

void TafParser::closeSegment(ForecastSegment& segment, const std::vector<std::string>& span)
{
	segment._rawText = join(span);
	_message._segments.push_back(std::move(segment));
}

void TafParser::parseSegments(Iterator& it)
{
	ValidityResolver resolver{_message._emissionTime};

	ForecastSegment current;
	current._type = ForecastSegment::Type::INIT;
	current._validity = _message._validity;
	std::vector<std::string> span;

	while (it != _groups.cend()) {
		const std::string& s = *it;

		std::optional<ForecastSegment> next = openSegment(s, resolver);
		if (next) {
			closeSegment(current, span);
			current = std::move(*next);
			span = {s};
			++it;

			// The optional period of BECMG, TEMPO and PROBnn
			if (current._type != ForecastSegment::Type::FM && it != _groups.cend()) {
				std::optional<std::pair<DayTime, DayTime>> period = parsePeriodGroup(*it);
				if (period) {
					current._validity = resolver.resolveChangeGroupWindow(period->first, period->second);
					if (!current._validity)
						_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, *it});
					span.push_back(*it);
					++it;
				}
			}
			continue;
		}

		Iterator last = it;
		span.push_back(s);

		if (s == "NIL") {
			_message._nil = true;
		} else if (s == "CNL") {
			_message._cancelled = true;
		} else if (!isStructuralKeyword(s)) {
			std::optional<Field> field = classify(last, _groups.cend());
			if (last != it)
				span.push_back(*last);
			if (field)
				accumulate(current, *field);
			else
				_issues.push_back({DecodingIssue::Kind::MALFORMED_TOKEN, s});
		}

		it = std::next(last);
	}

	closeSegment(current, span);
}

bool TafParser::parse(const std::string& body, const date::sys_seconds& reference)
{
	_message = TafMessage{};
	_issues.clear();
	_groups = tokenize(body);
	_message._rawText = join(_groups);

	Iterator it = _groups.cbegin();
	if (!parseHeader(it, reference)) {
		_issues.push_back({DecodingIssue::Kind::EMPTY_OR_TRUNCATED_BODY, ""});
		return false;
	}

	parseSegments(it);
	return true;
}

std::optional<TafMessage> parseTaf(const std::string& body, const date::sys_seconds& reference)
{
	TafParser parser;
	if (!parser.parse(body, reference))
		return std::optional<TafMessage>();
	return parser.getDecodedMessage();
}

}
