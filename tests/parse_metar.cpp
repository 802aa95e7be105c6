#include <iostream>
#include <string>
#include <chrono>
#include <algorithm>

#include <date/date.h>

#include "../src/aviation_decoder/metar_parser.h"
#include "../src/aviation_decoder/metar_message.h"

using namespace aerodata;
using namespace date;
using namespace std::chrono;

int main()
{
	int failures = 0;
	auto check = [&failures](bool condition, const std::string& what) {
		std::cout << what << ": " << std::boolalpha << condition << "\n";
		if (!condition)
			failures++;
	};

	const sys_seconds reference = sys_days{2024_y/October/20} + 12h + 53min;

	{
		auto metar = parseMetar("EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013", reference);
		check(bool(metar), "a complete METAR is decoded");
		if (metar) {
			check(metar->_kind == MetarMessage::Kind::METAR, "kind");
			check(metar->_stationIcao == "EGLL", "station");
			check(metar->_observationTime == sys_days{2024_y/October/20} + 12h + 50min, "observation time");
			check(metar->_wind && metar->_wind->_direction == 240 && metar->_wind->_speed == 15 &&
			      metar->_wind->_gustSpeed == 25 && metar->_wind->_unit == WindObservation::Unit::KNOTS, "wind");
			check(metar->_visibility == 9999, "visibility");
			check(metar->_clouds.size() == 1 && metar->_clouds[0]._coverage == CloudLayer::Coverage::FEW &&
			      metar->_clouds[0]._baseHeight == 3500 && !metar->_clouds[0]._convective, "clouds");
			check(metar->_phenomena.empty(), "no weather");
			check(metar->_temperature._airTemperature == 18 && metar->_temperature._dewPoint == 12, "temperatures");
			check(metar->_pressure._qnh == 1013, "pressure");
			check(!metar->_automatic && !metar->_corrected, "flags");
			check(metar->_rawText == "EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013", "raw text");
		}
	}

	{
		auto metar = parseMetar("METAR KJFK 201251Z 31008KT 10SM -RA BKN250 OVC300 M02/M07 A2992 RMK AO2 SLP135 T10221072=", reference);
		check(bool(metar), "a North-American METAR is decoded");
		if (metar) {
			check(metar->_visibility == 9999, "ten miles");
			check(metar->_phenomena.size() == 1 && metar->_phenomena[0]._code == "RA" &&
			      metar->_phenomena[0]._intensity == WeatherPhenomenon::Intensity::LIGHT, "light rain");
			check(metar->_clouds.size() == 2, "two layers");
			check(metar->_temperature._airTemperature == -2 && metar->_temperature._dewPoint == -7, "negative temperatures");
			check(metar->_pressure._qnh == 1013, "altimeter setting in hPa");
		}
		MetarParser parser;
		parser.parse("METAR KJFK 201251Z 31008KT 10SM -RA BKN250 OVC300 M02/M07 A2992 RMK AO2 SLP135 T10221072=", reference);
		check(parser.getIssues().empty(), "the remarks are not decoded");
	}

	{
		auto metar = parseMetar("SPECI COR LFPG 201300Z AUTO VRB02KT 0800 FG NCD 05/05 Q1020", reference);
		check(bool(metar), "a SPECI is decoded");
		if (metar) {
			check(metar->_kind == MetarMessage::Kind::SPECI, "special report");
			check(metar->_stationIcao == "LFPG", "station after COR");
			check(metar->_automatic && metar->_corrected, "automatic and corrected");
			check(metar->_wind && metar->_wind->_variable && !metar->_wind->_direction, "variable wind");
			check(metar->_visibility == 800, "fog visibility");
			check(metar->_phenomena.size() == 1 &&
			      metar->_phenomena[0]._category == WeatherPhenomenon::Category::OBSCURATION, "fog");
			check(metar->_clouds.size() == 1 && metar->_clouds[0]._coverage == CloudLayer::Coverage::NCD, "no cloud detected");
		}
	}

	{
		auto metar = parseMetar("LFBO 201300Z 24010KT 210V270 CAVOK 20/10 Q1018 NOSIG", reference);
		check(bool(metar), "a CAVOK METAR is decoded");
		if (metar) {
			check(metar->_wind && metar->_wind->_variableFrom == 210 && metar->_wind->_variableTo == 270, "wind sector");
			check(metar->_visibility == 9999 && metar->_clouds.empty(), "ceiling and visibility OK");
		}
	}

	{
		auto metar = parseMetar("EGLL 312350Z 24015KT 9999 FEW035 08/02 Q1013", sys_days{2024_y/November/1} + 5min);
		check(metar && metar->_observationTime == sys_days{2024_y/October/31} + 23h + 50min,
		      "an observation at the end of the previous month");
	}

	{
		MetarParser parser;
		check(parser.parse("EGLL 201250Z 24015KT XYZ9 9999 18/12 Q1013", reference), "a bad group does not stop the decoding");
		const auto& issues = parser.getIssues();
		check(std::any_of(issues.cbegin(), issues.cend(), [](const DecodingIssue& issue) {
			return issue._kind == DecodingIssue::Kind::MALFORMED_TOKEN && issue._group == "XYZ9";
		}), "the bad group is reported");
		check(parser.getDecodedMessage()._visibility == 9999, "the groups after the bad one are decoded");
	}

	{
		auto metar = parseMetar("LFBO 201300Z 24010KT 9999 FEW030 15/10 Q1018 TEMPO 3000 +SHRA BKN010CB", reference);
		check(bool(metar), "a METAR with a trend is decoded");
		if (metar) {
			check(metar->_clouds.size() == 1 && !metar->_clouds[0]._convective, "only the observed clouds");
			check(metar->_phenomena.empty(), "no forecast weather in the observation");
			check(metar->_visibility == 9999, "the observed visibility");
		}
		metar = parseMetar("LFBO 201300Z 24010KT 9999 FEW030 15/10 Q1018 BECMG 18015KT", reference);
		check(metar && metar->_wind && metar->_wind->_direction == 240, "a BECMG trend is not observed");
	}

	{
		auto metar = parseMetar("KJFK 201251Z 31008KT 1 1/2SM BR OVC005 12/11 A2992", reference);
		check(metar && metar->_visibility == 2414, "visibility in miles and fraction");
		MetarParser parser;
		parser.parse("KJFK 201251Z 31008KT 1 1/2SM BR OVC005 12/11 A2992", reference);
		check(parser.getIssues().empty(), "the whole miles group is not reported");
	}

	{
		auto metar = parseMetar("EGLL 201250Z 24015KT 18010KT 18/12 17/11 Q1013 Q1020", reference);
		check(metar && metar->_wind->_direction == 240 && metar->_temperature._airTemperature == 18 &&
		      metar->_pressure._qnh == 1013, "the first value of a field wins");
	}

	{
		auto metar = parseMetar("EGLL 201250Z", reference);
		check(metar && !metar->_wind && !metar->_visibility && !metar->_pressure._qnh, "a METAR without body fields");
	}

	check(!parseMetar("", reference), "an empty body is rejected");
	check(!parseMetar("METAR", reference), "a lone marker is rejected");
	check(!parseMetar("EGLL", reference), "a body without the time group is rejected");
	check(!parseMetar("12345 201250Z 24015KT", reference), "a body without a station is rejected");

	MetarParser parser;
	parser.parse("EGLL", reference);
	check(!parser.getIssues().empty() &&
	      parser.getIssues().back()._kind == DecodingIssue::Kind::EMPTY_OR_TRUNCATED_BODY, "the truncation is reported");

	std::cout << (failures ? "FAILED" : "OK") << std::endl;
	return failures ? 1 : 0;
}
