#include "field_extractor.h"

#include <string>
#include <regex>
#include <map>
#include <set>
#include <cmath>
#include <algorithm>
#include <optional>
#include <variant>
#include <vector>
#include <iterator>

namespace aerodata
{

namespace
{
using Category = WeatherPhenomenon::Category;

// @see WMO-306 code table 4678
const std::map<std::string, Category> PHENOMENA = {
	{ "DZ",  Category::PRECIPITATION },
	{ "RA",  Category::PRECIPITATION },
	{ "SN",  Category::PRECIPITATION },
	{ "SG",  Category::PRECIPITATION },
	{ "IC",  Category::PRECIPITATION },
	{ "PL",  Category::PRECIPITATION },
	{ "PE",  Category::PRECIPITATION },
	{ "GR",  Category::PRECIPITATION },
	{ "GS",  Category::PRECIPITATION },
	{ "UP",  Category::PRECIPITATION },
	{ "SH",  Category::PRECIPITATION },
	{ "BR",  Category::OBSCURATION },
	{ "FG",  Category::OBSCURATION },
	{ "FU",  Category::OBSCURATION },
	{ "VA",  Category::OBSCURATION },
	{ "DU",  Category::OBSCURATION },
	{ "SA",  Category::OBSCURATION },
	{ "HZ",  Category::OBSCURATION },
	{ "PY",  Category::OBSCURATION },
	{ "PO",  Category::OTHER },
	{ "SQ",  Category::OTHER },
	{ "FC",  Category::OTHER },
	{ "SS",  Category::OTHER },
	{ "DS",  Category::OTHER },
	{ "TS",  Category::OTHER },
	{ "NSW", Category::OTHER }
};

const std::set<std::string> DESCRIPTORS = {
	"MI", "PR", "BC", "DR", "BL", "SH", "TS", "FZ", "RE"
};

const std::set<std::string> KEYWORDS = {
	"BECMG", "TEMPO", "PROB30", "PROB40", "FM", "AMD", "COR", "CNL", "NIL",
	"AUTO", "NOSIG", "METAR", "SPECI", "TAF"
};

// No group of any grammar is longer, "VCSHRASNGS" or "24015G125MPS"
constexpr std::string::size_type MAX_GROUP_LENGTH = 16;

constexpr double HPA_PER_INCH_OF_MERCURY = 33.8639;
constexpr double METERS_PER_STATUTE_MILE = 1609.344;

WindObservation::Unit toUnit(const std::string& unit)
{
	return unit == "MPS" ? WindObservation::Unit::METERS_PER_SECOND : WindObservation::Unit::KNOTS;
}

std::optional<int> toInt(const std::ssub_match& m)
{
	if (!m.matched || m.length() == 0)
		return std::optional<int>();
	return std::stoi(m.str());
}

int milesToMeters(double miles)
{
	return std::min(static_cast<int>(std::lround(miles * METERS_PER_STATUTE_MILE)), UNLIMITED_VISIBILITY);
}

class ConditionsAccumulator
{
public:
	explicit ConditionsAccumulator(SurfaceConditions& conditions) :
		_conditions(conditions)
	{}

	bool operator()(const WindObservation& wind)
	{
		if (_conditions._wind)
			return false;
		_conditions._wind = wind;
		return true;
	}

	bool operator()(const WindVariation& variation)
	{
		if (!_conditions._wind || _conditions._wind->_variableFrom)
			return false;
		_conditions._wind->_variableFrom = variation._from;
		_conditions._wind->_variableTo = variation._to;
		return true;
	}

	bool operator()(const Visibility& visibility)
	{
		if (_conditions._visibility)
			return false;
		_conditions._visibility = visibility._distance;
		return true;
	}

	bool operator()(const ClearSky& clear)
	{
		_conditions._clouds.push_back(clear._layer);
		if (!_conditions._visibility)
			_conditions._visibility = clear._visibility;
		return true;
	}

	bool operator()(const CloudLayer& layer)
	{
		_conditions._clouds.push_back(layer);
		return true;
	}

	bool operator()(const WeatherPhenomenon& phenomenon)
	{
		_conditions._phenomena.push_back(phenomenon);
		return true;
	}

	bool operator()(const TemperatureReading&)
	{
		return false;
	}

	bool operator()(const Pressure&)
	{
		return false;
	}

private:
	SurfaceConditions& _conditions;
};
}

std::optional<WindObservation> extractWind(const std::string& group)
{
	static const std::regex variableWind{"VRB(\\d{2,3})(?:G(\\d{2,3}))?(KT|MPS)"};
	static const std::regex unknownDirection{"///(\\d{2,3})(?:G(\\d{2,3}))?(KT|MPS)"};
	static const std::regex calmWind{"00000(KT|MPS)"};
	static const std::regex directionalWind{"(\\d{3})(\\d{2,3})(?:G(\\d{2,3}))?(KT|MPS)"};

	std::smatch match;
	WindObservation wind;

	if (std::regex_match(group, match, variableWind)) {
		wind._variable = true;
		wind._speed = toInt(match[1]);
		wind._gustSpeed = toInt(match[2]);
		wind._unit = toUnit(match[3].str());
		return wind;
	}

	if (std::regex_match(group, match, unknownDirection)) {
		wind._speed = toInt(match[1]);
		wind._gustSpeed = toInt(match[2]);
		wind._unit = toUnit(match[3].str());
		return wind;
	}

	if (std::regex_match(group, match, calmWind)) {
		wind._direction = 0;
		wind._speed = 0;
		wind._unit = toUnit(match[1].str());
		return wind;
	}

	if (std::regex_match(group, match, directionalWind)) {
		int direction = std::stoi(match[1].str());
		if (direction > 360)
			return std::optional<WindObservation>();
		wind._direction = direction;
		wind._speed = toInt(match[2]);
		wind._gustSpeed = toInt(match[3]);
		wind._unit = toUnit(match[4].str());
		return wind;
	}

	return std::optional<WindObservation>();
}

std::optional<WindVariation> extractWindVariation(const std::string& group)
{
	static const std::regex variation{"(\\d{3})V(\\d{3})"};

	std::smatch match;
	if (!std::regex_match(group, match, variation))
		return std::optional<WindVariation>();

	int from = std::stoi(match[1].str());
	int to = std::stoi(match[2].str());
	if (from > 360 || to > 360)
		return std::optional<WindVariation>();
	return WindVariation{from, to};
}

std::optional<int> extractVisibility(const std::string& group)
{
	static const std::regex meters{"\\d{4}"};
	static const std::regex miles{"(\\d{1,2})SM"};
	static const std::regex fractionOfMile{"(\\d)/(\\d{1,2})SM"};
	static const std::regex mixedMiles{"(\\d) (\\d)/(\\d{1,2})SM"};

	if (group == "CAVOK" || group == "SKC" || group == "CLR" || group == "NSC" || group == "9999")
		return UNLIMITED_VISIBILITY;

	if (std::regex_match(group, meters))
		return std::stoi(group);

	// North-American reports, in statute miles
	if (group == "P6SM")
		return UNLIMITED_VISIBILITY;

	std::smatch match;
	if (std::regex_match(group, match, miles))
		return milesToMeters(std::stoi(match[1].str()));

	if (std::regex_match(group, match, fractionOfMile)) {
		int denominator = std::stoi(match[2].str());
		if (denominator == 0)
			return std::optional<int>();
		return milesToMeters(std::stoi(match[1].str()) / static_cast<double>(denominator));
	}

	// Whole miles and fraction, spanning two groups: "1 1/2SM"
	if (std::regex_match(group, match, mixedMiles)) {
		int denominator = std::stoi(match[3].str());
		if (denominator == 0)
			return std::optional<int>();
		return milesToMeters(std::stoi(match[1].str()) +
			std::stoi(match[2].str()) / static_cast<double>(denominator));
	}

	return std::optional<int>();
}

std::optional<CloudLayer> extractCloudLayer(const std::string& group)
{
	static const std::regex layer{"(FEW|SCT|BKN|OVC)(\\d{3})(CB|TCU)?"};

	if (group == "NSC")
		return CloudLayer{CloudLayer::Coverage::NSC, std::optional<int>(), false};
	if (group == "NCD")
		return CloudLayer{CloudLayer::Coverage::NCD, std::optional<int>(), false};
	if (group == "CLR")
		return CloudLayer{CloudLayer::Coverage::CLR, std::optional<int>(), false};
	if (group == "SKC")
		return CloudLayer{CloudLayer::Coverage::SKC, std::optional<int>(), false};

	std::smatch match;
	if (!std::regex_match(group, match, layer))
		return std::optional<CloudLayer>();

	CloudLayer result;
	const std::string coverage = match[1].str();
	result._coverage =
		coverage == "FEW" ? CloudLayer::Coverage::FEW :
		coverage == "SCT" ? CloudLayer::Coverage::SCT :
		coverage == "BKN" ? CloudLayer::Coverage::BKN :
		                    CloudLayer::Coverage::OVC;
	result._baseHeight = std::stoi(match[2].str()) * 100; // given in hundreds of feet
	result._convective = match[3].matched;
	return result;
}

WeatherPhenomenon::Category categorize(const std::string& code, bool vicinity)
{
	if (vicinity)
		return Category::VICINITY;

	auto it = PHENOMENA.find(code);
	if (it != PHENOMENA.end())
		return it->second;

	// Descriptors come first (SH, TS, FZ...), the phenomenon itself
	// decides of the category
	for (std::string::size_type i = 0 ; i + 1 < code.size() ; i += 2) {
		std::string pair = code.substr(i, 2);
		if (DESCRIPTORS.count(pair))
			continue;
		it = PHENOMENA.find(pair);
		if (it != PHENOMENA.end())
			return it->second;
	}

	// Only descriptors (VCSH without its prefix, TSGS...), use the first one
	it = PHENOMENA.find(code.substr(0, 2));
	if (code.size() % 2 == 0 && it != PHENOMENA.end())
		return it->second;

	return Category::UNKNOWN;
}

bool isStructuralKeyword(const std::string& group)
{
	return KEYWORDS.count(group) > 0;
}

std::optional<WeatherPhenomenon> extractWeatherPhenomenon(const std::string& group)
{
	static const std::regex phenomenon{"(\\+|-|VC)?([A-Z]{2,})"};

	if (group.empty() || group.size() > MAX_GROUP_LENGTH || group[0] == 'Q' || group[0] == 'A' || group.compare(0, 3, "RMK") == 0)
		return std::optional<WeatherPhenomenon>();
	if (isStructuralKeyword(group))
		return std::optional<WeatherPhenomenon>();

	std::smatch match;
	if (!std::regex_match(group, match, phenomenon))
		return std::optional<WeatherPhenomenon>();

	WeatherPhenomenon result;
	result._code = match[2].str();
	if (match[1].matched) {
		const std::string prefix = match[1].str();
		result._intensity =
			prefix == "-" ? WeatherPhenomenon::Intensity::LIGHT :
			prefix == "+" ? WeatherPhenomenon::Intensity::HEAVY :
			                WeatherPhenomenon::Intensity::VICINITY;
	}
	result._category = categorize(result._code,
		result._intensity == WeatherPhenomenon::Intensity::VICINITY);
	return result;
}

std::optional<TemperatureReading> extractTemperature(const std::string& group)
{
	// the dew point may be missing: "18/", "18//" or "18///"
	static const std::regex temperature{"(M)?(\\d{1,2})/(?:(M)?(\\d{1,2})|/{0,2})"};

	std::smatch match;
	if (!std::regex_match(group, match, temperature))
		return std::optional<TemperatureReading>();

	TemperatureReading result;
	result._airTemperature = toInt(match[2]);
	if (match[1].matched)
		*result._airTemperature *= -1;
	result._dewPoint = toInt(match[4]);
	if (result._dewPoint && match[3].matched)
		*result._dewPoint *= -1;
	return result;
}

std::optional<Pressure> extractPressure(const std::string& group)
{
	static const std::regex hectopascals{"Q(\\d{4})"};
	static const std::regex inchesOfMercury{"A(\\d{4})"};

	std::smatch match;
	if (std::regex_match(group, match, hectopascals))
		return Pressure{std::stoi(match[1].str())};

	if (std::regex_match(group, match, inchesOfMercury)) {
		double inches = std::stoi(match[1].str()) / 100.;
		return Pressure{static_cast<int>(std::lround(inches * HPA_PER_INCH_OF_MERCURY))};
	}

	return std::optional<Pressure>();
}

std::optional<Field> classify(const std::string& group)
{
	if (group.size() > MAX_GROUP_LENGTH)
		return std::optional<Field>();

	if (auto wind = extractWind(group))
		return Field{*wind};

	// must come before the visibility, dddVddd is not a distance
	if (auto variation = extractWindVariation(group))
		return Field{*variation};

	if (auto visibility = extractVisibility(group)) {
		if (auto layer = extractCloudLayer(group))
			return Field{ClearSky{*layer, *visibility}};
		return Field{Visibility{*visibility}};
	}

	if (auto layer = extractCloudLayer(group))
		return Field{*layer};

	if (auto phenomenon = extractWeatherPhenomenon(group))
		return Field{*phenomenon};

	if (auto temperature = extractTemperature(group))
		return Field{*temperature};

	if (auto pressure = extractPressure(group))
		return Field{*pressure};

	return std::optional<Field>();
}

std::optional<Field> classify(std::vector<std::string>::const_iterator& it,
	std::vector<std::string>::const_iterator end)
{
	auto next = std::next(it);
	if (next != end && it->size() == 1) {
		if (auto visibility = extractVisibility(*it + ' ' + *next)) {
			it = next;
			return Field{Visibility{*visibility}};
		}
	}

	return classify(*it);
}

bool accumulate(SurfaceConditions& conditions, const Field& field)
{
	return std::visit(ConditionsAccumulator{conditions}, field);
}

}
