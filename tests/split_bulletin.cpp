#include <iostream>
#include <sstream>
#include <string>
#include <chrono>

#include <date/date.h>

#include "../src/noaa_bulletin.h"

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

	{
		std::istringstream file{
			"2024/10/20 12:50\n"
			"EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013\n"
		};
		NoaaBulletin bulletin{file, NoaaBulletin::Product::METAR};
		check(bool(bulletin), "a METAR file is valid");
		check(bulletin.getProduct() == NoaaBulletin::Product::METAR, "product");
		check(bulletin.getStationIcao() == "EGLL", "station");
		check(bulletin.getReferenceTime() == sys_days{2024_y/October/20} + 12h + 50min, "reference time");
		check(bulletin.getBody() == "EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013", "the report is the second line");
	}

	{
		std::istringstream file{
			"2024/10/20 13:00\r\n"
			"METAR LFPG 201300Z 24010KT CAVOK 20/10 Q1018 NOSIG=\r\n"
			"\r\n"
		};
		NoaaBulletin bulletin{file, NoaaBulletin::Product::METAR};
		check(bulletin && bulletin.getStationIcao() == "LFPG", "a METAR file with DOS line endings");
		check(bulletin.getBody() == "METAR LFPG 201300Z 24010KT CAVOK 20/10 Q1018 NOSIG=", "line ending removed");
	}

	{
		std::istringstream file{
			"2024/10/15 17:00\n"
			"TAF EGLL 151700Z 1518/1624 22012KT 9999 BKN030\n"
			"      BECMG 1606/1608 25020G35KT\n"
			"      TEMPO 1610/1614 4000 RA BKN012\n"
		};
		NoaaBulletin bulletin{file, NoaaBulletin::Product::TAF};
		check(bool(bulletin), "a TAF file is valid");
		check(bulletin.getStationIcao() == "EGLL", "TAF station");
		check(bulletin.getReferenceTime() == sys_days{2024_y/October/15} + 17h, "TAF reference time");
		check(bulletin.getBody() ==
		      "TAF EGLL 151700Z 1518/1624 22012KT 9999 BKN030 BECMG 1606/1608 25020G35KT TEMPO 1610/1614 4000 RA BKN012",
		      "the TAF lines are joined");
	}

	{
		std::istringstream file{
			"2024/10/15 17:30\n"
			"TAF AMD\n"
			"      KJFK 151730Z 1518/1624 22012KT P6SM BKN030\n"
		};
		NoaaBulletin bulletin{file, NoaaBulletin::Product::TAF};
		check(bulletin && bulletin.getStationIcao() == "KJFK", "the station of an amended TAF");
	}

	{
		std::istringstream file{"2024/10/20 12:50\n"};
		check(!NoaaBulletin(file, NoaaBulletin::Product::METAR), "a file with a single line is invalid");
	}

	{
		std::istringstream file{""};
		check(!NoaaBulletin(file, NoaaBulletin::Product::TAF), "an empty file is invalid");
	}

	{
		std::istringstream file{
			"yesterday at noon\n"
			"EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013\n"
		};
		check(!NoaaBulletin(file, NoaaBulletin::Product::METAR), "a file without timestamp is invalid");
	}

	{
		std::istringstream file{
			"2024/10/20 12:50\n"
			"12AB 201250Z 24015G25KT 9999 FEW035 18/12 Q1013\n"
		};
		check(!NoaaBulletin(file, NoaaBulletin::Product::METAR), "a file without station is invalid");
	}

	std::cout << (failures ? "FAILED" : "OK") << std::endl;
	return failures ? 1 : 0;
}
