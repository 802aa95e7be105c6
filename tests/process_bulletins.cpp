#include <iostream>
#include <sstream>
#include <string>
#include <set>

#include "../src/decoder_standalone.h"
#include "../src/noaa_bulletin.h"
#include "../src/record_store.h"

using namespace aerodata;

namespace
{
const std::string EGLL_METAR =
	"2024/10/20 12:50\n"
	"EGLL 201250Z 24015G25KT 9999 FEW035 18/12 Q1013\n";

const std::string LFPG_METAR =
	"2024/10/20 13:00\n"
	"LFPG 201300Z 24010KT CAVOK 20/10 Q1018 NOSIG\n";

const std::string EGLL_TAF =
	"2024/10/15 17:00\n"
	"TAF EGLL 151700Z 1518/1624 22012KT 9999 BKN030\n"
	"      BECMG 1606/1608 25020G35KT\n";

bool process(DecoderStandalone& decoder, const std::string& content, NoaaBulletin::Product product)
{
	std::istringstream input{content};
	return decoder.process(input, product, "test");
}
}

int main()
{
	int failures = 0;
	auto check = [&failures](bool condition, const std::string& what) {
		std::cout << what << ": " << std::boolalpha << condition << "\n";
		if (!condition)
			failures++;
	};

	{
		MemoryRecordStore store;
		DecoderStandalone decoder{store, {}, {}, true};
		check(process(decoder, EGLL_METAR, NoaaBulletin::Product::METAR), "a METAR is decoded");
		check(process(decoder, LFPG_METAR, NoaaBulletin::Product::METAR), "another METAR is decoded");
		check(process(decoder, EGLL_TAF, NoaaBulletin::Product::TAF), "a TAF is decoded");
		check(!process(decoder, "2024/10/20 12:50\n", NoaaBulletin::Product::METAR), "an invalid bulletin is discarded");
		check(decoder.getProcessed() == 3, "invalid bulletins are not counted as processed");
		check(decoder.getMetarSuccess() == 2 && decoder.getTafSuccess() == 1, "success counters");
		check(store.getMetars().size() == 2 && store.getCurrentTafId("EGLL"), "the reports reach the store");
	}

	{
		MemoryRecordStore store;
		DecoderStandalone decoder{store, {"EGLL"}, {}, false};
		check(process(decoder, EGLL_METAR, NoaaBulletin::Product::METAR), "a listed station is processed");
		check(!process(decoder, LFPG_METAR, NoaaBulletin::Product::METAR), "a station not listed is skipped");
		check(decoder.getProcessed() == 1 && decoder.getMetarSuccess() == 1, "skipped stations are not counted");
		check(store.getMetar("EGLL") && !store.getMetar("LFPG"), "only the listed station is stored");
	}

	{
		MemoryRecordStore store;
		DecoderStandalone decoder{store, {"EGLL", "LFPG"}, {"LFPG"}, false};
		check(process(decoder, EGLL_METAR, NoaaBulletin::Product::METAR), "a listed station is processed");
		check(!process(decoder, LFPG_METAR, NoaaBulletin::Product::METAR), "an ignored station is skipped even if listed");
		check(store.getMetars().size() == 1, "the ignored station is not stored");
	}

	{
		MemoryRecordStore store;
		DecoderStandalone decoder{store, {}, {"EGLL"}, false};
		check(!process(decoder, EGLL_TAF, NoaaBulletin::Product::TAF), "an ignored station is skipped");
		check(process(decoder, LFPG_METAR, NoaaBulletin::Product::METAR), "other stations are processed");
		check(decoder.getTafSuccess() == 0 && decoder.getMetarSuccess() == 1, "counters with ignored stations");
	}

	{
		MemoryRecordStore store;
		DecoderStandalone decoder{store, {}, {}, false};
		check(!decoder.process("/nonexistent/EGLL.TXT", NoaaBulletin::Product::METAR), "a missing file is reported");
		check(decoder.getProcessed() == 0, "a missing file is not processed");
	}

	std::cout << (failures ? "FAILED" : "OK") << std::endl;
	return failures ? 1 : 0;
}
