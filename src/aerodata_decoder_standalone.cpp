/**
 * @file aerodata_decoder_standalone.cpp
 * @brief Entry point of the aerodata-decoder-standalone program
 * @date 2026-09-28
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
#include <fstream>
#include <string>
#include <vector>
#include <set>
#include <exception>

#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <systemd/sd-daemon.h>

#include "decoder_standalone.h"
#include "noaa_bulletin.h"
#include "record_store.h"
#include "record_serializer.h"
#include "config.h"

/**
 * @brief The configuration file default path
 */
#define DEFAULT_CONFIG_FILE "/etc/aerodata/aerodata.conf"

using namespace aerodata;
namespace po = boost::program_options;

/**
 * @brief Entry point
 *
 * @param argc the number of arguments passed on the command line
 * @param argv the arguments passed on the command line
 *
 * @return 0 if everything went well, 1 for usage errors and 255 otherwise
 */
int main(int argc, char** argv)
{
	std::string fileName;
	std::string outputFile;
	std::vector<std::string> metarFiles;
	std::vector<std::string> tafFiles;
	std::vector<std::string> stations;
	std::vector<std::string> ignoredStations;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help", "display the help message and exit")
		("version", "display the version of Aerodata and exit")
		("config-file", po::value<std::string>(&fileName), "alternative configuration file")
		("metar", po::value<std::vector<std::string>>(&metarFiles), "NOAA station file containing a METAR (repeatable)")
		("taf", po::value<std::vector<std::string>>(&tafFiles), "NOAA station file containing a TAF (repeatable)")
		("output,o", po::value<std::string>(&outputFile), "file to write the decoded reports to, one JSON document per line")
		("verbose,v", "log a summary of each decoded report")
		;

	po::options_description config("Configuration");
	config.add_options()
		("station", po::value<std::vector<std::string>>(&stations), "ICAO code of a station to process, all stations are processed if none is given (repeatable)")
		("ignored-station", po::value<std::vector<std::string>>(&ignoredStations), "ICAO code of a station to skip (repeatable)")
		;
	desc.add(config);

	po::positional_options_description pd;
	pd.add("metar", -1);

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(desc).positional(pd).run(), vm);
		std::ifstream configFile(vm.count("config-file") ? vm["config-file"].as<std::string>() : DEFAULT_CONFIG_FILE);
		if (configFile) {
			po::store(po::parse_config_file(configFile, config, true), vm);
			configFile.close();
		}
		po::notify(vm);
	} catch (po::error& e) {
		std::cerr << e.what() << "\n" << desc << std::endl;
		return 1;
	}

	if (vm.count("help")) {
		std::cout << PACKAGE_STRING"\n";
		std::cout << "Usage: " << argv[0] << " [--metar] file... [--taf file...] [-o output]\n";
		std::cout << desc << "\n";
		return 0;
	}

	if (vm.count("version")) {
		std::cout << VERSION << std::endl;
		return 0;
	}

	if (metarFiles.empty() && tafFiles.empty()) {
		std::cout << PACKAGE_STRING"\n";
		std::cout << "Usage: " << argv[0] << " [--metar] file... [--taf file...] [-o output]\n";
		std::cout << "It's mandatory to give at least one METAR or TAF file." << std::endl;
		return 1;
	}

	try {
		MemoryRecordStore store;
		DecoderStandalone decoder{
			store,
			std::set<std::string>(stations.begin(), stations.end()),
			std::set<std::string>(ignoredStations.begin(), ignoredStations.end()),
			vm.count("verbose") > 0
		};

		for (const std::string& file : metarFiles)
			decoder.process(file, NoaaBulletin::Product::METAR);
		for (const std::string& file : tafFiles)
			decoder.process(file, NoaaBulletin::Product::TAF);

		std::cout << SD_NOTICE << "[DECODER] management: "
			<< "Done! " << decoder.getProcessed() << " bulletins processed: "
			<< decoder.getMetarSuccess() << " METARs and "
			<< decoder.getTafSuccess() << " TAFs decoded" << std::endl;

		if (!outputFile.empty()) {
			std::ofstream output{outputFile};
			if (!output) {
				std::cerr << SD_ERR << "[DECODER] management: "
					<< "Cannot open " << outputFile << " for writing" << std::endl;
				return 255;
			}
			for (auto&& metar : store.getMetars())
				pt::write_json(output, toPropertyTree(metar.second), false);
			for (auto&& taf : store.getCurrentTafIds()) {
				const TafMessage* m = store.getTaf(taf.second);
				if (m)
					pt::write_json(output, toPropertyTree(*m, store.getSegments(taf.second), taf.second), false);
			}
		}
	} catch (std::exception& e) {
		std::cerr << SD_ERR << "[DECODER] management: "
			<< "Aerodata-decoder-standalone met a critical error: " << e.what() << std::endl;
		return 255;
	}

	return 0;
}
