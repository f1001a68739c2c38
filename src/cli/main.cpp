#include"zoneshift_pch.hpp"
#include"GDALWrappers.hpp"
#include"Logging.hpp"
#include"Orchestrator.hpp"
#include"PctEngine.hpp"

#include<iomanip>
#include<iostream>

#include<boost/program_options.hpp>

namespace po = boost::program_options;
using namespace zoneshift;

namespace {
	void printSummary(const RunSummary& summary) {
		std::cout << "Mode: " << toString(summary.mode) << "\n";
		for (const LayerOutcome& l : summary.layers) {
			std::cout << std::left << std::setw(24) << l.filename << std::setw(10) << toString(l.status);
			if (!l.outputPath.empty()) {
				std::cout << l.outputPath;
			}
			if (!l.message.empty()) {
				std::cout << (l.outputPath.empty() ? "" : "  ") << l.message;
			}
			std::cout << "\n";
		}
		if (summary.imdBelowBsfPixels) {
			std::cout << "Pixels with IMD < BSF: " << summary.imdBelowBsfPixels.value() << "\n";
		}
	}
}

int main(int argc, char* argv[])
{
	ScenarioConfig config;
	std::vector<double> range;
	std::string zero, outOfBounds, none, crs;
	bool verbose = false;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "Apply zone-based replace/pct rules to rasters.")
		("vector", po::value<std::string>(&config.vectorFile)->required(), "vector mask (.gpkg, .geojson, .json or .shp)")
		("layer", po::value<std::string>(&config.vectorLayer)->default_value(""), "layer of the vector mask; the first if omitted")
		("ucp", po::value<std::string>(&config.ucpFolder)->required(), "folder of the non-fraction rasters")
		("fractions", po::value<std::string>(&config.fractionsFolder)->required(), "folder of the fraction (F_) rasters")
		("rules", po::value<std::string>(&config.ruleFile)->required(), "JSON rule file")
		("output", po::value<std::string>(&config.outputFolder)->required(), "output folder")
		("range", po::value<std::vector<double>>(&range)->multitoken()->composing(),
			"valid range of pct results, as LO HI (default 0 1); write a negative bound as --range=-0.5 --range=1")
		("zero", po::value<std::string>(&zero)->default_value("preserve"), "zero cells under a pct change: preserve, raise or substitute")
		("zero-value", po::value<double>(&config.pctOptions.zeroValue)->default_value(0.01), "what zero cells become with --zero substitute")
		("out-of-bounds", po::value<std::string>(&outOfBounds)->default_value("clip"), "pct results outside the range: clip, normalize or ignore")
		("none", po::value<std::string>(&none)->default_value("zero-change"), "none layers in a pct run: zero-change, pass-through or omit")
		("crs", po::value<std::string>(&crs)->default_value("fail"), "raster/vector CRS mismatch: fail or warn")
		("verbose,v", po::bool_switch(&verbose), "print progress")
		;

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);
		if (vm.count("help")) {
			std::cout << desc << std::endl;
			return 0;
		}
		po::notify(vm);

		if (!range.empty()) {
			if (range.size() != 2) {
				throw po::error("--range takes exactly two values");
			}
			config.pctOptions.lowerBound = range[0];
			config.pctOptions.upperBound = range[1];
		}
		checkPctOptions(config.pctOptions);
		config.pctOptions.zeroHandling = zeroHandlingFromString(zero);
		config.pctOptions.outOfBounds = outOfBoundsHandlingFromString(outOfBounds);
		config.noneHandling = noneLayerHandlingFromString(none);
		config.crsPolicy = crsMismatchPolicyFromString(crs);
	}
	catch (const std::exception& e) {
		std::cerr << e.what() << "\n\n" << desc << std::endl;
		return 2;
	}

	if (verbose) {
		CPLSetConfigOption("CPL_DEBUG", "ON");
	}
	gdalAllRegisterThreadSafe();

	Orchestrator orchestrator{ config };
	try {
		RunSummary summary = orchestrator.run();
		printSummary(summary);
		return summary.exitCode();
	}
	catch (const std::exception& e) {
		std::cerr << "Run failed: " << e.what() << std::endl;
		printSummary(orchestrator.summary());
		return 1;
	}
}
