#pragma once
#ifndef zoneshift_scenarioconfig_h
#define zoneshift_scenarioconfig_h

#include"zoneshift_pch.hpp"
#include"AttributeValidator.hpp"
#include"PctEngine.hpp"

namespace zoneshift {

	//What happens to a standalone layer whose rule is none, in a run that has pct rules.
	//Compositional members with a none rule always take part in their group's normalization.
	enum class NoneLayerHandling {
		ZeroChange, //processed as a 0% change and written like the pct layers
		PassThrough, //copied to the output folder under its input name
		Omit //not written at all
	};

	enum class CrsMismatchPolicy {
		Fail, Warn
	};

	std::string toString(NoneLayerHandling n);
	std::string toString(CrsMismatchPolicy c);
	NoneLayerHandling noneLayerHandlingFromString(const std::string& s);
	CrsMismatchPolicy crsMismatchPolicyFromString(const std::string& s);

	//Everything a run needs. Layers with a compositional prefix (see validation.compositionalPrefixes)
	//are read from fractionsFolder, everything else from ucpFolder.
	struct ScenarioConfig {
		std::string vectorFile;
		std::string vectorLayer; //empty for the first layer
		std::string ucpFolder;
		std::string fractionsFolder;
		std::string ruleFile;
		std::string outputFolder;

		PctOptions pctOptions;
		ValidationOptions validation;
		NoneLayerHandling noneHandling = NoneLayerHandling::ZeroChange;
		CrsMismatchPolicy crsPolicy = CrsMismatchPolicy::Fail;

		std::string driver = "GTiff";
		std::string replaceSuffix = "_mask";
		std::string pctSuffix = "_pct";
	};
}

#endif
