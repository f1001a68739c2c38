#pragma once
#ifndef zoneshift_attributevalidator_h
#define zoneshift_attributevalidator_h

#include"zoneshift_pch.hpp"
#include"LayerRules.hpp"
#include"Zone.hpp"

namespace zoneshift {

	struct ValidationOptions {
		double tolerance = 1e-6; //absolute, on the sum of a compositional group
		std::string imdKey = "IMD";
		std::string bsfKey = "BSF";
		std::vector<std::string> compositionalPrefixes = defaultCompositionalPrefixes();
	};

	//Checks the zone attributes that replace rules will write, zone by zone in zone order, and throws on the first violation:
	//OutOfRangeAttributeException if a value is absent, non-finite, or outside [0,1]
	//LogicalInconsistencyException if impervious density is below building surface fraction
	//FractionSumMismatchException if a compositional group doesn't sum to 1
	//Only replace rules are considered; it's a no-op for rule sets without any.
	void validateReplaceAttributes(const std::vector<Zone>& zones, const RuleSet& rules, const ValidationOptions& options = ValidationOptions());
}

#endif
