#pragma once
#ifndef zoneshift_layerrules_h
#define zoneshift_layerrules_h

#include"zoneshift_pch.hpp"

namespace zoneshift {

	enum class RuleKind {
		Replace, Pct, None
	};

	enum class ProcessingMode {
		Skip, Replace, ProportionalUniform, ProportionalMixed, InvalidMix
	};

	std::string toString(RuleKind kind);
	std::string toString(ProcessingMode mode);

	//"replace" (or the older "mask"), "pct" and "none"; anything else throws InvalidRuleFileException
	RuleKind ruleKindFromString(const std::string& s);

	//The key of a layer is its filename without directories or extension, upper-cased: "data/f_ac.tif" -> "F_AC"
	std::string layerKeyFromFilename(const std::string& filename);

	//Layers whose key starts with one of the prefixes belong to a compositional group named after the prefix,
	//without its trailing underscore: with the default prefix "F_", F_AC and F_WAT are both in group "F"
	const std::vector<std::string>& defaultCompositionalPrefixes();
	std::optional<std::string> compositionalGroup(const std::string& key, const std::vector<std::string>& prefixes);

	struct LayerRule {
		std::string filename; //as it was written in the rule file
		std::string key;
		RuleKind kind;

		//the filename with .tif appended if the rule file omitted the extension
		std::string fileOnDisk() const;
	};

	//The per-layer rules of a run, in the order the rule file declared them.
	class RuleSet {
	public:
		RuleSet() = default;

		//The rule file is a JSON object mapping raster filenames to "replace", "pct", "none" or null
		static RuleSet fromJsonFile(const std::string& path);
		static RuleSet fromJsonString(const std::string& text);

		//throws InvalidRuleFileException if another rule already has the same key
		void addRule(const std::string& filename, RuleKind kind);

		const std::vector<LayerRule>& rules() const;
		size_t size() const;
		bool empty() const;

		std::set<RuleKind> kinds() const;
		const LayerRule* findByKey(const std::string& key) const;

	private:
		std::vector<LayerRule> _rules;

		static RuleSet _fromJsonObject(const CPLJSONObject& root, const std::string& sourceName);
	};

	//Derives the single processing mode of a run from the declared rules alone; the files on disk play no part.
	//An empty rule set is Skip.
	ProcessingMode classify(const RuleSet& rules);

	//classify, but an InvalidMix throws RuleConflictException
	ProcessingMode requireCoherentMode(const RuleSet& rules);
}

#endif
