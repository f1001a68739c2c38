#include"LayerRules.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	std::string toString(RuleKind kind)
	{
		switch (kind) {
		case RuleKind::Replace:
			return "replace";
		case RuleKind::Pct:
			return "pct";
		case RuleKind::None:
			return "none";
		}
		return "unknown";
	}
	std::string toString(ProcessingMode mode)
	{
		switch (mode) {
		case ProcessingMode::Skip:
			return "Skip";
		case ProcessingMode::Replace:
			return "Replace";
		case ProcessingMode::ProportionalUniform:
			return "ProportionalUniform";
		case ProcessingMode::ProportionalMixed:
			return "ProportionalMixed";
		case ProcessingMode::InvalidMix:
			return "InvalidMix";
		}
		return "unknown";
	}

	RuleKind ruleKindFromString(const std::string& s)
	{
		if (s == "replace" || s == "mask") {
			return RuleKind::Replace;
		}
		if (s == "pct") {
			return RuleKind::Pct;
		}
		if (s == "none") {
			return RuleKind::None;
		}
		throw InvalidRuleFileException("Unrecognized rule '" + s + "'; expected replace, pct or none");
	}

	std::string layerKeyFromFilename(const std::string& filename)
	{
		std::string stem = std::filesystem::path(filename).stem().string();
		std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) { return (char)std::toupper(c); });
		return stem;
	}

	const std::vector<std::string>& defaultCompositionalPrefixes()
	{
		static const std::vector<std::string> prefixes = { "F_" };
		return prefixes;
	}

	std::optional<std::string> compositionalGroup(const std::string& key, const std::vector<std::string>& prefixes)
	{
		for (const std::string& prefix : prefixes) {
			if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
				std::string group = prefix;
				while (!group.empty() && group.back() == '_') {
					group.pop_back();
				}
				return group.empty() ? prefix : group;
			}
		}
		return std::nullopt;
	}

	std::string LayerRule::fileOnDisk() const
	{
		if (std::filesystem::path(filename).has_extension()) {
			return filename;
		}
		return filename + ".tif";
	}

	RuleSet RuleSet::fromJsonFile(const std::string& path)
	{
		CPLJSONDocument doc;
		if (!doc.Load(path)) {
			throw InvalidRuleFileException("Unable to read " + path + " as JSON");
		}
		return _fromJsonObject(doc.GetRoot(), path);
	}
	RuleSet RuleSet::fromJsonString(const std::string& text)
	{
		CPLJSONDocument doc;
		if (!doc.LoadMemory(text)) {
			throw InvalidRuleFileException("Rule text is not valid JSON");
		}
		return _fromJsonObject(doc.GetRoot(), "rule text");
	}

	void RuleSet::addRule(const std::string& filename, RuleKind kind)
	{
		std::string key = layerKeyFromFilename(filename);
		if (key.empty()) {
			throw InvalidRuleFileException("Empty layer name in rule file");
		}
		if (findByKey(key)) {
			throw InvalidRuleFileException("Layer " + key + " has more than one rule");
		}
		_rules.push_back(LayerRule{ filename, key, kind });
	}

	const std::vector<LayerRule>& RuleSet::rules() const
	{
		return _rules;
	}
	size_t RuleSet::size() const
	{
		return _rules.size();
	}
	bool RuleSet::empty() const
	{
		return _rules.empty();
	}
	std::set<RuleKind> RuleSet::kinds() const
	{
		std::set<RuleKind> out;
		for (const LayerRule& r : _rules) {
			out.insert(r.kind);
		}
		return out;
	}
	const LayerRule* RuleSet::findByKey(const std::string& key) const
	{
		for (const LayerRule& r : _rules) {
			if (r.key == key) {
				return &r;
			}
		}
		return nullptr;
	}

	RuleSet RuleSet::_fromJsonObject(const CPLJSONObject& root, const std::string& sourceName)
	{
		if (root.GetType() != CPLJSONObject::Type::Object) {
			throw InvalidRuleFileException(sourceName + " must contain a JSON object");
		}
		RuleSet out;
		for (const CPLJSONObject& child : root.GetChildren()) {
			switch (child.GetType()) {
			case CPLJSONObject::Type::Null:
				out.addRule(child.GetName(), RuleKind::None);
				break;
			case CPLJSONObject::Type::String:
				out.addRule(child.GetName(), ruleKindFromString(child.ToString()));
				break;
			default:
				throw InvalidRuleFileException("The rule for " + child.GetName() + " in " + sourceName + " must be a string or null");
			}
		}
		return out;
	}

	ProcessingMode classify(const RuleSet& rules)
	{
		std::set<RuleKind> kinds = rules.kinds();
		bool hasReplace = kinds.contains(RuleKind::Replace);
		bool hasPct = kinds.contains(RuleKind::Pct);
		bool hasNone = kinds.contains(RuleKind::None);

		if (hasReplace) {
			return (hasPct || hasNone) ? ProcessingMode::InvalidMix : ProcessingMode::Replace;
		}
		if (hasPct) {
			return hasNone ? ProcessingMode::ProportionalMixed : ProcessingMode::ProportionalUniform;
		}
		return ProcessingMode::Skip;
	}

	ProcessingMode requireCoherentMode(const RuleSet& rules)
	{
		ProcessingMode mode = classify(rules);
		if (mode == ProcessingMode::InvalidMix) {
			std::vector<std::string> kinds;
			for (RuleKind k : rules.kinds()) {
				kinds.push_back(toString(k));
			}
			std::string message = "Rule conflict: replace rules cannot be mixed with";
			bool first = true;
			for (const std::string& k : kinds) {
				if (k == "replace") {
					continue;
				}
				message += (first ? " " : " or ") + k;
				first = false;
			}
			message += " rules; use replace everywhere or pct/none only";
			throw RuleConflictException(message, kinds);
		}
		return mode;
	}
}
