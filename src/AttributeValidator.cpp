#include"AttributeValidator.hpp"
#include"GisExceptions.hpp"
#include"Logging.hpp"

namespace zoneshift {

	void validateReplaceAttributes(const std::vector<Zone>& zones, const RuleSet& rules, const ValidationOptions& options)
	{
		std::vector<std::string> replaceKeys;
		std::map<std::string, std::vector<std::string>> groups;
		for (const LayerRule& rule : rules.rules()) {
			if (rule.kind != RuleKind::Replace) {
				continue;
			}
			replaceKeys.push_back(rule.key);
			std::optional<std::string> group = compositionalGroup(rule.key, options.compositionalPrefixes);
			if (group) {
				groups[group.value()].push_back(rule.key);
			}
		}
		if (replaceKeys.empty()) {
			return;
		}

		auto isReplace = [&](const std::string& key) {
			return std::find(replaceKeys.begin(), replaceKeys.end(), key) != replaceKeys.end();
		};
		bool checkImdBsf = isReplace(options.imdKey) && isReplace(options.bsfKey);

		for (const Zone& zone : zones) {
			for (const std::string& key : replaceKeys) {
				double v = zone.attribute(key).value_or(std::numeric_limits<double>::quiet_NaN());
				if (!std::isfinite(v) || v < 0. || v > 1.) {
					throw OutOfRangeAttributeException(zone.index, key, v);
				}
			}

			if (checkImdBsf) {
				double imd = zone.attribute(options.imdKey).value();
				double bsf = zone.attribute(options.bsfKey).value();
				if (imd < bsf) {
					throw LogicalInconsistencyException(zone.index, imd, bsf);
				}
			}

			for (const auto& [group, members] : groups) {
				double sum = 0;
				for (const std::string& key : members) {
					sum += zone.attribute(key).value();
				}
				if (std::abs(sum - 1.) > options.tolerance) {
					throw FractionSumMismatchException(zone.index, group, sum);
				}
			}
		}

		logInfo(CPLSPrintf("Validated %d replace attributes across %d zones", (int)replaceKeys.size(), (int)zones.size()));
	}
}
