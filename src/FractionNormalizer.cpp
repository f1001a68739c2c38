#include"FractionNormalizer.hpp"
#include"GisExceptions.hpp"
#include"Logging.hpp"

namespace zoneshift {

	NormalizeReport normalizeGroup(const std::string& group, const std::map<std::string, Raster<double>*>& members, const ZoneMask* region)
	{
		NormalizeReport report;
		if (members.empty()) {
			return report;
		}

		const Alignment& a = *members.begin()->second;
		for (const auto& [key, r] : members) {
			if (!a.isSameAlignment(*r)) {
				throw AlignmentMismatchException("Layer " + key + " doesn't share the alignment of group " + group);
			}
		}
		if (region && !a.isSameAlignment(*region)) {
			throw AlignmentMismatchException("The normalization region doesn't share the alignment of group " + group);
		}

		auto normalizeCell = [&](cell_t cell) {
			double sum = 0;
			bool anyValue = false;
			for (const auto& [key, r] : members) {
				auto v = (*r)[cell];
				if (v.has_value()) {
					sum += v.value();
					anyValue = true;
				}
			}
			if (!anyValue) {
				return;
			}
			if (sum == 0.) {
				++report.zeroSumPixels;
				return;
			}
			for (const auto& [key, r] : members) {
				auto v = (*r)[cell];
				if (v.has_value()) {
					v.value() /= sum;
				}
			}
			++report.normalizedPixels;
		};

		if (region) {
			for (cell_t cell : region->cells()) {
				normalizeCell(cell);
			}
		}
		else {
			for (cell_t cell = 0; cell < a.ncell(); ++cell) {
				normalizeCell(cell);
			}
		}

		if (report.zeroSumPixels > 0) {
			logWarning(CPLSPrintf("Group %s: %d pixels sum to zero and were left unnormalized", group.c_str(), (int)report.zeroSumPixels));
		}
		logInfo(CPLSPrintf("Group %s: normalized %d pixels across %d layers", group.c_str(), (int)report.normalizedPixels, (int)members.size()));
		return report;
	}
}
