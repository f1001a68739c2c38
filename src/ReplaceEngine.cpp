#include"ReplaceEngine.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	size_t applyReplace(Raster<double>& r, const std::vector<ZoneValue>& zones)
	{
		size_t written = 0;
		for (const ZoneValue& zv : zones) {
			if (!r.isSameAlignment(*zv.mask)) {
				throw AlignmentMismatchException("Alignment mismatch in applyReplace");
			}
			if (std::isnan(zv.value)) {
				continue;
			}
			for (cell_t cell : zv.mask->cells()) {
				if (r[cell].has_value()) {
					r[cell].value() = zv.value;
					++written;
				}
			}
		}
		return written;
	}
}
