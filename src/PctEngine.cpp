#include"PctEngine.hpp"
#include"GisExceptions.hpp"
#include"Logging.hpp"

namespace zoneshift {

	std::string toString(ZeroHandling z)
	{
		switch (z) {
		case ZeroHandling::Preserve:
			return "preserve";
		case ZeroHandling::Raise:
			return "raise";
		case ZeroHandling::Substitute:
			return "substitute";
		}
		return "unknown";
	}
	std::string toString(OutOfBoundsHandling o)
	{
		switch (o) {
		case OutOfBoundsHandling::Clip:
			return "clip";
		case OutOfBoundsHandling::Normalize:
			return "normalize";
		case OutOfBoundsHandling::Ignore:
			return "ignore";
		}
		return "unknown";
	}
	ZeroHandling zeroHandlingFromString(const std::string& s)
	{
		if (s == "preserve") {
			return ZeroHandling::Preserve;
		}
		if (s == "raise") {
			return ZeroHandling::Raise;
		}
		if (s == "substitute") {
			return ZeroHandling::Substitute;
		}
		throw std::invalid_argument("Unrecognized zero handling '" + s + "'");
	}
	OutOfBoundsHandling outOfBoundsHandlingFromString(const std::string& s)
	{
		if (s == "clip") {
			return OutOfBoundsHandling::Clip;
		}
		if (s == "normalize") {
			return OutOfBoundsHandling::Normalize;
		}
		if (s == "ignore") {
			return OutOfBoundsHandling::Ignore;
		}
		throw std::invalid_argument("Unrecognized out-of-bounds handling '" + s + "'");
	}

	size_t PctReport::totalTouched() const
	{
		size_t out = 0;
		for (const ZonePctStats& z : zones) {
			out += z.touched;
		}
		return out;
	}
	size_t PctReport::totalOutOfRange() const
	{
		size_t out = 0;
		for (const ZonePctStats& z : zones) {
			out += z.outOfRange;
		}
		return out;
	}

	namespace {
		void handleOutOfBounds(Raster<double>& r, const std::vector<cell_t>& touched, const PctOptions& options) {
			double lo = options.lowerBound;
			double hi = options.upperBound;
			switch (options.outOfBounds) {
			case OutOfBoundsHandling::Ignore:
				return;
			case OutOfBoundsHandling::Normalize: {
				double max = std::numeric_limits<double>::lowest();
				for (cell_t cell : touched) {
					max = std::max(max, r[cell].value());
				}
				if (max > hi && max > 0.) {
					double scale = hi / max;
					for (cell_t cell : touched) {
						r[cell].value() *= scale;
					}
				}
				for (cell_t cell : touched) {
					if (r[cell].value() < lo) {
						r[cell].value() = lo;
					}
				}
				return;
			}
			case OutOfBoundsHandling::Clip:
				for (cell_t cell : touched) {
					r[cell].value() = std::clamp(r[cell].value(), lo, hi);
				}
				return;
			}
		}
	}

	void checkPctOptions(const PctOptions& options)
	{
		if (std::isnan(options.lowerBound) || std::isnan(options.upperBound)) {
			throw std::invalid_argument("The bounds of the valid range must be numbers");
		}
		if (options.lowerBound > options.upperBound) {
			throw std::invalid_argument("The lower bound of the valid range (" + formatValue(options.lowerBound)
				+ ") is above the upper bound (" + formatValue(options.upperBound) + ")");
		}
	}

	PctReport applyPct(Raster<double>& r, const std::vector<ZoneValue>& zones, const PctOptions& options, const std::string& layerName)
	{
		checkPctOptions(options);

		PctReport report;
		std::vector<cell_t> touched;
		for (const ZoneValue& zv : zones) {
			if (!r.isSameAlignment(*zv.mask)) {
				throw AlignmentMismatchException("Alignment mismatch in applyPct");
			}
			ZonePctStats stats;
			stats.zone = zv.zone;
			stats.pct = std::isnan(zv.value) ? 0. : zv.value;
			double factor = 1. + stats.pct / 100.;

			touched.clear();
			for (cell_t cell : zv.mask->cells()) {
				if (r[cell].has_value()) {
					touched.push_back(cell);
					if (stats.pct != 0. && r[cell].value() == 0.) {
						++stats.zeroCells;
					}
				}
			}
			stats.touched = touched.size();

			if (stats.zeroCells > 0) {
				logInfo(CPLSPrintf("%s, zone %d: %d zero cells, handled with '%s'",
					layerName.c_str(), (int)zv.zone, (int)stats.zeroCells, toString(options.zeroHandling).c_str()));
			}

			for (cell_t cell : touched) {
				double& v = r[cell].value();
				if (v == 0. && stats.pct != 0. && options.zeroHandling == ZeroHandling::Substitute) {
					v = options.zeroValue;
				}
				v *= factor;
				if (v < options.lowerBound || v > options.upperBound) {
					++stats.outOfRange;
				}
			}

			if (stats.outOfRange > 0) {
				logWarning(CPLSPrintf("%s, zone %d: %d values outside [%s, %s], handled with '%s'",
					layerName.c_str(), (int)zv.zone, (int)stats.outOfRange,
					formatValue(options.lowerBound).c_str(), formatValue(options.upperBound).c_str(),
					toString(options.outOfBounds).c_str()));
				handleOutOfBounds(r, touched, options);
			}
			report.zones.push_back(stats);
		}

		if (options.zeroHandling == ZeroHandling::Raise) {
			throwOnUndefinedChanges(report, layerName);
		}
		return report;
	}

	void throwOnUndefinedChanges(const PctReport& report, const std::string& layerName)
	{
		std::vector<std::pair<size_t, size_t>> zoneCounts;
		for (const ZonePctStats& z : report.zones) {
			if (z.zeroCells > 0) {
				zoneCounts.emplace_back(z.zone, z.zeroCells);
			}
		}
		if (!zoneCounts.empty()) {
			throw UndefinedPercentageChangeException(layerName, std::move(zoneCounts));
		}
	}
}
