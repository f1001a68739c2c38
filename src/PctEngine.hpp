#pragma once
#ifndef zoneshift_pctengine_h
#define zoneshift_pctengine_h

#include"zoneshift_pch.hpp"
#include"Raster.hpp"
#include"ZoneMask.hpp"

namespace zoneshift {

	//What to do with cells that are exactly zero when a non-zero change reaches them
	enum class ZeroHandling {
		Preserve, //leave them at zero; multiplying zero is a no-op anyway
		Raise, //leave them at zero, then throw UndefinedPercentageChangeException once every zone has been applied
		Substitute //replace them with zeroValue, then apply the change
	};

	//What to do with the cells a zone touched whose new value falls outside the valid range
	enum class OutOfBoundsHandling {
		Clip,
		Normalize, //scale the zone's touched cells down so their maximum is the upper bound, then clip the lower bound
		Ignore
	};

	std::string toString(ZeroHandling z);
	std::string toString(OutOfBoundsHandling o);
	ZeroHandling zeroHandlingFromString(const std::string& s);
	OutOfBoundsHandling outOfBoundsHandlingFromString(const std::string& s);

	struct PctOptions {
		ZeroHandling zeroHandling = ZeroHandling::Preserve;
		double zeroValue = 0.01;
		OutOfBoundsHandling outOfBounds = OutOfBoundsHandling::Clip;
		double lowerBound = 0.;
		double upperBound = 1.;
	};

	//throws std::invalid_argument if the valid range is empty or not a pair of numbers
	void checkPctOptions(const PctOptions& options);

	struct ZonePctStats {
		size_t zone = 0;
		double pct = 0;
		size_t touched = 0;
		size_t zeroCells = 0; //zero-valued cells that a non-zero change reached
		size_t outOfRange = 0; //counted before the out-of-bounds policy was applied
	};

	struct PctReport {
		std::vector<ZonePctStats> zones;

		size_t totalTouched() const;
		size_t totalOutOfRange() const;
	};

	//Multiplies every valid cell under each mask by (1 + pct/100), zones applied one after another in the given order,
	//so a cell covered by several zones receives every change cumulatively. A NaN pct is a 0% change.
	//Missing cells are never modified. layerName is only used in messages.
	//Under ZeroHandling::Raise the exception lists every zone that reached zero cells; r has been changed by then
	//and shouldn't be written.
	PctReport applyPct(Raster<double>& r, const std::vector<ZoneValue>& zones, const PctOptions& options, const std::string& layerName);

	//throws one UndefinedPercentageChangeException covering every zone of report with zeroCells > 0
	void throwOnUndefinedChanges(const PctReport& report, const std::string& layerName);
}

#endif
