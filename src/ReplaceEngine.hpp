#pragma once
#ifndef zoneshift_replaceengine_h
#define zoneshift_replaceengine_h

#include"zoneshift_pch.hpp"
#include"Raster.hpp"
#include"ZoneMask.hpp"

namespace zoneshift {

	//Overwrites every valid cell under each mask with that zone's value, in the given order, so the last zone wins where they overlap.
	//Missing cells are never written, and values are written as they are; range checking is the validator's job.
	//Zones whose value is NaN are skipped. Returns the number of cell writes.
	size_t applyReplace(Raster<double>& r, const std::vector<ZoneValue>& zones);
}

#endif
