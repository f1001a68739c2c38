#pragma once
#ifndef zoneshift_fractionnormalizer_h
#define zoneshift_fractionnormalizer_h

#include"zoneshift_pch.hpp"
#include"Raster.hpp"
#include"ZoneMask.hpp"

namespace zoneshift {

	struct NormalizeReport {
		size_t normalizedPixels = 0;
		size_t zeroSumPixels = 0;
	};

	//Rescales the members of a compositional group so that, at each pixel, the members with a value sum to 1.
	//Members missing at a pixel are left out of the sum and keep being missing.
	//A pixel whose sum is exactly zero is left unchanged and counted in zeroSumPixels; a warning is logged if there are any.
	//If region isn't null, only pixels inside it are touched.
	//Every member, and the region, must share one alignment; otherwise AlignmentMismatchException is thrown before anything changes.
	NormalizeReport normalizeGroup(const std::string& group, const std::map<std::string, Raster<double>*>& members, const ZoneMask* region = nullptr);
}

#endif
