#pragma once
#ifndef zoneshift_gdalwrappers_h
#define zoneshift_gdalwrappers_h

#include"zoneshift_pch.hpp"

namespace zoneshift {

	void gdalAllRegisterThreadSafe();

	struct GDALDatasetDeleter {
		void operator()(GDALDataset* p) const;
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

	struct GDALStringDeleter {
		void operator()(char* p) const;
	};
	using UniqueGdalString = std::unique_ptr<char, GDALStringDeleter>;

	//these return a null pointer if the file can't be opened as the requested type
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename);

	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, GDALDataType gdt);

	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr);

	//reads the geotransform of the dataset, throwing if it is rotated or south-up
	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& errorMessageName);
}

#endif
