#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	void gdalAllRegisterThreadSafe()
	{
		static std::once_flag flag;
		std::call_once(flag, []() {
			GDALAllRegister();
			});
	}

	void GDALDatasetDeleter::operator()(GDALDataset* p) const
	{
		if (p) {
			GDALClose(GDALDataset::ToHandle(p));
		}
	}
	void GDALStringDeleter::operator()(char* p) const
	{
		CPLFree(p);
	}

	UniqueGdalDataset rasterGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return UniqueGdalDataset(GDALDataset::Open(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
	}
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return UniqueGdalDataset(GDALDataset::Open(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
	}
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, GDALDataType gdt)
	{
		gdalAllRegisterThreadSafe();
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			return UniqueGdalDataset();
		}
		return UniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, 1, gdt, nullptr));
	}

	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr)
	{
		char* wkt = nullptr;
		const char* options[] = { "FORMAT=WKT2", nullptr };
		osr.exportToWkt(&wkt, options);
		return UniqueGdalString(wkt);
	}

	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& errorMessageName)
	{
		std::array<double, 6> gt = { 0,1,0,0,0,-1 };
		if (wgd->GetGeoTransform(gt.data()) != CE_None) {
			//no georeferencing; treat it as a unit grid with the origin at the top left
			gt = { 0,1,0,0,0,-1 };
		}
		if (gt[2] != 0 || gt[4] != 0) {
			throw InvalidRasterFileException(errorMessageName + " has a rotated geotransform, which is not supported");
		}
		if (gt[5] > 0) {
			throw InvalidRasterFileException(errorMessageName + " is stored south-up, which is not supported");
		}
		return gt;
	}
}
