#pragma once
#ifndef zoneshift_raster_h
#define zoneshift_raster_h

#include"zoneshift_pch.hpp"
#include"Alignment.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	template<class T>
	using RastData = xtl::xoptional_vector<T>;

	//A single-band grid. Cells that were equal to the file's no-data sentinel (or NaN) are read as missing,
	//and the sentinel itself is remembered so that it can be written back unchanged.
	template<class T>
	class Raster : public Alignment {
	public:

		Raster() : Alignment(), _data() {}
		virtual ~Raster() noexcept = default;

		//creates a raster from the given alignment, and fills it with missing values
		explicit Raster(const Alignment& a) : Alignment(a) {
			_data.resize(ncell());
		}

		//Constructs a raster from a GDAL-readable file.
		Raster(const std::string& filename, const int band = 1);

		//disallow copy and move constructors from rasters with different templates. This will call the Raster(const Alignment& a) signature, which is very confusing
		//by deleting them, that just won't even compile--do an explicit cast to Alignment if you want that behavior
		template<class S>
		Raster(const Raster<S>& r) = delete;
		template<class S>
		Raster(Raster<S>&& r) = delete;
		template<class S>
		Raster<T>& operator=(const Raster<S>& r) = delete;
		template<class S>
		Raster<T>& operator=(Raster<S>&& r) = delete;

		Raster(const Raster<T>& r) = default;
		Raster(Raster<T>&& r) noexcept {
			*this = std::move(r);
		}
		Raster<T>& operator=(const Raster<T>& r) = default;
		Raster<T>& operator=(Raster<T>&& r) noexcept {
			_data = std::move(r._data);
			_crs = std::move(r._crs);
			_xmin = r._xmin; r._xmin = 0;
			_xmax = r._xmax; r._xmax = 0;
			_ymin = r._ymin; r._ymin = 0;
			_ymax = r._ymax; r._ymax = 0;
			_xres = r._xres; r._xres = 1;
			_yres = r._yres; r._yres = 1;
			_ncol = r._ncol; r._ncol = 0;
			_nrow = r._nrow; r._nrow = 0;
			_noData = r._noData; r._noData.reset();
			_sourceType = r._sourceType; r._sourceType = GDT_Unknown;
			return *this;
		}

		//Methods to access values. As usual, operator[] does no bounds checking. atRC does check.
		auto atRC(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowCol(row, col)];
		}
		const auto atRC(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowCol(row, col)];
		}

		const auto operator[](const cell_t cell) const {
			return _data[cell];
		}
		auto operator[](const cell_t cell) {
			return _data[cell];
		}
		auto atCellUnsafe(const cell_t cell) {
			return _data[cell];
		}
		const auto atCellUnsafe(const cell_t cell) const {
			return _data[cell];
		}

		//the sentinel the source file used for missing cells, if it declared one
		const std::optional<double>& noDataValue() const {
			return _noData;
		}
		void setNoDataValue(std::optional<double> nd) {
			_noData = nd;
		}

		//the pixel type of the file this raster was read from, or GDT_Unknown for rasters built in memory
		GDALDataType sourceDataType() const {
			return _sourceType;
		}

		//Writes the Raster object to the harddrive. Missing values are written as the no-data sentinel; if there isn't one,
		//NaN is used for floating point types and the lowest value of T otherwise.
		//It's up to the user to make sure the driver and the file extension correspond.
		//You can specify the datatype of the file, or leave it as GDT_Unknown to choose the one that corresponds to the template of the raster object.
		void writeRaster(const std::string& file, const std::string& driver = "GTiff", GDALDataType gdt = GDT_Unknown) const;

		//returns true if has_value is true for any cell; false otherwise
		bool hasAnyValue() const;

		auto begin() { return _data.begin(); }
		auto end() { return _data.end(); }
		auto begin() const { return _data.begin(); }
		auto end() const { return _data.end(); }

	private:
		RastData<T> _data;
		std::optional<double> _noData;
		GDALDataType _sourceType = GDT_Unknown;

		static GDALDataType GDT() {
			if (std::is_same<T, double>::value) {
				return GDT_Float64;
			}
			if (std::is_same<T, float>::value) {
				return GDT_Float32;
			}
			if (std::is_same<T, std::int16_t>::value) {
				return GDT_Int16;
			}
			if (std::is_same<T, std::int32_t>::value) {
				return GDT_Int32;
			}
			if (std::is_same<T, std::uint16_t>::value) {
				return GDT_UInt16;
			}
			if (std::is_same<T, std::uint32_t>::value) {
				return GDT_UInt32;
			}
			if (std::is_same<T, std::uint8_t>::value) {
				return GDT_Byte;
			}
			return GDT_Unknown;
		}
	};

	template<class T>
	inline bool operator==(const Raster<T>& lhs, const Raster<T>& rhs) {
		bool equal = true;
		equal = equal && ((Alignment)lhs == (Alignment)rhs);
		if (!equal) {
			return false;
		}
		for (cell_t cell = 0; cell < lhs.ncell(); ++cell) {
			equal = equal && (lhs[cell].has_value() == rhs[cell].has_value());
			if (lhs[cell].has_value() && rhs[cell].has_value()) {
				equal = equal && (lhs[cell].value() == rhs[cell].value());
			}
			if (!equal) {
				return false;
			}
		}
		return true;
	}
	template<class T>
	inline bool operator!=(const Raster<T>& lhs, const Raster<T>& rhs) {
		return !(lhs == rhs);
	}

	template<class T>
	inline std::ostream& operator<<(std::ostream& os, const Raster<T>& r) {
		os << "RASTER: " << typeid(T).name();
		os << (Alignment)r;
		return os;
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const int band) {

		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
		if (band < 1 || band > wgd->GetRasterCount()) {
			throw InvalidRasterFileException(filename + " has no band " + std::to_string(band));
		}

		_data.resize(ncell());

		GDALRasterBand* rBand = wgd->GetRasterBand(band);
		_sourceType = rBand->GetRasterDataType();
		int hasNoData = 0;
		double naValue = rBand->GetNoDataValue(&hasNoData);
		if (hasNoData) {
			_noData = naValue;
		}
		CPLErr err = rBand->RasterIO(GF_Read, 0, 0, _ncol, _nrow, _data.value().data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Unable to read the data of " + filename);
		}

		for (cell_t cell = 0; cell < ncell(); ++cell) {
			double asDouble = (double)_data.value()[cell];
			bool isNoData = hasNoData && (asDouble == naValue || (std::isnan(naValue) && std::isnan(asDouble)));
			if (!isNoData && !std::isnan(asDouble)) {
				_data.has_value()[cell] = true;
			}
		}
	}

	template<class T>
	void Raster<T>::writeRaster(const std::string& file, const std::string& driver, GDALDataType dataType) const {
		if (dataType == GDT_Unknown) {
			dataType = GDT();
		}
		UniqueGdalDataset wgd = gdalCreateWrapper(driver, file, ncol(), nrow(), dataType);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to create " + file + " as a raster");
		}
		std::array<double, 6> gt = geoTransform();
		wgd->SetGeoTransform(gt.data());
		if (!_crs.isEmpty()) {
			wgd->SetProjection(_crs.getCompleteWKT().c_str());
		}

		T navalue;
		if (_noData.has_value()) {
			navalue = (T)_noData.value();
		}
		else if constexpr (std::is_floating_point<T>::value) {
			navalue = std::numeric_limits<T>::quiet_NaN();
		}
		else {
			navalue = std::numeric_limits<T>::lowest();
		}

		std::vector<T> buffer(_data.value().begin(), _data.value().end());
		bool anyMissing = false;
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!_data[cell].has_value()) {
				buffer[cell] = navalue;
				anyMissing = true;
			}
		}
		auto band = wgd->GetRasterBand(1);
		if (_noData.has_value() || anyMissing) {
			band->SetNoDataValue((double)navalue);
		}
		CPLErr err = band->RasterIO(GF_Write, 0, 0, _ncol, _nrow, buffer.data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Unable to write the data of " + file);
		}
	}

	template<class T>
	bool Raster<T>::hasAnyValue() const {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				return true;
			}
		}
		return false;
	}
}

#endif
