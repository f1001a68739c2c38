#include"Alignment.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	Alignment::Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol)
		: Extent(e), _nrow(nrow), _ncol(ncol)
	{
		if (nrow <= 0 || ncol <= 0) {
			throw InvalidAlignmentException("An alignment needs at least one row and one column");
		}
		_xres = (_xmax - _xmin) / ncol;
		_yres = (_ymax - _ymin) / nrow;
		checkValidAlignment();
	}

	Alignment::Alignment(const std::string& filename)
	{
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
	}

	rowcol_t Alignment::nrow() const
	{
		return _nrow;
	}
	rowcol_t Alignment::ncol() const
	{
		return _ncol;
	}
	cell_t Alignment::ncell() const
	{
		return (cell_t)_nrow * (cell_t)_ncol;
	}
	coord_t Alignment::xres() const
	{
		return _xres;
	}
	coord_t Alignment::yres() const
	{
		return _yres;
	}
	std::array<double, 6> Alignment::geoTransform() const
	{
		return { _xmin, _xres, 0, _ymax, 0, -_yres };
	}

	cell_t Alignment::cellFromRowCol(rowcol_t row, rowcol_t col) const
	{
		if (row < 0 || col < 0 || row >= _nrow || col >= _ncol) {
			throw OutsideExtentException("Row/column outside of alignment");
		}
		return cellFromRowColUnsafe(row, col);
	}
	cell_t Alignment::cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const
	{
		return (cell_t)row * _ncol + col;
	}
	rowcol_t Alignment::rowFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell / _ncol);
	}
	rowcol_t Alignment::colFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell % _ncol);
	}
	coord_t Alignment::xFromColUnsafe(rowcol_t col) const
	{
		return _xmin + _xres * col + _xres / 2;
	}
	coord_t Alignment::yFromRowUnsafe(rowcol_t row) const
	{
		return _ymax - _yres * row - _yres / 2;
	}
	coord_t Alignment::xFromCellUnsafe(cell_t cell) const
	{
		return xFromColUnsafe(colFromCellUnsafe(cell));
	}
	coord_t Alignment::yFromCellUnsafe(cell_t cell) const
	{
		return yFromRowUnsafe(rowFromCellUnsafe(cell));
	}
	rowcol_t Alignment::colFromXUnsafe(coord_t x) const
	{
		return (rowcol_t)std::floor((x - _xmin) / _xres);
	}
	rowcol_t Alignment::rowFromYUnsafe(coord_t y) const
	{
		return (rowcol_t)std::floor((_ymax - y) / _yres);
	}

	std::optional<RowColExtent> Alignment::rowColExtent(const Extent& e) const
	{
		if (e.xmax() < _xmin || e.xmin() > _xmax || e.ymax() < _ymin || e.ymin() > _ymax) {
			return std::nullopt;
		}
		RowColExtent out;
		out.mincol = std::clamp(colFromXUnsafe(e.xmin()), 0, _ncol - 1);
		out.maxcol = std::clamp(colFromXUnsafe(e.xmax()), 0, _ncol - 1);
		out.minrow = std::clamp(rowFromYUnsafe(e.ymax()), 0, _nrow - 1);
		out.maxrow = std::clamp(rowFromYUnsafe(e.ymin()), 0, _nrow - 1);
		return out;
	}

	bool Alignment::isSameAlignment(const Alignment& other) const
	{
		return *this == other;
	}

	void Alignment::alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans)
	{
		_ncol = wgd->GetRasterXSize();
		_nrow = wgd->GetRasterYSize();
		_xres = geotrans[1];
		_yres = std::abs(geotrans[5]);
		_xmin = geotrans[0];
		_xmax = _xmin + _ncol * _xres;
		_ymax = geotrans[3];
		_ymin = _ymax - _nrow * _yres;
		_crs = CoordRef(wgd->GetSpatialRef());
	}
	void Alignment::checkValidAlignment() const
	{
		if (_nrow <= 0 || _ncol <= 0) {
			throw InvalidAlignmentException("Alignment has no cells");
		}
		if (_xres <= 0 || _yres <= 0) {
			throw InvalidAlignmentException("Alignment has a non-positive cell size");
		}
	}
	void Alignment::_checkCell(cell_t cell) const
	{
		if (cell < 0 || cell >= ncell()) {
			throw OutsideExtentException("Cell outside of alignment");
		}
	}

	bool operator==(const Alignment& lhs, const Alignment& rhs)
	{
		return (Extent)lhs == (Extent)rhs && lhs.nrow() == rhs.nrow() && lhs.ncol() == rhs.ncol();
	}
	std::ostream& operator<<(std::ostream& os, const Alignment& a)
	{
		os << " nrow: " << a.nrow() << " ncol: " << a.ncol()
			<< " xmin: " << a.xmin() << " xmax: " << a.xmax()
			<< " ymin: " << a.ymin() << " ymax: " << a.ymax()
			<< " crs: " << a.crs();
		return os;
	}
}
