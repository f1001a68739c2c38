#pragma once
#ifndef zoneshift_alignment_h
#define zoneshift_alignment_h

#include"zoneshift_pch.hpp"
#include"Extent.hpp"
#include"GDALWrappers.hpp"

namespace zoneshift {

	struct RowColExtent {
		rowcol_t minrow, maxrow, mincol, maxcol;
	};

	//The georeferencing of a north-up grid: an extent, a cell size, and the number of rows and columns.
	//Cells are numbered row-major from the top left.
	class Alignment : public Extent {
	public:
		Alignment() = default;
		Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol);

		//reads only the metadata of a GDAL-readable raster
		explicit Alignment(const std::string& filename);

		rowcol_t nrow() const;
		rowcol_t ncol() const;
		cell_t ncell() const;
		coord_t xres() const;
		coord_t yres() const;

		//the six-coefficient GDAL geotransform
		std::array<double, 6> geoTransform() const;

		cell_t cellFromRowCol(rowcol_t row, rowcol_t col) const;
		cell_t cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const;
		rowcol_t rowFromCellUnsafe(cell_t cell) const;
		rowcol_t colFromCellUnsafe(cell_t cell) const;

		//coordinates of cell centers
		coord_t xFromColUnsafe(rowcol_t col) const;
		coord_t yFromRowUnsafe(rowcol_t row) const;
		coord_t xFromCellUnsafe(cell_t cell) const;
		coord_t yFromCellUnsafe(cell_t cell) const;

		rowcol_t colFromXUnsafe(coord_t x) const;
		rowcol_t rowFromYUnsafe(coord_t y) const;

		//the rows and columns whose cells intersect e, or nothing if e is entirely outside this alignment
		std::optional<RowColExtent> rowColExtent(const Extent& e) const;

		bool isSameAlignment(const Alignment& other) const;

	protected:
		coord_t _xres = 1, _yres = 1;
		rowcol_t _nrow = 0, _ncol = 0;

		void alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans);
		void checkValidAlignment() const;
		void _checkCell(cell_t cell) const;
	};

	bool operator==(const Alignment& lhs, const Alignment& rhs);
	std::ostream& operator<<(std::ostream& os, const Alignment& a);
}

#endif
