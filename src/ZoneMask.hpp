#pragma once
#ifndef zoneshift_zonemask_h
#define zoneshift_zonemask_h

#include"zoneshift_pch.hpp"
#include"Alignment.hpp"
#include"Geometry.hpp"

namespace zoneshift {

	//Which cells of a grid a zone covers. Always shares the alignment of the raster it was built for,
	//but only stores the rows and columns of its window; every cell outside the window is outside the mask.
	class ZoneMask : public Alignment {
	public:
		ZoneMask() = default;

		//an empty mask
		explicit ZoneMask(const Alignment& a);
		//an empty mask that can hold the cells of window without growing
		ZoneMask(const Alignment& a, const RowColExtent& window);

		bool contains(cell_t cell) const;

		//setting a cell outside the window grows the window
		void set(cell_t cell, bool inside = true);

		size_t count() const;

		//the rows and columns this mask stores, or nothing if it has never held a cell
		const std::optional<RowColExtent>& window() const;

		//the cells inside the mask, in increasing order
		std::vector<cell_t> cells() const;

		//adds every cell of other to this mask
		void merge(const ZoneMask& other);

	private:
		std::optional<RowColExtent> _window;
		std::vector<bool> _inside;

		rowcol_t _windowCols() const;
		size_t _windowIndex(rowcol_t row, rowcol_t col) const;
		bool _inWindow(rowcol_t row, rowcol_t col) const;
		void _growTo(const RowColExtent& rc);
	};

	//Marks the cells whose centers fall inside the geometry. Coordinates are taken as they are:
	//the caller is responsible for the geometry and the alignment sharing a CRS.
	//The result's window is the union of the polygons' bounding boxes, clipped to the grid.
	ZoneMask maskFor(const MultiPolygon& geometry, const Alignment& a);

	//A zone's mask on one raster paired with the attribute value that zone carries for that raster.
	//The engines apply a sequence of these in order.
	struct ZoneValue {
		const ZoneMask* mask;
		double value;
		size_t zone;
	};
}

#endif
