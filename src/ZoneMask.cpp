#include"ZoneMask.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	namespace {
		RowColExtent unionOf(const RowColExtent& a, const RowColExtent& b) {
			return RowColExtent{ std::min(a.minrow, b.minrow), std::max(a.maxrow, b.maxrow),
				std::min(a.mincol, b.mincol), std::max(a.maxcol, b.maxcol) };
		}
	}

	ZoneMask::ZoneMask(const Alignment& a) : Alignment(a)
	{
	}
	ZoneMask::ZoneMask(const Alignment& a, const RowColExtent& window) : Alignment(a), _window(window),
		_inside((size_t)(window.maxrow - window.minrow + 1) * (size_t)(window.maxcol - window.mincol + 1), false)
	{
	}

	bool ZoneMask::contains(cell_t cell) const
	{
		if (!_window) {
			return false;
		}
		rowcol_t row = rowFromCellUnsafe(cell);
		rowcol_t col = colFromCellUnsafe(cell);
		return _inWindow(row, col) && _inside[_windowIndex(row, col)];
	}
	void ZoneMask::set(cell_t cell, bool inside)
	{
		_checkCell(cell);
		rowcol_t row = rowFromCellUnsafe(cell);
		rowcol_t col = colFromCellUnsafe(cell);
		if (!_inWindow(row, col)) {
			if (!inside) {
				return;
			}
			_growTo(RowColExtent{ row, row, col, col });
		}
		_inside[_windowIndex(row, col)] = inside;
	}
	size_t ZoneMask::count() const
	{
		return (size_t)std::count(_inside.begin(), _inside.end(), true);
	}
	const std::optional<RowColExtent>& ZoneMask::window() const
	{
		return _window;
	}

	std::vector<cell_t> ZoneMask::cells() const
	{
		std::vector<cell_t> out;
		if (!_window) {
			return out;
		}
		for (rowcol_t row = _window->minrow; row <= _window->maxrow; ++row) {
			for (rowcol_t col = _window->mincol; col <= _window->maxcol; ++col) {
				if (_inside[_windowIndex(row, col)]) {
					out.push_back(cellFromRowColUnsafe(row, col));
				}
			}
		}
		return out;
	}

	void ZoneMask::merge(const ZoneMask& other)
	{
		if (!isSameAlignment(other)) {
			throw AlignmentMismatchException("Alignment mismatch in ZoneMask::merge");
		}
		if (!other._window) {
			return;
		}
		_growTo(other._window.value());
		const RowColExtent& w = other._window.value();
		for (rowcol_t row = w.minrow; row <= w.maxrow; ++row) {
			for (rowcol_t col = w.mincol; col <= w.maxcol; ++col) {
				if (other._inside[other._windowIndex(row, col)]) {
					_inside[_windowIndex(row, col)] = true;
				}
			}
		}
	}

	rowcol_t ZoneMask::_windowCols() const
	{
		return _window->maxcol - _window->mincol + 1;
	}
	size_t ZoneMask::_windowIndex(rowcol_t row, rowcol_t col) const
	{
		return (size_t)(row - _window->minrow) * (size_t)_windowCols() + (size_t)(col - _window->mincol);
	}
	bool ZoneMask::_inWindow(rowcol_t row, rowcol_t col) const
	{
		return _window && row >= _window->minrow && row <= _window->maxrow && col >= _window->mincol && col <= _window->maxcol;
	}

	void ZoneMask::_growTo(const RowColExtent& rc)
	{
		if (!_window) {
			*this = ZoneMask(*this, rc);
			return;
		}
		RowColExtent grown = unionOf(_window.value(), rc);
		if (grown.minrow == _window->minrow && grown.maxrow == _window->maxrow
			&& grown.mincol == _window->mincol && grown.maxcol == _window->maxcol) {
			return;
		}
		ZoneMask bigger{ *this, grown };
		for (cell_t cell : cells()) {
			bigger._inside[bigger._windowIndex(rowFromCellUnsafe(cell), colFromCellUnsafe(cell))] = true;
		}
		*this = std::move(bigger);
	}

	ZoneMask maskFor(const MultiPolygon& geometry, const Alignment& a)
	{
		std::vector<std::pair<const Polygon*, RowColExtent>> windows;
		std::optional<RowColExtent> all;
		for (const Polygon& poly : geometry) {
			//only the cells under the polygon's bounding box can be inside it
			std::optional<RowColExtent> rc = a.rowColExtent(poly.boundingBox());
			if (!rc) {
				continue;
			}
			windows.emplace_back(&poly, rc.value());
			all = all ? unionOf(all.value(), rc.value()) : rc.value();
		}
		if (!all) {
			return ZoneMask{ a };
		}

		ZoneMask out{ a, all.value() };
		for (const auto& [poly, rc] : windows) {
			for (rowcol_t row = rc.minrow; row <= rc.maxrow; ++row) {
				coord_t y = a.yFromRowUnsafe(row);
				for (rowcol_t col = rc.mincol; col <= rc.maxcol; ++col) {
					cell_t cell = a.cellFromRowColUnsafe(row, col);
					if (out.contains(cell)) {
						continue;
					}
					if (poly->containsPoint(a.xFromColUnsafe(col), y)) {
						out.set(cell);
					}
				}
			}
		}
		return out;
	}
}
