#include"Extent.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax)
		: _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax)
	{
		if (xmin > xmax || ymin > ymax) {
			throw std::invalid_argument("Extent minimums must not exceed maximums");
		}
	}
	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs)
		: Extent(xmin, xmax, ymin, ymax)
	{
		_crs = crs;
	}
	coord_t Extent::xmin() const
	{
		return _xmin;
	}
	coord_t Extent::xmax() const
	{
		return _xmax;
	}
	coord_t Extent::ymin() const
	{
		return _ymin;
	}
	coord_t Extent::ymax() const
	{
		return _ymax;
	}
	const CoordRef& Extent::crs() const
	{
		return _crs;
	}
	void Extent::setCrs(const CoordRef& crs)
	{
		_crs = crs;
	}
	bool Extent::contains(coord_t x, coord_t y) const
	{
		return x >= _xmin && x <= _xmax && y >= _ymin && y <= _ymax;
	}
	bool Extent::overlaps(const Extent& e) const
	{
		return _xmin < e._xmax && _xmax > e._xmin && _ymin < e._ymax && _ymax > e._ymin;
	}

	bool operator==(const Extent& lhs, const Extent& rhs)
	{
		return std::abs(lhs.xmin() - rhs.xmin()) < ZONESHIFT_EPSILON
			&& std::abs(lhs.xmax() - rhs.xmax()) < ZONESHIFT_EPSILON
			&& std::abs(lhs.ymin() - rhs.ymin()) < ZONESHIFT_EPSILON
			&& std::abs(lhs.ymax() - rhs.ymax()) < ZONESHIFT_EPSILON
			&& lhs.crs().isConsistentHoriz(rhs.crs());
	}

	Extent extendExtent(const Extent& base, const Extent& addition)
	{
		if (!base.crs().isConsistentHoriz(addition.crs())) {
			throw std::invalid_argument("CRS mismatch in extendExtent");
		}
		return Extent(std::min(base.xmin(), addition.xmin()), std::max(base.xmax(), addition.xmax()),
			std::min(base.ymin(), addition.ymin()), std::max(base.ymax(), addition.ymax()), base.crs());
	}
}
