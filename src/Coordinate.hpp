#pragma once
#ifndef zoneshift_coordinate_h
#define zoneshift_coordinate_h

#include"ZoneShiftTypeDefs.hpp"

namespace zoneshift {
	struct CoordXY {
		coord_t x, y;
		CoordXY() : x(0), y(0) {}
		CoordXY(coord_t x, coord_t y) : x(x), y(y) {}
		bool operator==(const CoordXY& other) const = default;
	};
}

#endif
