#pragma once
#ifndef zoneshift_typedefs_h
#define zoneshift_typedefs_h

#include<cstdint>

namespace zoneshift {

	using coord_t = double;
	using cell_t = int64_t;
	using rowcol_t = int32_t;
	constexpr coord_t ZONESHIFT_EPSILON = 0.0001;
}

#endif
