#pragma once
#ifndef zoneshift_coordref_h
#define zoneshift_coordref_h

#include"zoneshift_pch.hpp"
#include"projwrappers.hpp"

namespace zoneshift {

	class CoordRef {
	public:
		CoordRef() = default;

		//accepts anything proj_create understands: WKT, PROJJSON, "EPSG:xxxx", urns
		CoordRef(const std::string& s);
		CoordRef(const char* s);
		CoordRef(const OGRSpatialReference* osr);

		bool isEmpty() const;

		//two CRSs are consistent if their horizontal components are equivalent, ignoring the axis order of geographic CRSs
		//an empty CRS is only consistent with another empty CRS
		bool isConsistentHoriz(const CoordRef& other) const;

		std::string getCompleteWKT() const;
		std::string getShortName() const;

	private:
		SharedPJ _p;
	};

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs);
}

#endif
