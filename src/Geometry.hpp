#pragma once
#ifndef zoneshift_geometry_h
#define zoneshift_geometry_h

#include"zoneshift_pch.hpp"
#include"Coordinate.hpp"
#include"CoordRef.hpp"
#include"Extent.hpp"

namespace zoneshift {

	class Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbUnknown;

		virtual Extent boundingBox() const = 0;

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		virtual ~Geometry() = default;

	protected:
		CoordRef _crs;
		Geometry() = default;
		Geometry(const Geometry&) = default;
		Geometry& operator=(const Geometry&) = default;
	};

	class Polygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbPolygon;

		Polygon() = default;
		Polygon(const OGRGeometry& geom);
		Polygon(const OGRGeometry& geom, const CoordRef& crs);
		Polygon(const std::vector<CoordXY>& outerRing);
		Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs);
		Polygon(const Extent& e);

		void addInnerRing(const std::vector<CoordXY>& innerRing);

		const std::vector<CoordXY>& getOuterRing() const;
		int nInnerRings() const;
		const std::vector<CoordXY>& getInnerRing(int index) const;

		Extent boundingBox() const override;

		//a point exactly on an edge may be reported either way
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;

	private:
		std::vector<CoordXY> _outerRing;
		std::vector<std::vector<CoordXY>> _innerRings;

		static void _closeRing(std::vector<CoordXY>& ring);
		void _sharedConstructorFromGdal(const OGRGeometry& geom);
	};

	//Zones are always read as multipolygons; single polygons become a multipolygon with one member
	class MultiPolygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbMultiPolygon;

		MultiPolygon() = default;
		MultiPolygon(const OGRGeometry& geom);
		MultiPolygon(const OGRGeometry& geom, const CoordRef& crs);

		size_t nPolygon() const;

		std::vector<Polygon>::const_iterator begin() const;
		std::vector<Polygon>::const_iterator end() const;

		void addPolygon(const Polygon& polygon);

		Extent boundingBox() const override;
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;

	private:
		std::vector<Polygon> _polygons;
		void _sharedConstructorFromGdal(const OGRGeometry& geom, const CoordRef& crs);
	};
}

#endif
