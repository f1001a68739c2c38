#pragma once
#ifndef zoneshift_zone_h
#define zoneshift_zone_h

#include"zoneshift_pch.hpp"
#include"Geometry.hpp"
#include"Vector.hpp"

namespace zoneshift {

	//One polygon feature of the vector mask. Attribute names are upper-cased so they match layer keys.
	//Null attributes are absent; text that isn't a number is kept as NaN.
	struct Zone {
		size_t index = 0;
		MultiPolygon geometry;
		std::map<std::string, double> attributes;

		std::optional<double> attribute(const std::string& key) const;
	};

	//The zones of a vector mask, in the order the driver returned the features.
	//That order is the application order of every engine, so later zones win where zones overlap.
	struct ZoneLayer {
		CoordRef crs;
		std::vector<Zone> zones;
		std::set<std::string> columns; //upper-cased

		bool hasColumn(const std::string& key) const;
	};

	ZoneLayer zonesFromDataset(const VectorDataset<MultiPolygon>& dataset);

	//throws UnsupportedVectorFormatException for unrecognized extensions. layerName selects a GeoPackage layer
	ZoneLayer readZoneLayer(const std::string& filename, const std::string& layerName = "");
}

#endif
