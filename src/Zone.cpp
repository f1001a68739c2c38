#include"Zone.hpp"

namespace zoneshift {

	namespace {
		std::string upperCase(std::string s) {
			std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::toupper(c); });
			return s;
		}

		double parseNumber(const std::string& s) {
			const char* begin = s.c_str();
			char* end = nullptr;
			double d = CPLStrtod(begin, &end);
			while (end && *end && std::isspace((unsigned char)*end)) {
				++end;
			}
			if (end == begin || (end && *end)) {
				return std::numeric_limits<double>::quiet_NaN();
			}
			return d;
		}
	}

	std::optional<double> Zone::attribute(const std::string& key) const
	{
		auto it = attributes.find(key);
		if (it == attributes.end()) {
			return std::nullopt;
		}
		return it->second;
	}

	bool ZoneLayer::hasColumn(const std::string& key) const
	{
		return columns.contains(key);
	}

	ZoneLayer zonesFromDataset(const VectorDataset<MultiPolygon>& dataset)
	{
		ZoneLayer out;
		out.crs = dataset.crs();
		for (const std::string& name : dataset.getAllFieldNames()) {
			out.columns.insert(upperCase(name));
		}
		out.zones.reserve(dataset.nFeature());
		for (auto feature : dataset) {
			Zone z;
			z.index = feature.index();
			z.geometry = feature.getGeometry();
			for (const std::string& name : feature.getAllFieldNames()) {
				if (feature.isNull(name)) {
					continue;
				}
				double value = 0;
				switch (feature.getFieldType(name)) {
				case FieldType::Integer:
					value = (double)feature.getIntegerField(name);
					break;
				case FieldType::Real:
					value = feature.getRealField(name);
					break;
				case FieldType::String:
					value = parseNumber(feature.getStringField(name));
					break;
				}
				z.attributes[upperCase(name)] = value;
			}
			out.zones.push_back(std::move(z));
		}
		return out;
	}

	ZoneLayer readZoneLayer(const std::string& filename, const std::string& layerName)
	{
		checkSupportedVectorFormat(filename);
		VectorDataset<MultiPolygon> dataset{ filename, layerName };
		return zonesFromDataset(dataset);
	}
}
