#pragma once
#ifndef zoneshift_vector_h
#define zoneshift_vector_h

#include"zoneshift_pch.hpp"
#include"CoordRef.hpp"
#include"Geometry.hpp"
#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	enum class FieldType {
		Integer,
		Real,
		String
	};

	//throws UnsupportedVectorFormatException unless the extension is one of .gpkg, .geojson, .json or .shp
	void checkSupportedVectorFormat(const std::filesystem::path& filename);

	//A column-oriented table of attributes, with columns kept in the order they were added.
	//Every value may be null.
	class AttributeTable {
	public:
		AttributeTable() = default;
		virtual ~AttributeTable() = default;

		void addStringField(const std::string& name);
		void addIntegerField(const std::string& name);
		void addRealField(const std::string& name);

		void resize(size_t nrow);
		void addRow();

		size_t nFeature() const;

		const std::vector<std::string>& getAllFieldNames() const;
		bool fieldExists(const std::string& name) const;
		FieldType getFieldType(const std::string& name) const;

		bool isNull(size_t index, const std::string& name) const;
		const std::string& getStringField(size_t index, const std::string& name) const;
		int64_t getIntegerField(size_t index, const std::string& name) const;
		double getRealField(size_t index, const std::string& name) const;

		void setNull(size_t index, const std::string& name);
		void setStringField(size_t index, const std::string& name, const std::string& value);
		void setIntegerField(size_t index, const std::string& name, int64_t value);
		void setRealField(size_t index, const std::string& name, double value);

	private:
		using Variant = std::variant<std::monostate, int64_t, double, std::string>;
		struct Field {
			FieldType type;
			std::vector<Variant> values;
		};

		size_t _nrow = 0;
		std::unordered_map<std::string, Field> _fields;
		std::vector<std::string> _fieldNamesInOrder;

		void _addField(const std::string& name, FieldType type);
		const Field& _fieldOfType(const std::string& name, FieldType type) const;
		Field& _fieldOfType(const std::string& name, FieldType type);
	};

	template<class GEOMETRY>
	class VectorDataset : public AttributeTable {

	private:
		class Feature;
		class iterator;

	public:
		VectorDataset() = default;
		explicit VectorDataset(const CoordRef& crs);

		//reads the named layer, or the first layer if layerName is empty. Features keep the order the driver returns them in
		VectorDataset(const std::string& filename, const std::string& layerName = "");
		VectorDataset(const std::filesystem::path& filename, const std::string& layerName = "");

		iterator begin() const;
		iterator end() const;

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		const GEOMETRY& getGeometry(size_t index) const;
		void addGeometry(const GEOMETRY& g);

		Feature getFeature(size_t index) const;

	private:
		CoordRef _crs;
		std::vector<GEOMETRY> _geometries;

		class Feature {
		public:
			Feature(const AttributeTable& fullAttributeTable, const GEOMETRY& geometry, size_t attributeIndex);

			const GEOMETRY& getGeometry() const;
			size_t index() const;

			const std::vector<std::string>& getAllFieldNames() const;
			FieldType getFieldType(const std::string& name) const;

			bool isNull(const std::string& name) const;
			const std::string& getStringField(const std::string& name) const;
			int64_t getIntegerField(const std::string& name) const;
			double getRealField(const std::string& name) const;
		private:
			const GEOMETRY& _geometry;
			const AttributeTable& _attributes;
			size_t _attributeIndex;
		};

		class iterator {
		public:
			iterator(const VectorDataset<GEOMETRY>* dataset, size_t attributeIndex);

			iterator& operator++();
			bool operator==(const iterator& other) const = default;
			Feature operator*() const;
		private:
			const VectorDataset<GEOMETRY>* _dataset;
			size_t _attributeIndex;
		};

		void _constructFromFilename(const std::string& filename, const std::string& layerName);
		static bool _acceptableLayerType(OGRwkbGeometryType t);
	};

	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const CoordRef& crs)
	{
		_crs = crs;
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::string& filename, const std::string& layerName)
	{
		_constructFromFilename(filename, layerName);
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::filesystem::path& filename, const std::string& layerName)
	{
		_constructFromFilename(filename.string(), layerName);
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::iterator VectorDataset<GEOMETRY>::begin() const
	{
		return iterator(this, 0);
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::iterator VectorDataset<GEOMETRY>::end() const
	{
		return iterator(this, nFeature());
	}
	template<class GEOMETRY>
	inline const CoordRef& VectorDataset<GEOMETRY>::crs() const
	{
		return _crs;
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::setCrs(const CoordRef& crs)
	{
		_crs = crs;
	}
	template<class GEOMETRY>
	inline const GEOMETRY& VectorDataset<GEOMETRY>::getGeometry(size_t index) const
	{
		return _geometries.at(index);
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::addGeometry(const GEOMETRY& g)
	{
		_geometries.push_back(g);
		addRow();
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::Feature VectorDataset<GEOMETRY>::getFeature(size_t index) const
	{
		return Feature(*this, _geometries.at(index), index);
	}
	template<class GEOMETRY>
	inline bool VectorDataset<GEOMETRY>::_acceptableLayerType(OGRwkbGeometryType t)
	{
		t = wkbFlatten(t);
		if (t == GEOMETRY::gdalGeometryTypeStatic || t == wkbUnknown) {
			return true;
		}
		//a polygon layer is a valid source of multipolygons
		if constexpr (std::is_same<GEOMETRY, MultiPolygon>()) {
			return t == wkbPolygon;
		}
		return false;
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::_constructFromFilename(const std::string& filename, const std::string& layerName)
	{
		UniqueGdalDataset shp = vectorGDALWrapper(filename);
		if (!shp) {
			throw InvalidVectorFileException("Unable to open " + filename + " as a vector file");
		}
		OGRLayer* layer = layerName.empty() ? shp->GetLayer(0) : shp->GetLayerByName(layerName.c_str());
		if (!layer) {
			throw InvalidVectorFileException(filename + " has no layer " + (layerName.empty() ? std::string("0") : layerName));
		}
		if (!_acceptableLayerType(layer->GetGeomType())) {
			throw InvalidVectorFileException(filename + " is not the expected geometry type");
		}
		_crs = CoordRef(layer->GetSpatialRef());

		OGRFeatureDefn* defn = layer->GetLayerDefn();
		for (int i = 0; i < defn->GetFieldCount(); ++i) {
			OGRFieldDefn* field = defn->GetFieldDefn(i);
			switch (field->GetType()) {
			case OFTInteger:
			case OFTInteger64:
				addIntegerField(field->GetNameRef());
				break;
			case OFTReal:
				addRealField(field->GetNameRef());
				break;
			default:
				//dates and the like are only ever ancillary, so they're kept as text
				addStringField(field->GetNameRef());
				break;
			}
		}

		layer->ResetReading();
		for (const OGRFeatureUniquePtr& feature : layer) {
			OGRGeometry* gdalGeometry = feature->GetGeometryRef();
			if (gdalGeometry) {
				addGeometry(GEOMETRY{ *gdalGeometry, _crs });
			}
			else {
				GEOMETRY empty;
				empty.setCrs(_crs);
				addGeometry(empty);
			}
			size_t row = _geometries.size() - 1;
			for (int i = 0; i < defn->GetFieldCount(); ++i) {
				const char* name = defn->GetFieldDefn(i)->GetNameRef();
				if (!feature->IsFieldSetAndNotNull(i)) {
					setNull(row, name);
					continue;
				}
				switch (getFieldType(name)) {
				case FieldType::Integer:
					setIntegerField(row, name, feature->GetFieldAsInteger64(i));
					break;
				case FieldType::Real:
					setRealField(row, name, feature->GetFieldAsDouble(i));
					break;
				case FieldType::String:
					setStringField(row, name, feature->GetFieldAsString(i));
					break;
				}
			}
		}
	}

	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::Feature::Feature
	(const AttributeTable& fullAttributeTable, const GEOMETRY& geometry, size_t attributeIndex)
		: _geometry(geometry), _attributes(fullAttributeTable), _attributeIndex(attributeIndex)
	{}
	template<class GEOMETRY>
	inline const GEOMETRY& VectorDataset<GEOMETRY>::Feature::getGeometry() const
	{
		return _geometry;
	}
	template<class GEOMETRY>
	inline size_t VectorDataset<GEOMETRY>::Feature::index() const
	{
		return _attributeIndex;
	}
	template<class GEOMETRY>
	inline const std::vector<std::string>& VectorDataset<GEOMETRY>::Feature::getAllFieldNames() const
	{
		return _attributes.getAllFieldNames();
	}
	template<class GEOMETRY>
	inline FieldType VectorDataset<GEOMETRY>::Feature::getFieldType(const std::string& name) const
	{
		return _attributes.getFieldType(name);
	}
	template<class GEOMETRY>
	inline bool VectorDataset<GEOMETRY>::Feature::isNull(const std::string& name) const
	{
		return _attributes.isNull(_attributeIndex, name);
	}
	template<class GEOMETRY>
	inline const std::string& VectorDataset<GEOMETRY>::Feature::getStringField(const std::string& name) const
	{
		return _attributes.getStringField(_attributeIndex, name);
	}
	template<class GEOMETRY>
	inline int64_t VectorDataset<GEOMETRY>::Feature::getIntegerField(const std::string& name) const
	{
		return _attributes.getIntegerField(_attributeIndex, name);
	}
	template<class GEOMETRY>
	inline double VectorDataset<GEOMETRY>::Feature::getRealField(const std::string& name) const
	{
		return _attributes.getRealField(_attributeIndex, name);
	}

	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::iterator::iterator(const VectorDataset<GEOMETRY>* dataset, size_t attributeIndex)
		: _dataset(dataset), _attributeIndex(attributeIndex)
	{}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::iterator& VectorDataset<GEOMETRY>::iterator::operator++()
	{
		_attributeIndex++;
		return *this;
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::Feature VectorDataset<GEOMETRY>::iterator::operator*() const
	{
		return _dataset->getFeature(_attributeIndex);
	}
}

#endif
