#include"Vector.hpp"

namespace zoneshift {

    void checkSupportedVectorFormat(const std::filesystem::path& filename)
    {
        std::string ext = filename.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (ext != ".gpkg" && ext != ".geojson" && ext != ".json" && ext != ".shp") {
            throw UnsupportedVectorFormatException("Unsupported vector format for " + filename.string() + "; use GPKG, GeoJSON or Shapefile");
        }
    }

    void AttributeTable::addStringField(const std::string& name)
    {
        _addField(name, FieldType::String);
    }
    void AttributeTable::addIntegerField(const std::string& name)
    {
        _addField(name, FieldType::Integer);
    }
    void AttributeTable::addRealField(const std::string& name)
    {
        _addField(name, FieldType::Real);
    }

    void AttributeTable::resize(size_t nrow) {
        _nrow = nrow;
        for (auto& keyValue : _fields) {
            keyValue.second.values.resize(_nrow, Variant());
        }
    }
    void AttributeTable::addRow()
    {
        resize(_nrow + 1);
    }

    size_t AttributeTable::nFeature() const
    {
        return _nrow;
    }

    const std::vector<std::string>& AttributeTable::getAllFieldNames() const
    {
        return _fieldNamesInOrder;
    }
    bool AttributeTable::fieldExists(const std::string& name) const
    {
        return _fields.contains(name);
    }
    FieldType AttributeTable::getFieldType(const std::string& name) const
    {
        return _fields.at(name).type;
    }

    bool AttributeTable::isNull(size_t index, const std::string& name) const
    {
        return std::holds_alternative<std::monostate>(_fields.at(name).values.at(index));
    }
    const std::string& AttributeTable::getStringField(size_t index, const std::string& name) const
    {
        return std::get<std::string>(_fieldOfType(name, FieldType::String).values.at(index));
    }
    int64_t AttributeTable::getIntegerField(size_t index, const std::string& name) const
    {
        return std::get<int64_t>(_fieldOfType(name, FieldType::Integer).values.at(index));
    }
    double AttributeTable::getRealField(size_t index, const std::string& name) const
    {
        return std::get<double>(_fieldOfType(name, FieldType::Real).values.at(index));
    }

    void AttributeTable::setNull(size_t index, const std::string& name)
    {
        _fields.at(name).values.at(index) = std::monostate();
    }
    void AttributeTable::setStringField(size_t index, const std::string& name, const std::string& value)
    {
        _fieldOfType(name, FieldType::String).values.at(index) = value;
    }
    void AttributeTable::setIntegerField(size_t index, const std::string& name, int64_t value)
    {
        _fieldOfType(name, FieldType::Integer).values.at(index) = value;
    }
    void AttributeTable::setRealField(size_t index, const std::string& name, double value)
    {
        _fieldOfType(name, FieldType::Real).values.at(index) = value;
    }

    void AttributeTable::_addField(const std::string& name, FieldType type)
    {
        if (_fields.contains(name)) {
            throw std::runtime_error("Duplicate field: " + name);
        }
        Field newField{ type, std::vector<Variant>(_nrow, Variant()) };
        _fields.emplace(name, std::move(newField));
        _fieldNamesInOrder.push_back(name);
    }
    const AttributeTable::Field& AttributeTable::_fieldOfType(const std::string& name, FieldType type) const
    {
        const Field& f = _fields.at(name);
        if (f.type != type) {
            switch (type) {
            case FieldType::String:
                throw WrongFieldTypeException("Wrong field type; expected string");
            case FieldType::Integer:
                throw WrongFieldTypeException("Wrong field type; expected integer");
            case FieldType::Real:
                throw WrongFieldTypeException("Wrong field type; expected real");
            }
        }
        return f;
    }
    AttributeTable::Field& AttributeTable::_fieldOfType(const std::string& name, FieldType type)
    {
        return const_cast<Field&>(static_cast<const AttributeTable*>(this)->_fieldOfType(name, type));
    }
}
