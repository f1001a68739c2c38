#include"test_pch.hpp"
#include"../Vector.hpp"
#include"../Zone.hpp"

namespace zoneshift {

    //two zones in UTM 33N: a square and a two-part multipolygon
    const char* ZONES_GEOJSON = R"({
"type": "FeatureCollection",
"crs": { "type": "name", "properties": { "name": "urn:ogc:def:crs:EPSG::32633" } },
"features": [
{ "type": "Feature", "properties": { "imd": 0.5, "BSF": 1, "name": "park", "F_AC": "0.25", "note": null },
  "geometry": { "type": "Polygon", "coordinates": [ [ [0,0], [0,2], [2,2], [2,0], [0,0] ] ] } },
{ "type": "Feature", "properties": { "imd": 0.75, "BSF": 0, "name": "yard", "F_AC": " 0.5 ", "note": "x" },
  "geometry": { "type": "MultiPolygon", "coordinates": [
    [ [ [2,2], [2,4], [4,4], [4,2], [2,2] ] ],
    [ [ [0,3], [0,4], [1,4], [1,3], [0,3] ] ] ] } }
]
})";

    class VectorTest : public ::testing::Test {
    public:
        TempDirectory dir;
        std::string file;

        void SetUp() override {
            file = dir.file("zones.geojson");
            writeTextFile(file, ZONES_GEOJSON);
        }
    };

    TEST_F(VectorTest, MultiPolygonConstructor) {
        VectorDataset<MultiPolygon> v{ file };

        ASSERT_EQ(v.nFeature(), 2);
        ASSERT_TRUE(v.fieldExists("imd"));
        EXPECT_EQ(v.getFieldType("imd"), FieldType::Real);
        EXPECT_EQ(v.getFieldType("BSF"), FieldType::Integer);
        EXPECT_EQ(v.getFieldType("name"), FieldType::String);
        EXPECT_EQ(v.getAllFieldNames()[0], "imd");

        std::vector<std::string> names = { "park", "yard" };
        std::vector<size_t> nPolygons = { 1, 2 };
        size_t i = 0;
        for (auto feature : v) {
            EXPECT_EQ(feature.index(), i);
            EXPECT_EQ(feature.getGeometry().nPolygon(), nPolygons[i]);
            EXPECT_STREQ(feature.getStringField("name").c_str(), names[i].c_str());
            ++i;
        }
        EXPECT_EQ(i, 2);

        EXPECT_TRUE(v.isNull(0, "note"));
        EXPECT_FALSE(v.isNull(1, "note"));
        EXPECT_TRUE(v.crs().isConsistentHoriz(CoordRef("EPSG:32633")));
        EXPECT_FALSE(v.crs().isConsistentHoriz(CoordRef("EPSG:4326")));

        EXPECT_TRUE(v.getGeometry(1).containsPoint(3, 3));
        EXPECT_TRUE(v.getGeometry(1).containsPoint(0.5, 3.5));
        EXPECT_FALSE(v.getGeometry(1).containsPoint(1, 1));
    }

    TEST_F(VectorTest, ZonesFromVector) {
        ZoneLayer layer = readZoneLayer(file);
        ASSERT_EQ(layer.zones.size(), 2);
        EXPECT_TRUE(layer.crs.isConsistentHoriz(CoordRef("EPSG:32633")));

        EXPECT_TRUE(layer.hasColumn("IMD"));
        EXPECT_TRUE(layer.hasColumn("NAME"));
        EXPECT_FALSE(layer.hasColumn("imd"));

        const Zone& first = layer.zones[0];
        EXPECT_EQ(first.index, 0);
        EXPECT_DOUBLE_EQ(first.attribute("IMD").value(), 0.5);
        EXPECT_DOUBLE_EQ(first.attribute("BSF").value(), 1.);
        EXPECT_DOUBLE_EQ(first.attribute("F_AC").value(), 0.25);
        EXPECT_TRUE(std::isnan(first.attribute("NAME").value()));
        EXPECT_FALSE(first.attribute("NOTE").has_value());

        const Zone& second = layer.zones[1];
        EXPECT_EQ(second.index, 1);
        EXPECT_DOUBLE_EQ(second.attribute("F_AC").value(), 0.5);
        EXPECT_TRUE(second.attribute("NOTE").has_value());
        EXPECT_EQ(second.geometry.nPolygon(), 2);
    }

    TEST_F(VectorTest, UnsupportedFormats) {
        EXPECT_THROW(readZoneLayer(dir.file("zones.csv")), UnsupportedVectorFormatException);
        EXPECT_THROW(checkSupportedVectorFormat("zones.kml"), UnsupportedVectorFormatException);
        EXPECT_NO_THROW(checkSupportedVectorFormat("zones.GPKG"));
        EXPECT_NO_THROW(checkSupportedVectorFormat("zones.shp"));
        EXPECT_NO_THROW(checkSupportedVectorFormat("zones.json"));

        EXPECT_THROW(readZoneLayer(dir.file("absent.geojson")), InvalidVectorFileException);
        EXPECT_THROW(readZoneLayer(file, "nosuchlayer"), InvalidVectorFileException);
    }

    TEST(AttributeTableTest, TypedAccess) {
        AttributeTable t;
        t.addIntegerField("count");
        t.addRealField("share");
        t.addStringField("label");
        t.resize(2);

        EXPECT_TRUE(t.isNull(0, "count"));
        t.setIntegerField(0, "count", 3);
        t.setRealField(1, "share", 0.5);
        t.setStringField(1, "label", "a");

        EXPECT_EQ(t.getIntegerField(0, "count"), 3);
        EXPECT_EQ(t.getRealField(1, "share"), 0.5);
        EXPECT_EQ(t.getStringField(1, "label"), "a");
        EXPECT_FALSE(t.isNull(0, "count"));

        t.setNull(0, "count");
        EXPECT_TRUE(t.isNull(0, "count"));

        EXPECT_THROW(t.getRealField(0, "count"), WrongFieldTypeException);
        EXPECT_THROW(t.setStringField(0, "share", "b"), WrongFieldTypeException);
        EXPECT_THROW(t.addRealField("share"), std::runtime_error);

        t.addRow();
        EXPECT_EQ(t.nFeature(), 3);
        EXPECT_TRUE(t.isNull(2, "label"));
    }

    TEST(GeometryTest, PolygonBoundingBoxAndHoles) {
        Polygon p{ std::vector<CoordXY>{ {0, 0}, {0, 4}, {4, 4}, {4, 0} } };
        p.addInnerRing({ {1, 1}, {1, 2}, {2, 2}, {2, 1} });

        Extent bb = p.boundingBox();
        EXPECT_EQ(bb.xmin(), 0);
        EXPECT_EQ(bb.xmax(), 4);
        EXPECT_EQ(bb.ymin(), 0);
        EXPECT_EQ(bb.ymax(), 4);

        EXPECT_TRUE(p.containsPoint(3, 3));
        EXPECT_FALSE(p.containsPoint(1.5, 1.5));
        EXPECT_FALSE(p.containsPoint(5, 1));
        EXPECT_EQ(p.nInnerRings(), 1);
        EXPECT_EQ(p.getOuterRing().size(), 5); //closed
        EXPECT_EQ(p.getInnerRing(0).size(), 5);

        EXPECT_THROW(Polygon(std::vector<CoordXY>{ {0, 0}, {1, 1} }), std::runtime_error);
    }
}
