#include"test_pch.hpp"
#include"../Raster.hpp"
#include"../GisExceptions.hpp"

namespace zoneshift {

    TEST(ExtentTest, Basics) {
        Extent e{ 0, 4, 0, 2 };
        EXPECT_TRUE(e.contains(1, 1));
        EXPECT_TRUE(e.contains(4, 2));
        EXPECT_FALSE(e.contains(5, 1));
        EXPECT_TRUE(e.overlaps(Extent(3, 5, 1, 3)));
        EXPECT_FALSE(e.overlaps(Extent(4, 5, 0, 2)));

        Extent both = extendExtent(e, Extent(-1, 1, 1, 3));
        EXPECT_EQ(both, Extent(-1, 4, 0, 3));

        EXPECT_THROW(Extent(1, 0, 0, 1), std::invalid_argument);
        EXPECT_THROW(extendExtent(Extent(0, 1, 0, 1, CoordRef("EPSG:32633")), Extent(0, 1, 0, 1, CoordRef("EPSG:4326"))), std::invalid_argument);
    }

    TEST(CoordRefTest, ParseFailure) {
        EXPECT_THROW(CoordRef("not a crs"), CrsParseException);
        EXPECT_TRUE(CoordRef("").isEmpty());
    }

    TEST(AlignmentTest, CellMath) {
        Alignment a{ Extent(0, 4, 0, 2), 2, 4 };
        EXPECT_EQ(a.ncell(), 8);
        EXPECT_DOUBLE_EQ(a.xres(), 1.);
        EXPECT_DOUBLE_EQ(a.yres(), 1.);

        EXPECT_EQ(a.cellFromRowCol(1, 2), 6);
        EXPECT_EQ(a.rowFromCellUnsafe(6), 1);
        EXPECT_EQ(a.colFromCellUnsafe(6), 2);
        EXPECT_DOUBLE_EQ(a.xFromCellUnsafe(6), 2.5);
        EXPECT_DOUBLE_EQ(a.yFromCellUnsafe(6), 0.5);
        EXPECT_EQ(a.colFromXUnsafe(3.9), 3);
        EXPECT_EQ(a.rowFromYUnsafe(1.9), 0);
        EXPECT_THROW(a.cellFromRowCol(2, 0), OutsideExtentException);

        std::array<double, 6> gt = a.geoTransform();
        EXPECT_EQ(gt[0], 0.);
        EXPECT_EQ(gt[3], 2.);
        EXPECT_EQ(gt[5], -1.);

        auto rc = a.rowColExtent(Extent(0.5, 1.5, 0.5, 1.5));
        ASSERT_TRUE(rc.has_value());
        EXPECT_EQ(rc->minrow, 0);
        EXPECT_EQ(rc->maxrow, 1);
        EXPECT_EQ(rc->mincol, 0);
        EXPECT_EQ(rc->maxcol, 1);
        EXPECT_FALSE(a.rowColExtent(Extent(10, 11, 10, 11)).has_value());

        EXPECT_THROW(Alignment(Extent(0, 4, 0, 2), 0, 4), InvalidAlignmentException);
        EXPECT_FALSE(a.isSameAlignment(Alignment(Extent(0, 4, 0, 2), 4, 4)));
    }

    TEST(RasterTest, FileRoundTripKeepsNoData) {
        TempDirectory dir;
        std::string file = dir.file("grid.tif");

        Raster<double> r{ Alignment(Extent(100, 103, 200, 202, CoordRef("EPSG:32633")), 2, 3) };
        EXPECT_FALSE(r.hasAnyValue());
        r.setNoDataValue(-1.);
        for (cell_t cell = 1; cell < r.ncell(); ++cell) {
            r[cell].value() = 0.1 * (double)cell;
            r[cell].has_value() = true;
        }
        EXPECT_TRUE(r.hasAnyValue());
        r.writeRaster(file, "GTiff", GDT_Float32);

        Alignment meta{ file };
        EXPECT_TRUE(meta.isSameAlignment(r));

        Raster<double> back{ file };
        EXPECT_EQ(back.sourceDataType(), GDT_Float32);
        EXPECT_EQ(back.noDataValue(), std::optional<double>(-1.));
        EXPECT_TRUE(back.crs().isConsistentHoriz(CoordRef("EPSG:32633")));
        EXPECT_FALSE(back[0].has_value());
        EXPECT_NEAR(back.atRC(1, 2).value(), 0.5, 1e-6);

        //a sentinel-free float file marks missing cells with NaN
        Raster<double> noSentinel{ Alignment(Extent(0, 1, 0, 1), 1, 1) };
        noSentinel.writeRaster(dir.file("nan.tif"));
        Raster<double> nanBack{ dir.file("nan.tif") };
        EXPECT_FALSE(nanBack[0].has_value());
    }

    TEST(RasterTest, RotatedRastersAreRejected) {
        TempDirectory dir;
        std::string file = dir.file("rotated.tif");
        {
            UniqueGdalDataset wgd = gdalCreateWrapper("GTiff", file, 2, 2, GDT_Float32);
            ASSERT_TRUE(wgd);
            std::array<double, 6> gt = { 0, 1, 0.5, 2, 0, -1 };
            wgd->SetGeoTransform(gt.data());
        }
        EXPECT_THROW(Raster<double>{ file }, InvalidRasterFileException);
        EXPECT_THROW(Alignment{ file }, InvalidRasterFileException);

        EXPECT_THROW(Raster<double>{ dir.file("absent.tif") }, InvalidRasterFileException);
    }
}
