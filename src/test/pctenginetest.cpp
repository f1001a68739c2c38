#include"test_pch.hpp"
#include"../PctEngine.hpp"
#include"../GisExceptions.hpp"

namespace zoneshift {

    class PctEngineTest : public ::testing::Test {
    public:
        Alignment a{ Extent(0, 4, 0, 1), 1, 4 };
        Raster<double> r;
        ZoneMask all, firstTwo;

        void SetUp() override {
            r = Raster<double>(a);
            std::vector<double> values = { 0.5, 0.2, 0., 0.8 };
            for (cell_t cell = 0; cell < r.ncell(); ++cell) {
                r[cell].value() = values[cell];
                r[cell].has_value() = true;
            }
            all = ZoneMask(a);
            firstTwo = ZoneMask(a);
            for (cell_t cell = 0; cell < a.ncell(); ++cell) {
                all.set(cell);
            }
            firstTwo.set(0);
            firstTwo.set(1);
        }
    };

    TEST_F(PctEngineTest, ZeroChangeIsIdempotent) {
        r[3].has_value() = false;
        Raster<double> before = r;
        PctReport report = applyPct(r, { ZoneValue{&all, 0., 0} }, PctOptions(), "IMD");
        EXPECT_EQ(report.totalTouched(), 3);
        for (cell_t cell = 0; cell < r.ncell(); ++cell) {
            ASSERT_EQ(r[cell].has_value(), before[cell].has_value());
            if (r[cell].has_value()) {
                EXPECT_NEAR(r[cell].value(), before[cell].value(), 1e-12);
            }
        }

        //a NaN change is a zero change
        applyPct(r, { ZoneValue{&all, std::nan(""), 0} }, PctOptions(), "IMD");
        EXPECT_EQ(r, before);
    }

    TEST_F(PctEngineTest, MinusHundredGivesZero) {
        applyPct(r, { ZoneValue{&firstTwo, -100., 0} }, PctOptions(), "IMD");
        EXPECT_EQ(r[0].value(), 0.);
        EXPECT_EQ(r[1].value(), 0.);
        EXPECT_DOUBLE_EQ(r[3].value(), 0.8);

        PctOptions ignore;
        ignore.outOfBounds = OutOfBoundsHandling::Ignore;
        SetUp();
        applyPct(r, { ZoneValue{&firstTwo, -100., 0} }, ignore, "IMD");
        EXPECT_EQ(r[0].value(), 0.);
    }

    TEST_F(PctEngineTest, PreserveZero) {
        PctReport report = applyPct(r, { ZoneValue{&all, 50., 3} }, PctOptions(), "IMD");
        EXPECT_EQ(r[2].value(), 0.);
        EXPECT_DOUBLE_EQ(r[0].value(), 0.75);
        ASSERT_EQ(report.zones.size(), 1);
        EXPECT_EQ(report.zones[0].zone, 3);
        EXPECT_EQ(report.zones[0].zeroCells, 1);
    }

    TEST_F(PctEngineTest, RaiseOnZero) {
        PctOptions raise;
        raise.zeroHandling = ZeroHandling::Raise;
        r[1].value() = 0.;
        try {
            applyPct(r, { ZoneValue{&firstTwo, 10., 0}, ZoneValue{&all, 10., 1} }, raise, "BSF");
            FAIL() << "expected UndefinedPercentageChangeException";
        }
        catch (const UndefinedPercentageChangeException& e) {
            //both zones are reported: cell 1 for the first, cells 1 and 2 for the second
            EXPECT_EQ(e.zone(), 0);
            EXPECT_EQ(e.layer(), "BSF");
            EXPECT_EQ(e.count(), 3);
            std::vector<std::pair<size_t, size_t>> expected = { {0, 1}, {1, 2} };
            EXPECT_EQ(e.zoneCounts(), expected);
        }

        //zero cells that no change reaches aren't a problem
        SetUp();
        EXPECT_NO_THROW(applyPct(r, { ZoneValue{&firstTwo, 10., 0}, ZoneValue{&all, 0., 1} }, raise, "BSF"));
    }

    TEST_F(PctEngineTest, InvalidRange) {
        PctOptions reversed;
        reversed.lowerBound = 1.;
        reversed.upperBound = 0.;
        EXPECT_THROW(checkPctOptions(reversed), std::invalid_argument);
        EXPECT_THROW(applyPct(r, { ZoneValue{&all, 10., 0} }, reversed, "IMD"), std::invalid_argument);
        EXPECT_DOUBLE_EQ(r[0].value(), 0.5);

        PctOptions nan;
        nan.upperBound = std::nan("");
        EXPECT_THROW(checkPctOptions(nan), std::invalid_argument);

        PctOptions negative;
        negative.lowerBound = -0.5;
        EXPECT_NO_THROW(checkPctOptions(negative));
    }

    TEST_F(PctEngineTest, SubstituteZero) {
        PctOptions sub;
        sub.zeroHandling = ZeroHandling::Substitute;
        sub.zeroValue = 0.01;
        applyPct(r, { ZoneValue{&all, 100., 0} }, sub, "IMD");
        EXPECT_DOUBLE_EQ(r[2].value(), 0.02);
    }

    TEST_F(PctEngineTest, Clip) {
        PctReport report = applyPct(r, { ZoneValue{&all, 50., 0} }, PctOptions(), "IMD");
        EXPECT_DOUBLE_EQ(r[3].value(), 1.);
        EXPECT_DOUBLE_EQ(r[1].value(), 0.3);
        EXPECT_EQ(report.totalOutOfRange(), 1);

        PctOptions narrow;
        narrow.lowerBound = 0.1;
        narrow.upperBound = 0.5;
        SetUp();
        applyPct(r, { ZoneValue{&firstTwo, -60., 0} }, narrow, "IMD");
        EXPECT_DOUBLE_EQ(r[0].value(), 0.2);
        EXPECT_DOUBLE_EQ(r[1].value(), 0.1);
    }

    TEST_F(PctEngineTest, NormalizeKeepsProportions) {
        PctOptions norm;
        norm.outOfBounds = OutOfBoundsHandling::Normalize;
        applyPct(r, { ZoneValue{&all, 50., 0} }, norm, "IMD");
        //0.75, 0.3, 0, 1.2 scaled by 1/1.2
        EXPECT_NEAR(r[3].value(), 1., 1e-12);
        EXPECT_NEAR(r[0].value(), 0.625, 1e-12);
        EXPECT_NEAR(r[1].value(), 0.25, 1e-12);
        EXPECT_EQ(r[2].value(), 0.);
    }

    TEST_F(PctEngineTest, NormalizeOnlyTouchesTheZone) {
        PctOptions norm;
        norm.outOfBounds = OutOfBoundsHandling::Normalize;
        r[1].value() = 0.8;
        applyPct(r, { ZoneValue{&firstTwo, 100., 0} }, norm, "IMD");
        //1.0 and 1.6 scaled by 1/1.6
        EXPECT_NEAR(r[0].value(), 0.625, 1e-12);
        EXPECT_NEAR(r[1].value(), 1., 1e-12);
        EXPECT_DOUBLE_EQ(r[3].value(), 0.8);
    }

    TEST_F(PctEngineTest, Ignore) {
        PctOptions ignore;
        ignore.outOfBounds = OutOfBoundsHandling::Ignore;
        PctReport report = applyPct(r, { ZoneValue{&all, 50., 0} }, ignore, "IMD");
        EXPECT_DOUBLE_EQ(r[3].value(), 1.2);
        EXPECT_EQ(report.totalOutOfRange(), 1);
    }

    TEST_F(PctEngineTest, OverlappingZonesAreCumulative) {
        PctOptions ignore;
        ignore.outOfBounds = OutOfBoundsHandling::Ignore;
        applyPct(r, { ZoneValue{&firstTwo, 100., 0}, ZoneValue{&all, -50., 1} }, ignore, "IMD");
        EXPECT_DOUBLE_EQ(r[0].value(), 0.5);
        EXPECT_DOUBLE_EQ(r[1].value(), 0.2);
        EXPECT_DOUBLE_EQ(r[3].value(), 0.4);
    }

    TEST_F(PctEngineTest, MissingCellsAreNeverModified) {
        r[0].has_value() = false;
        r[0].value() = -9999.;
        applyPct(r, { ZoneValue{&all, 50., 0} }, PctOptions(), "IMD");
        EXPECT_FALSE(r[0].has_value());
        EXPECT_EQ(r[0].value(), -9999.);
    }

    TEST_F(PctEngineTest, PolicyNames) {
        EXPECT_EQ(zeroHandlingFromString("raise"), ZeroHandling::Raise);
        EXPECT_EQ(outOfBoundsHandlingFromString("normalize"), OutOfBoundsHandling::Normalize);
        EXPECT_EQ(toString(ZeroHandling::Substitute), "substitute");
        EXPECT_THROW(zeroHandlingFromString("drop"), std::invalid_argument);
        EXPECT_THROW(outOfBoundsHandlingFromString("wrap"), std::invalid_argument);
    }
}
