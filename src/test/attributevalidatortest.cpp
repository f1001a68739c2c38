#include"test_pch.hpp"
#include"../AttributeValidator.hpp"
#include"../GisExceptions.hpp"

namespace zoneshift {

    class AttributeValidatorTest : public ::testing::Test {
    public:
        RuleSet rules;
        std::vector<Zone> zones;

        void SetUp() override {
            rules = RuleSet::fromJsonString(R"({"IMD.tif":"replace","BSF.tif":"replace","F_AC.tif":"replace","F_WAT.tif":"replace","F_URB.tif":"replace"})");
            zones.push_back(makeZone(0, 0.6, 0.4, 0.2, 0.3, 0.5));
            zones.push_back(makeZone(1, 0.1, 0.1, 0.0, 0.0, 1.0));
        }

        static Zone makeZone(size_t index, double imd, double bsf, double ac, double wat, double urb) {
            Zone z;
            z.index = index;
            z.attributes = { {"IMD", imd}, {"BSF", bsf}, {"F_AC", ac}, {"F_WAT", wat}, {"F_URB", urb}, {"NAME", std::nan("")} };
            return z;
        }
    };

    TEST_F(AttributeValidatorTest, ValidZonesPass) {
        EXPECT_NO_THROW(validateReplaceAttributes(zones, rules));
    }

    TEST_F(AttributeValidatorTest, OutOfRange) {
        zones[1].attributes["BSF"] = 1.2;
        try {
            validateReplaceAttributes(zones, rules);
            FAIL() << "expected OutOfRangeAttributeException";
        }
        catch (const OutOfRangeAttributeException& e) {
            EXPECT_EQ(e.zone(), 1);
            EXPECT_EQ(e.layer(), "BSF");
            EXPECT_DOUBLE_EQ(e.value(), 1.2);
        }

        zones[1].attributes["BSF"] = -0.01;
        EXPECT_THROW(validateReplaceAttributes(zones, rules), OutOfRangeAttributeException);

        zones[1].attributes["BSF"] = std::numeric_limits<double>::infinity();
        EXPECT_THROW(validateReplaceAttributes(zones, rules), OutOfRangeAttributeException);
    }

    TEST_F(AttributeValidatorTest, AbsentValueIsOutOfRange) {
        zones[0].attributes.erase("F_WAT");
        try {
            validateReplaceAttributes(zones, rules);
            FAIL() << "expected OutOfRangeAttributeException";
        }
        catch (const OutOfRangeAttributeException& e) {
            EXPECT_EQ(e.zone(), 0);
            EXPECT_EQ(e.layer(), "F_WAT");
            EXPECT_TRUE(std::isnan(e.value()));
        }
    }

    TEST_F(AttributeValidatorTest, ImperviousBelowBuilding) {
        zones[0].attributes["IMD"] = 0.3;
        try {
            validateReplaceAttributes(zones, rules);
            FAIL() << "expected LogicalInconsistencyException";
        }
        catch (const LogicalInconsistencyException& e) {
            EXPECT_EQ(e.zone(), 0);
            EXPECT_DOUBLE_EQ(e.imd(), 0.3);
            EXPECT_DOUBLE_EQ(e.bsf(), 0.4);
        }

        //only checked when both are replaced
        RuleSet onlyImd = RuleSet::fromJsonString(R"({"IMD.tif":"replace"})");
        EXPECT_NO_THROW(validateReplaceAttributes(zones, onlyImd));
    }

    TEST_F(AttributeValidatorTest, FractionSumMismatch) {
        zones[1].attributes["F_URB"] = 0.97;
        try {
            validateReplaceAttributes(zones, rules);
            FAIL() << "expected FractionSumMismatchException";
        }
        catch (const FractionSumMismatchException& e) {
            EXPECT_EQ(e.zone(), 1);
            EXPECT_EQ(e.group(), "F");
            EXPECT_NEAR(e.sum(), 0.97, 1e-9);
        }
    }

    TEST_F(AttributeValidatorTest, SumTolerance) {
        zones[1].attributes["F_URB"] = 1.0 - 5e-7;
        EXPECT_NO_THROW(validateReplaceAttributes(zones, rules));

        ValidationOptions strict;
        strict.tolerance = 1e-9;
        EXPECT_THROW(validateReplaceAttributes(zones, rules, strict), FractionSumMismatchException);
    }

    TEST_F(AttributeValidatorTest, FirstViolationWins) {
        zones[0].attributes["F_AC"] = 0.9; //sum mismatch in zone 0
        zones[1].attributes["IMD"] = 2.; //out of range in zone 1
        EXPECT_THROW(validateReplaceAttributes(zones, rules), FractionSumMismatchException);
    }

    TEST_F(AttributeValidatorTest, PctRulesAreNotChecked) {
        RuleSet pct = RuleSet::fromJsonString(R"({"IMD.tif":"pct","F_AC.tif":"pct"})");
        zones[0].attributes["IMD"] = 40.;
        zones[0].attributes["F_AC"] = -25.;
        EXPECT_NO_THROW(validateReplaceAttributes(zones, pct));
    }
}
