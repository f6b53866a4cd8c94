#include <gtest/gtest.h>
#include <vector>
#include <main/engine/nutrient_range_table.hpp>
#include <main/config/crop_profile.hpp>

namespace {
    std::vector<NutrientRange> profileRows() {
        return std::vector<NutrientRange>(CropProfile::kBlackPepperRanges,
                                          CropProfile::kBlackPepperRanges + CropProfile::kBlackPepperRangeCount);
    }
}

TEST(NutrientRangeTable, BlackPepperProfileIsComplete) {
    NutrientRangeTable table = CropProfile::rangeTable();
    EXPECT_EQ(EngineError::OK, table.validate());
    EXPECT_EQ(kSoilParameterCount * kGrowthStageCount, table.size());

    const NutrientRange* ph = table.find(SoilParameter::PH, GrowthStage::FLOWERING);
    ASSERT_NE(nullptr, ph);
    EXPECT_FLOAT_EQ(5.5f, ph->min_optimal);
    EXPECT_FLOAT_EQ(6.5f, ph->max_optimal);
}

TEST(NutrientRangeTable, MissingPairIsReported) {
    std::vector<NutrientRange> rows = profileRows();
    rows.pop_back();
    NutrientRangeTable table(rows.data(), rows.size());
    EXPECT_EQ(EngineError::MISSING_RANGE, table.validate());
}

TEST(NutrientRangeTable, DuplicatePairIsInvalid) {
    std::vector<NutrientRange> rows = profileRows();
    rows.push_back(rows.front());
    NutrientRangeTable table(rows.data(), rows.size());
    EXPECT_EQ(EngineError::INVALID_RANGE, table.validate());
}

TEST(NutrientRangeTable, InvertedBoundsAreInvalid) {
    std::vector<NutrientRange> rows = profileRows();
    rows[3].min_optimal = rows[3].max_optimal + 1.0f;
    NutrientRangeTable table(rows.data(), rows.size());
    EXPECT_EQ(EngineError::INVALID_RANGE, table.validate());
}

TEST(NutrientRangeTable, EmptyTableIsMissingRanges) {
    NutrientRangeTable table;
    EXPECT_EQ(EngineError::MISSING_RANGE, table.validate());
    EXPECT_EQ(nullptr, table.find(SoilParameter::NITROGEN, GrowthStage::PRE_PLANTING));
}
