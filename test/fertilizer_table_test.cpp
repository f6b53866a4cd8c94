#include <gtest/gtest.h>
#include <vector>
#include <main/engine/fertilizer_table.hpp>
#include <main/config/crop_profile.hpp>

namespace {
    std::vector<FertilizerEntry> profileEntries() {
        return std::vector<FertilizerEntry>(CropProfile::kBlackPepperFertilizers,
                                            CropProfile::kBlackPepperFertilizers +
                                                CropProfile::kBlackPepperFertilizerCount);
    }

    ParameterMask mask(SoilParameter a, SoilParameter b) {
        return static_cast<ParameterMask>(parameterBit(a) | parameterBit(b));
    }
}

TEST(FertilizerTable, BlackPepperProfileIsValid) {
    EXPECT_EQ(EngineError::OK, CropProfile::fertilizerTable().validate());
}

TEST(FertilizerTable, FindExactHonorsStageMask) {
    FertilizerTable table = CropProfile::fertilizerTable();
    const ParameterMask pk = mask(SoilParameter::PHOSPHORUS, SoilParameter::POTASSIUM);

    EXPECT_EQ(nullptr, table.findExact(pk, GrowthStage::VEGETATIVE));
    const FertilizerEntry* e = table.findExact(pk, GrowthStage::FLOWERING);
    ASSERT_NE(nullptr, e);
    EXPECT_STREQ("NPK 10:26:26", e->name);
}

TEST(FertilizerTable, FindExactDoesNotMatchSupersets) {
    FertilizerTable table = CropProfile::fertilizerTable();
    const FertilizerEntry* e = table.findExact(parameterBit(SoilParameter::NITROGEN), GrowthStage::MATURITY);
    ASSERT_NE(nullptr, e);
    EXPECT_STREQ("Urea", e->name);
}

TEST(FertilizerTable, MissingSingleNutrientFallbackIsInvalid) {
    std::vector<FertilizerEntry> entries;
    for (const FertilizerEntry& e : profileEntries()) {
        if (e.covers != parameterBit(SoilParameter::PH)) {
            entries.push_back(e);
        }
    }
    FertilizerTable table(entries.data(), entries.size());
    EXPECT_EQ(EngineError::INVALID_FERTILIZER_TABLE, table.validate());
}

TEST(FertilizerTable, MalformedEntryIsInvalid) {
    std::vector<FertilizerEntry> entries = profileEntries();
    entries[0].step = 0.0f;
    FertilizerTable zero_step(entries.data(), entries.size());
    EXPECT_EQ(EngineError::INVALID_FERTILIZER_TABLE, zero_step.validate());

    entries = profileEntries();
    entries[1].min_dose = entries[1].max_dose + 10.0f;
    FertilizerTable inverted(entries.data(), entries.size());
    EXPECT_EQ(EngineError::INVALID_FERTILIZER_TABLE, inverted.validate());
}
