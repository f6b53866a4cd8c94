#include <main/config/crop_profile.hpp>

namespace {
    using P = SoilParameter;
    using S = GrowthStage;

    constexpr ParameterMask N = parameterBit(SoilParameter::NITROGEN);
    constexpr ParameterMask PHOS = parameterBit(SoilParameter::PHOSPHORUS);
    constexpr ParameterMask K = parameterBit(SoilParameter::POTASSIUM);
    constexpr ParameterMask PH = parameterBit(SoilParameter::PH);
    constexpr ParameterMask MOIST = parameterBit(SoilParameter::MOISTURE);
    constexpr ParameterMask TEMP = parameterBit(SoilParameter::TEMPERATURE);

    constexpr StageMask ALL = kAllStagesMask;
    constexpr StageMask BEARING = static_cast<StageMask>(stageBit(GrowthStage::FLOWERING) |
                                                         stageBit(GrowthStage::MATURITY));
}

namespace CropProfile {
    // N, P, K in mg/kg; pH units; moisture %; temperature degC
    //                       parameter     stage             min     max     crit_lo crit_hi
    const NutrientRange kBlackPepperRanges[] = {
        { P::NITROGEN,    S::PRE_PLANTING, 140.0f, 220.0f,  60.0f, 400.0f },
        { P::NITROGEN,    S::VEGETATIVE,   170.0f, 260.0f,  80.0f, 420.0f },
        { P::NITROGEN,    S::FLOWERING,    150.0f, 230.0f,  70.0f, 400.0f },
        { P::NITROGEN,    S::MATURITY,     120.0f, 200.0f,  50.0f, 380.0f },

        { P::PHOSPHORUS,  S::PRE_PLANTING,  20.0f,  45.0f,   5.0f,  90.0f },
        { P::PHOSPHORUS,  S::VEGETATIVE,    20.0f,  45.0f,   5.0f,  90.0f },
        { P::PHOSPHORUS,  S::FLOWERING,     30.0f,  55.0f,  10.0f, 100.0f },
        { P::PHOSPHORUS,  S::MATURITY,      25.0f,  50.0f,   8.0f,  95.0f },

        { P::POTASSIUM,   S::PRE_PLANTING, 160.0f, 260.0f,  60.0f, 420.0f },
        { P::POTASSIUM,   S::VEGETATIVE,   170.0f, 270.0f,  70.0f, 430.0f },
        { P::POTASSIUM,   S::FLOWERING,    200.0f, 300.0f,  90.0f, 450.0f },
        { P::POTASSIUM,   S::MATURITY,     220.0f, 320.0f, 100.0f, 460.0f },

        { P::PH,          S::PRE_PLANTING,   5.5f,   6.5f,   4.5f,   7.5f },
        { P::PH,          S::VEGETATIVE,     5.5f,   6.5f,   4.5f,   7.5f },
        { P::PH,          S::FLOWERING,      5.5f,   6.5f,   4.5f,   7.5f },
        { P::PH,          S::MATURITY,       5.5f,   6.5f,   4.5f,   7.5f },

        { P::MOISTURE,    S::PRE_PLANTING,  45.0f,  70.0f,  20.0f,  90.0f },
        { P::MOISTURE,    S::VEGETATIVE,    55.0f,  75.0f,  30.0f,  92.0f },
        { P::MOISTURE,    S::FLOWERING,     55.0f,  75.0f,  30.0f,  92.0f },
        { P::MOISTURE,    S::MATURITY,      50.0f,  70.0f,  25.0f,  90.0f },

        { P::TEMPERATURE, S::PRE_PLANTING,  20.0f,  30.0f,  10.0f,  40.0f },
        { P::TEMPERATURE, S::VEGETATIVE,    20.0f,  30.0f,  10.0f,  40.0f },
        { P::TEMPERATURE, S::FLOWERING,     20.0f,  30.0f,  10.0f,  40.0f },
        { P::TEMPERATURE, S::MATURITY,      20.0f,  30.0f,  10.0f,  40.0f },
    };
    const std::size_t kBlackPepperRangeCount = sizeof(kBlackPepperRanges) / sizeof(kBlackPepperRanges[0]);

    // Compounds first: the recommender takes the first exact match.
    // Doses in kg/ha per 1.0 severity, rounded to 'step'.
    //   name                         covers         stages   dose   min     max     step   unit
    const FertilizerEntry kBlackPepperFertilizers[] = {
        { "NPK 17:17:17",             N | PHOS | K,  ALL,     250.0f,  50.0f,  300.0f, 5.0f,  "kg/ha" },
        { "Diammonium phosphate",     N | PHOS,      ALL,     150.0f,  25.0f,  175.0f, 5.0f,  "kg/ha" },
        { "NPK 10:26:26",             PHOS | K,      BEARING, 200.0f,  40.0f,  250.0f, 5.0f,  "kg/ha" },
        { "Potassium nitrate",        N | K,         ALL,     120.0f,  20.0f,  150.0f, 5.0f,  "kg/ha" },

        { "Urea",                     N,             ALL,     120.0f,  15.0f,  100.0f, 5.0f,  "kg/ha" },
        { "Rock phosphate",           PHOS,          ALL,     200.0f,  25.0f,  250.0f, 5.0f,  "kg/ha" },
        { "Muriate of potash",        K,             ALL,     180.0f,  20.0f,  150.0f, 5.0f,  "kg/ha" },
        { "Dolomite lime",            PH,            ALL,    1000.0f, 200.0f, 1000.0f, 50.0f, "kg/ha" },
        { "Green leaf mulch",         MOIST,         ALL,    5000.0f, 1000.0f, 5000.0f, 250.0f, "kg/ha" },
        { "Dry leaf mulch",           TEMP,          ALL,    3000.0f, 500.0f, 3000.0f, 250.0f, "kg/ha" },
    };
    const std::size_t kBlackPepperFertilizerCount =
        sizeof(kBlackPepperFertilizers) / sizeof(kBlackPepperFertilizers[0]);

    NutrientRangeTable rangeTable() {
        return NutrientRangeTable(kBlackPepperRanges, kBlackPepperRangeCount);
    }

    FertilizerTable fertilizerTable() {
        return FertilizerTable(kBlackPepperFertilizers, kBlackPepperFertilizerCount);
    }
}
