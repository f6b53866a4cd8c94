#ifndef CROP_PROFILE_HPP
#define CROP_PROFILE_HPP

#include <cstddef>
#include <main/engine/nutrient_range_table.hpp>
#include <main/engine/fertilizer_table.hpp>

// Reference data for black pepper (Piper nigrum) on laterite soils.
// Rows are plain data so agronomists can revise them without touching
// decision code.
namespace CropProfile {
    extern const NutrientRange   kBlackPepperRanges[];
    extern const std::size_t     kBlackPepperRangeCount;

    extern const FertilizerEntry kBlackPepperFertilizers[];
    extern const std::size_t     kBlackPepperFertilizerCount;

    NutrientRangeTable rangeTable();
    FertilizerTable fertilizerTable();
}

#endif // CROP_PROFILE_HPP
