#ifndef NUTRIENT_RANGE_TABLE_HPP
#define NUTRIENT_RANGE_TABLE_HPP

#include <cstddef>
#include <main/models/soil_parameter.hpp>
#include <main/models/growth_stage.hpp>
#include <main/engine/engine_error.hpp>

// Optimal band and critical boundaries of one parameter at one growth stage.
// Well-formed rows satisfy critical_low < min_optimal <= max_optimal < critical_high.
struct NutrientRange {
    SoilParameter parameter;
    GrowthStage   stage;
    float         min_optimal;
    float         max_optimal;
    float         critical_low;
    float         critical_high;
};

// Read-only view over externally owned range rows (static profile data).
class NutrientRangeTable {
public:
    NutrientRangeTable();
    NutrientRangeTable(const NutrientRange* rows, std::size_t count);

    // Every (parameter, stage) pair must resolve to exactly one well-formed row.
    // MISSING_RANGE if a pair has no row, INVALID_RANGE for duplicates or bad bounds.
    EngineError validate() const;

    // nullptr if the pair has no row
    const NutrientRange* find(SoilParameter parameter, GrowthStage stage) const;

    std::size_t size() const { return count; }

private:
    const NutrientRange* rows;
    std::size_t count;
};

#endif // NUTRIENT_RANGE_TABLE_HPP
