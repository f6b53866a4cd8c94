#ifndef FERTILIZER_TABLE_HPP
#define FERTILIZER_TABLE_HPP

#include <cstddef>
#include <main/models/soil_parameter.hpp>
#include <main/models/growth_stage.hpp>
#include <main/engine/engine_error.hpp>

// One amendment the recommender can prescribe.
// Entries covering two or more parameters are compounds.
struct FertilizerEntry {
    const char*   name;
    ParameterMask covers;            // deficient parameters this entry corrects
    StageMask     stages;            // growth stages it may be applied at
    float         dose_per_severity; // unit per 1.0 severity
    float         min_dose;          // minimum effective dose
    float         max_dose;          // maximum safe dose
    float         step;              // application granularity (rounding unit)
    const char*   unit;
};

// Read-only view over externally owned fertilizer rows (static profile data).
class FertilizerTable {
public:
    FertilizerTable();
    FertilizerTable(const FertilizerEntry* entries, std::size_t count);

    // Checks every entry is well formed and that every (parameter, stage) has
    // a single-nutrient entry, so the recommender can always fall back to one.
    EngineError validate() const;

    // First entry, in table order, that covers exactly 'covers' and applies at 'stage'
    const FertilizerEntry* findExact(ParameterMask covers, GrowthStage stage) const;

    std::size_t size() const { return count; }

private:
    const FertilizerEntry* entries;
    std::size_t count;
};

#endif // FERTILIZER_TABLE_HPP
