#ifndef RECOMMENDATION_ENGINE_HPP
#define RECOMMENDATION_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/deficiency_result.hpp>
#include <main/models/growth_stage.hpp>
#include <main/models/health_score_record.hpp>
#include <main/models/recommendation.hpp>
#include <main/engine/fertilizer_table.hpp>
#include <main/engine/engine_error.hpp>

namespace RecommendationEngine {
    // Deficient parameters, highest severity first. Equal severities keep the
    // fixed priority N > P > K > pH > moisture > temperature.
    // Returns the number written to 'out' (capacity kSoilParameterCount).
    std::size_t rankDeficiencies(const DeficiencyResults& results, SoilParameter* out);

    // Depletion run lengths accepted by configuration (Config::Recommendation)
    bool isValidDepletionRun(int run_length);

    // True when the last 'run_length' records (chronological, newest last)
    // are all post-planting and each score is strictly below the previous one.
    bool detectDepletion(const HealthScoreRecord* history, std::size_t count, uint8_t run_length);

    // Round to the entry's step, then enforce min/max dose.
    // Sets WARN_OVERDOSE_CLAMPED in 'warnings' when the max dose was applied.
    float dose(const FertilizerEntry& entry, float severity, uint8_t& warnings);

    // Build a recommendation for one scored reading.
    //  history: chronological records of the field ending with the record that
    //           produced 'results' (may be empty when no history is available)
    // field_id and timestamp_s of 'out' are left for the caller.
    // INVALID_FERTILIZER_TABLE only if the table was not validated.
    EngineError recommend(const DeficiencyResults& results,
                          GrowthStage stage,
                          const HealthScoreRecord* history,
                          std::size_t history_count,
                          const FertilizerTable& table,
                          uint8_t depletion_run,
                          Recommendation& out);
}

#endif // RECOMMENDATION_ENGINE_HPP
