#ifndef HEALTH_SCORE_RECORD_HPP
#define HEALTH_SCORE_RECORD_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/deficiency_result.hpp>
#include <main/models/growth_stage.hpp>

// One scoring event. Never modified after it is recorded.
struct HealthScoreRecord {
    char              field_id[Config::Fields::id_capacity];
    uint32_t          timestamp_s;
    float             score;        // 0..100
    DeficiencyResults deficiencies; // N, P, K, pH, moisture, temperature
    GrowthStage       stage;
};

#endif // HEALTH_SCORE_RECORD_HPP
