#ifndef SOIL_HEALTH_ENGINE_HPP
#define SOIL_HEALTH_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/portmacro.h>
#include <main/models/sensor_reading.hpp>
#include <main/models/health_score_record.hpp>
#include <main/models/recommendation.hpp>
#include <main/engine/engine_error.hpp>
#include <main/engine/nutrient_range_table.hpp>
#include <main/engine/fertilizer_table.hpp>
#include <main/engine/health_scorer.hpp>
#include <main/engine/history_tracker.hpp>

// Everything the engine consumes from the configuration source
struct EngineConfig {
    NutrientRangeTable ranges;
    FertilizerTable    fertilizers;
    ScoreWeights       weights;
    uint8_t            depletion_run;
};

// Outcome of ingest(). On success 'record' and 'recommendation' are both
// complete; on rejection 'offending' names the field or parameter at fault
// (nullptr when the error is not tied to one).
struct IngestResult {
    HealthScoreRecord record;
    Recommendation    recommendation;
    const char*       offending;
};

// Normalize -> classify -> score -> recommend -> record, for one reading.
// Readings for different fields may be ingested concurrently; readings for
// the same field are serialized by the history tracker's field lock.
class SoilHealthEngine {
public:
    SoilHealthEngine();

    SoilHealthEngine(const SoilHealthEngine&) = delete;
    SoilHealthEngine& operator=(const SoilHealthEngine&) = delete;

    // Validate every table and the weights. Any failure is fatal: the engine
    // stays unusable and ingest() returns NOT_INITIALIZED.
    EngineError init(const EngineConfig& config);
    bool isReady() const { return ready; }

    EngineError ingest(const RawSensorSample& sample, IngestResult& out);

    // Up to n latest records of the field, oldest first; returns the count
    std::size_t getHistory(const char* field_id, std::size_t n, HealthScoreRecord* out);
    TrendResult getTrend(const char* field_id);

    EngineError setGrowthStage(const char* field_id, GrowthStage stage);
    GrowthStage growthStage(const char* field_id) const;

    // Validated replacements of live settings; rejected values change nothing
    EngineError setWeights(const ScoreWeights& weights);
    EngineError setDepletionRun(uint8_t run_length);

    ScoreWeights weights() const;
    uint8_t depletionRun() const;

private:
    NutrientRangeTable ranges;
    FertilizerTable    fertilizers;
    ScoreWeights       live_weights;
    uint8_t            depletion_run;
    HistoryTracker     history;
    bool               ready;
    mutable portMUX_TYPE settings_mux;
};

#endif // SOIL_HEALTH_ENGINE_HPP
