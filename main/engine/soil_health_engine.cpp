#include <main/engine/soil_health_engine.hpp>
#include <main/engine/reading_normalizer.hpp>
#include <main/engine/deficiency_classifier.hpp>
#include <main/engine/recommendation_engine.hpp>
#include <main/state/field_stages.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <freertos/task.h>
#include <cstring>

static const char* TAG = "SOIL_ENGINE";

SoilHealthEngine::SoilHealthEngine()
    : live_weights(HealthScorer::defaultWeights()),
      depletion_run(Config::Recommendation::default_depletion_run),
      ready(false) {
    portMUX_INITIALIZE(&settings_mux);
}

EngineError SoilHealthEngine::init(const EngineConfig& config) {
    ready = false;
    EngineError err = config.ranges.validate();
    if (err != EngineError::OK) {
        LOG_ERROR(TAG, "Range table rejected: %s", engineErrorName(err));
        return err;
    }
    err = config.fertilizers.validate();
    if (err != EngineError::OK) {
        LOG_ERROR(TAG, "Fertilizer table rejected: %s", engineErrorName(err));
        return err;
    }
    err = HealthScorer::validateWeights(config.weights);
    if (err != EngineError::OK) {
        LOG_ERROR(TAG, "Scoring weights rejected: %s", engineErrorName(err));
        return err;
    }
    if (!RecommendationEngine::isValidDepletionRun(config.depletion_run)) {
        LOG_ERROR(TAG, "Depletion run length %u out of range", static_cast<unsigned>(config.depletion_run));
        return EngineError::INVALID_RANGE;
    }

    ranges = config.ranges;
    fertilizers = config.fertilizers;
    taskENTER_CRITICAL(&settings_mux);
    live_weights = config.weights;
    depletion_run = config.depletion_run;
    taskEXIT_CRITICAL(&settings_mux);
    history.init();
    ready = true;
    LOG_INFO(TAG, "Engine ready: %u ranges, %u fertilizers",
             static_cast<unsigned>(ranges.size()), static_cast<unsigned>(fertilizers.size()));
    return EngineError::OK;
}

EngineError SoilHealthEngine::ingest(const RawSensorSample& sample, IngestResult& out) {
    out.offending = nullptr;
    if (!ready) {
        return EngineError::NOT_INITIALIZED;
    }

    SensorReading reading{};
    EngineError err = ReadingNormalizer::normalize(sample, reading, &out.offending);
    if (err != EngineError::OK) {
        return err;
    }

    const GrowthStage stage = FieldStages::get(reading.field_id);
    DeficiencyResults results{};
    err = DeficiencyClassifier::classify(reading, stage, ranges, results);
    if (err != EngineError::OK) {
        return err;
    }

    const ScoreWeights w = weights();
    const uint8_t run = depletionRun();

    HealthScoreRecord record{};
    std::memcpy(record.field_id, reading.field_id, sizeof(record.field_id));
    record.timestamp_s = reading.timestamp_s;
    record.score = HealthScorer::score(results, w);
    record.deficiencies = results;
    record.stage = stage;

    // Order check, history snapshot and append happen under one field lock
    HistoryTracker::FieldLock lock(history, reading.field_id, true);
    if (lock.status() != EngineError::OK) {
        return lock.status();
    }
    uint32_t latest = 0;
    if (lock.latestTimestamp(latest) && reading.timestamp_s < latest) {
        LOG_WARN(TAG, "Rejected out-of-order reading for %s: ts=%u < %u", reading.field_id,
                 static_cast<unsigned>(reading.timestamp_s), static_cast<unsigned>(latest));
        return EngineError::OUT_OF_ORDER_READING;
    }

    HealthScoreRecord window[Config::Recommendation::max_depletion_run];
    const std::size_t prior = lock.recent(run - 1U, window);
    window[prior] = record;

    Recommendation rec{};
    err = RecommendationEngine::recommend(results, stage, window, prior + 1, fertilizers, run, rec);
    if (err != EngineError::OK) {
        return err;
    }
    std::memcpy(rec.field_id, reading.field_id, sizeof(rec.field_id));
    rec.timestamp_s = reading.timestamp_s;

    err = lock.append(record);
    if (err != EngineError::OK) {
        return err;
    }

    out.record = record;
    out.recommendation = rec;
    LOG_INFO(TAG, "%s [%s] score=%.1f -> %s %.1f %s%s%s", reading.field_id, growthStageName(stage),
             record.score, rec.fertilizer, rec.quantity, rec.unit,
             rec.rationale.post_growth_depletion ? " (depletion)" : "",
             (rec.warnings & WARN_OVERDOSE_CLAMPED) ? " (clamped)" : "");
    return EngineError::OK;
}

std::size_t SoilHealthEngine::getHistory(const char* field_id, std::size_t n, HealthScoreRecord* out) {
    if (!ready) {
        return 0;
    }
    return history.recent(field_id, n, out);
}

TrendResult SoilHealthEngine::getTrend(const char* field_id) {
    if (!ready) {
        return TrendResult{ false, 0.0f };
    }
    return history.trend(field_id);
}

EngineError SoilHealthEngine::setGrowthStage(const char* field_id, GrowthStage stage) {
    return FieldStages::set(field_id, stage);
}

GrowthStage SoilHealthEngine::growthStage(const char* field_id) const {
    return FieldStages::get(field_id);
}

EngineError SoilHealthEngine::setWeights(const ScoreWeights& w) {
    EngineError err = HealthScorer::validateWeights(w);
    if (err != EngineError::OK) {
        return err;
    }
    taskENTER_CRITICAL(&settings_mux);
    live_weights = w;
    taskEXIT_CRITICAL(&settings_mux);
    return EngineError::OK;
}

EngineError SoilHealthEngine::setDepletionRun(uint8_t run_length) {
    if (!RecommendationEngine::isValidDepletionRun(run_length)) {
        return EngineError::INVALID_RANGE;
    }
    taskENTER_CRITICAL(&settings_mux);
    depletion_run = run_length;
    taskEXIT_CRITICAL(&settings_mux);
    return EngineError::OK;
}

ScoreWeights SoilHealthEngine::weights() const {
    taskENTER_CRITICAL(&settings_mux);
    ScoreWeights w = live_weights;
    taskEXIT_CRITICAL(&settings_mux);
    return w;
}

uint8_t SoilHealthEngine::depletionRun() const {
    taskENTER_CRITICAL(&settings_mux);
    uint8_t run = depletion_run;
    taskEXIT_CRITICAL(&settings_mux);
    return run;
}
