#include <main/engine/deficiency_classifier.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "CLASSIFIER";

namespace {
    static float clipUnit(float v) {
        if (v < 0.0f) return 0.0f;
        if (v > 1.0f) return 1.0f;
        return v;
    }
}

namespace DeficiencyClassifier {
    DeficiencyResult classifyValue(const NutrientRange& range, float value) {
        DeficiencyResult r{};
        r.parameter = range.parameter;
        if (value < range.min_optimal) {
            r.status = NutrientStatus::DEFICIENT;
            r.severity = clipUnit((range.min_optimal - value) / (range.min_optimal - range.critical_low));
        } else if (value > range.max_optimal) {
            r.status = NutrientStatus::EXCESS;
            r.severity = clipUnit((value - range.max_optimal) / (range.critical_high - range.max_optimal));
        } else {
            r.status = NutrientStatus::OPTIMAL;
            r.severity = 0.0f;
        }
        return r;
    }

    EngineError classify(const SensorReading& reading,
                         GrowthStage stage,
                         const NutrientRangeTable& table,
                         DeficiencyResults& out) {
        DeficiencyResults results{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            const SoilParameter p = parameterAt(i);
            const NutrientRange* range = table.find(p, stage);
            if (range == nullptr) {
                LOG_ERROR(TAG, "No range configured for %s at stage %s",
                          parameterName(p), growthStageName(stage));
                return EngineError::MISSING_RANGE;
            }
            results[i] = classifyValue(*range, reading.value(p));
            LOG_DEBUG(TAG, "%s %s=%.2f -> %s (%.3f)", reading.field_id, parameterName(p),
                      reading.value(p), nutrientStatusName(results[i].status), results[i].severity);
        }
        out = results;
        return EngineError::OK;
    }
}
