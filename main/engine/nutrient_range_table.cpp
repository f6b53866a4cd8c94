#include <main/engine/nutrient_range_table.hpp>
#include <main/utils/logger.hpp>
#include <cmath>

static const char* TAG = "RANGE_TABLE";

namespace {
    static bool isWellFormed(const NutrientRange& r) {
        if (!std::isfinite(r.critical_low) || !std::isfinite(r.min_optimal) ||
            !std::isfinite(r.max_optimal) || !std::isfinite(r.critical_high)) {
            return false;
        }
        return r.critical_low < r.min_optimal &&
               r.min_optimal <= r.max_optimal &&
               r.max_optimal < r.critical_high;
    }
}

NutrientRangeTable::NutrientRangeTable() : rows(nullptr), count(0) {}

NutrientRangeTable::NutrientRangeTable(const NutrientRange* rows_in, std::size_t count_in)
    : rows(rows_in), count(rows_in ? count_in : 0) {}

EngineError NutrientRangeTable::validate() const {
    for (std::size_t p = 0; p < kSoilParameterCount; ++p) {
        for (std::size_t s = 0; s < kGrowthStageCount; ++s) {
            const SoilParameter parameter = parameterAt(p);
            const GrowthStage stage = static_cast<GrowthStage>(s);
            int matches = 0;
            for (std::size_t i = 0; i < count; ++i) {
                if (rows[i].parameter != parameter || rows[i].stage != stage) {
                    continue;
                }
                ++matches;
                if (!isWellFormed(rows[i])) {
                    LOG_ERROR(TAG, "Malformed range for %s/%s: crit_low=%.2f min=%.2f max=%.2f crit_high=%.2f",
                              parameterName(parameter), growthStageName(stage),
                              rows[i].critical_low, rows[i].min_optimal,
                              rows[i].max_optimal, rows[i].critical_high);
                    return EngineError::INVALID_RANGE;
                }
            }
            if (matches == 0) {
                LOG_ERROR(TAG, "No range for %s/%s", parameterName(parameter), growthStageName(stage));
                return EngineError::MISSING_RANGE;
            }
            if (matches > 1) {
                LOG_ERROR(TAG, "Duplicate ranges (%d) for %s/%s", matches,
                          parameterName(parameter), growthStageName(stage));
                return EngineError::INVALID_RANGE;
            }
        }
    }
    return EngineError::OK;
}

const NutrientRange* NutrientRangeTable::find(SoilParameter parameter, GrowthStage stage) const {
    for (std::size_t i = 0; i < count; ++i) {
        if (rows[i].parameter == parameter && rows[i].stage == stage) {
            return &rows[i];
        }
    }
    return nullptr;
}
