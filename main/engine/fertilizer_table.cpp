#include <main/engine/fertilizer_table.hpp>
#include <main/models/recommendation.hpp>
#include <main/utils/logger.hpp>
#include <cmath>
#include <cstring>

static const char* TAG = "FERT_TABLE";

namespace {
    static bool fits(const char* text, std::size_t capacity) {
        return text != nullptr && text[0] != '\0' && std::strlen(text) < capacity;
    }

    static bool isWellFormed(const FertilizerEntry& e) {
        if (!fits(e.name, sizeof(Recommendation::fertilizer)) ||
            !fits(e.unit, sizeof(Recommendation::unit))) {
            return false;
        }
        if (e.covers == 0 || (e.covers & ~kAllParametersMask) != 0) {
            return false;
        }
        if (e.stages == 0 || (e.stages & ~kAllStagesMask) != 0) {
            return false;
        }
        if (!std::isfinite(e.dose_per_severity) || !std::isfinite(e.min_dose) ||
            !std::isfinite(e.max_dose) || !std::isfinite(e.step)) {
            return false;
        }
        return e.dose_per_severity > 0.0f && e.min_dose > 0.0f &&
               e.min_dose <= e.max_dose && e.step > 0.0f;
    }
}

FertilizerTable::FertilizerTable() : entries(nullptr), count(0) {}

FertilizerTable::FertilizerTable(const FertilizerEntry* entries_in, std::size_t count_in)
    : entries(entries_in), count(entries_in ? count_in : 0) {}

EngineError FertilizerTable::validate() const {
    for (std::size_t i = 0; i < count; ++i) {
        if (!isWellFormed(entries[i])) {
            LOG_ERROR(TAG, "Malformed fertilizer entry #%u (%s)", static_cast<unsigned>(i),
                      entries[i].name ? entries[i].name : "<null>");
            return EngineError::INVALID_FERTILIZER_TABLE;
        }
    }
    for (std::size_t p = 0; p < kSoilParameterCount; ++p) {
        for (std::size_t s = 0; s < kGrowthStageCount; ++s) {
            const SoilParameter parameter = parameterAt(p);
            const GrowthStage stage = static_cast<GrowthStage>(s);
            if (findExact(parameterBit(parameter), stage) == nullptr) {
                LOG_ERROR(TAG, "No single-nutrient amendment for %s at stage %s",
                          parameterName(parameter), growthStageName(stage));
                return EngineError::INVALID_FERTILIZER_TABLE;
            }
        }
    }
    return EngineError::OK;
}

const FertilizerEntry* FertilizerTable::findExact(ParameterMask covers, GrowthStage stage) const {
    for (std::size_t i = 0; i < count; ++i) {
        if (entries[i].covers == covers && (entries[i].stages & stageBit(stage)) != 0) {
            return &entries[i];
        }
    }
    return nullptr;
}
