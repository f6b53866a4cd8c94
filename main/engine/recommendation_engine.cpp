#include <main/engine/recommendation_engine.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <cmath>
#include <cstring>

static const char* TAG = "RECOMMENDER";

namespace {
    static void copyText(char* dst, std::size_t capacity, const char* src) {
        std::strncpy(dst, src, capacity - 1);
        dst[capacity - 1] = '\0';
    }

    // Ordering for ranking: higher severity first, then lower enum value
    static bool ranksBefore(const DeficiencyResult& a, const DeficiencyResult& b) {
        if (a.severity != b.severity) {
            return a.severity > b.severity;
        }
        return parameterIndex(a.parameter) < parameterIndex(b.parameter);
    }
}

namespace RecommendationEngine {
    std::size_t rankDeficiencies(const DeficiencyResults& results, SoilParameter* out) {
        DeficiencyResult ranked[kSoilParameterCount];
        std::size_t n = 0;
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            if (results[i].status == NutrientStatus::DEFICIENT) {
                ranked[n++] = results[i];
            }
        }
        // Insertion sort; stable and at most six elements
        for (std::size_t i = 1; i < n; ++i) {
            DeficiencyResult key = ranked[i];
            std::size_t j = i;
            while (j > 0 && ranksBefore(key, ranked[j - 1])) {
                ranked[j] = ranked[j - 1];
                --j;
            }
            ranked[j] = key;
        }
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = ranked[i].parameter;
        }
        return n;
    }

    bool isValidDepletionRun(int run_length) {
        return run_length >= Config::Recommendation::min_depletion_run &&
               run_length <= Config::Recommendation::max_depletion_run;
    }

    bool detectDepletion(const HealthScoreRecord* history, std::size_t count, uint8_t run_length) {
        if (run_length < Config::Recommendation::min_depletion_run) {
            run_length = Config::Recommendation::min_depletion_run;
        }
        if (history == nullptr || count < run_length) {
            return false;
        }
        const std::size_t first = count - run_length;
        for (std::size_t i = first; i < count; ++i) {
            if (!isPostPlanting(history[i].stage)) {
                return false;
            }
            if (i > first && !(history[i].score < history[i - 1].score)) {
                return false;
            }
        }
        return true;
    }

    float dose(const FertilizerEntry& entry, float severity, uint8_t& warnings) {
        float q = std::round((severity * entry.dose_per_severity) / entry.step) * entry.step;
        if (q < entry.min_dose) {
            q = entry.min_dose;
        }
        if (q > entry.max_dose) {
            q = entry.max_dose;
            warnings = static_cast<uint8_t>(warnings | WARN_OVERDOSE_CLAMPED);
        }
        return q;
    }

    EngineError recommend(const DeficiencyResults& results,
                          GrowthStage stage,
                          const HealthScoreRecord* history,
                          std::size_t history_count,
                          const FertilizerTable& table,
                          uint8_t depletion_run,
                          Recommendation& out) {
        Recommendation rec{};
        SoilParameter ranked[kSoilParameterCount];
        const std::size_t deficient = rankDeficiencies(results, ranked);

        if (deficient == 0) {
            copyText(rec.fertilizer, sizeof(rec.fertilizer), Config::Recommendation::maintain_label);
            copyText(rec.unit, sizeof(rec.unit), Config::Recommendation::default_unit);
            rec.quantity = 0.0f;
            out = rec;
            return EngineError::OK;
        }

        // Prefer a compound covering the largest highest-severity subset
        const FertilizerEntry* entry = nullptr;
        std::size_t covered = 0;
        ParameterMask mask = 0;
        for (std::size_t i = 0; i < deficient; ++i) {
            mask = static_cast<ParameterMask>(mask | parameterBit(ranked[i]));
        }
        for (std::size_t k = deficient; k >= 2 && entry == nullptr; --k) {
            entry = table.findExact(mask, stage);
            if (entry != nullptr) {
                covered = k;
            } else {
                mask = static_cast<ParameterMask>(mask & ~parameterBit(ranked[k - 1]));
            }
        }
        if (entry == nullptr) {
            entry = table.findExact(parameterBit(ranked[0]), stage);
            covered = 1;
        }
        if (entry == nullptr) {
            LOG_ERROR(TAG, "No amendment for %s at stage %s", parameterName(ranked[0]),
                      growthStageName(stage));
            return EngineError::INVALID_FERTILIZER_TABLE;
        }

        float severity = 0.0f;
        for (std::size_t i = 0; i < covered; ++i) {
            const float s = results[parameterIndex(ranked[i])].severity;
            if (s > severity) {
                severity = s;
            }
            rec.rationale.parameters[i] = ranked[i];
        }
        rec.rationale.count = static_cast<uint8_t>(covered);
        rec.rationale.post_growth_depletion =
            isPostPlanting(stage) && detectDepletion(history, history_count, depletion_run);

        copyText(rec.fertilizer, sizeof(rec.fertilizer), entry->name);
        copyText(rec.unit, sizeof(rec.unit), entry->unit);
        rec.quantity = dose(*entry, severity, rec.warnings);

        if ((rec.warnings & WARN_OVERDOSE_CLAMPED) != 0) {
            LOG_WARN(TAG, "%s dose clamped to max safe %.1f %s", entry->name, entry->max_dose, entry->unit);
        }
        out = rec;
        return EngineError::OK;
    }
}
