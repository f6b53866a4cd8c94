#include <main/engine/health_scorer.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <cmath>

static const char* TAG = "SCORER";

namespace HealthScorer {
    ScoreWeights defaultWeights() {
        ScoreWeights w{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            w[i] = Config::Scoring::default_weights[i];
        }
        return w;
    }

    EngineError validateWeights(const ScoreWeights& weights) {
        float sum = 0.0f;
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            if (!std::isfinite(weights[i]) || weights[i] < 0.0f) {
                LOG_ERROR(TAG, "Invalid weight for %s: %f", parameterName(parameterAt(i)), weights[i]);
                return EngineError::INVALID_WEIGHTS;
            }
            sum += weights[i];
        }
        if (std::fabs(sum - 1.0f) > Config::Scoring::weight_sum_tolerance) {
            LOG_ERROR(TAG, "Weights sum to %.4f, expected 1", sum);
            return EngineError::INVALID_WEIGHTS;
        }
        return EngineError::OK;
    }

    float score(const DeficiencyResults& results, const ScoreWeights& weights) {
        float weighted = 0.0f;
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            weighted += weights[i] * results[i].severity;
        }
        float s = Config::Scoring::max_score * (1.0f - weighted);
        if (s < 0.0f) s = 0.0f;
        if (s > Config::Scoring::max_score) s = Config::Scoring::max_score;
        return s;
    }
}
