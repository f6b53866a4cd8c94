#ifndef HEALTH_SCORER_HPP
#define HEALTH_SCORER_HPP

#include <array>
#include <main/models/soil_parameter.hpp>
#include <main/models/deficiency_result.hpp>
#include <main/engine/engine_error.hpp>

// Per-parameter weights in SoilParameter order; must sum to 1
using ScoreWeights = std::array<float, kSoilParameterCount>;

namespace HealthScorer {
    // Default weights from Config::Scoring
    ScoreWeights defaultWeights();

    // Weights must be finite, non-negative and sum to 1 within
    // Config::Scoring::weight_sum_tolerance; INVALID_WEIGHTS otherwise.
    EngineError validateWeights(const ScoreWeights& weights);

    // 100 * (1 - weighted mean severity), clamped to [0, 100].
    // Weights are assumed to have passed validateWeights().
    float score(const DeficiencyResults& results, const ScoreWeights& weights);
}

#endif // HEALTH_SCORER_HPP
