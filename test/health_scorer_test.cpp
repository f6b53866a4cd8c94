#include <gtest/gtest.h>
#include <limits>
#include <main/engine/health_scorer.hpp>

namespace {
    DeficiencyResults uniform(NutrientStatus status, float severity) {
        DeficiencyResults r{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            r[i] = DeficiencyResult{ parameterAt(i), status, severity };
        }
        return r;
    }
}

TEST(HealthScorer, AllOptimalScoresHundred) {
    EXPECT_FLOAT_EQ(100.0f, HealthScorer::score(uniform(NutrientStatus::OPTIMAL, 0.0f),
                                                HealthScorer::defaultWeights()));
}

TEST(HealthScorer, AllCriticalScoresZero) {
    EXPECT_NEAR(0.0f, HealthScorer::score(uniform(NutrientStatus::DEFICIENT, 1.0f),
                                          HealthScorer::defaultWeights()), 1e-4f);
}

TEST(HealthScorer, SingleDeficiencyIsWeighted) {
    DeficiencyResults r = uniform(NutrientStatus::OPTIMAL, 0.0f);
    r[0] = DeficiencyResult{ SoilParameter::NITROGEN, NutrientStatus::DEFICIENT, 0.6f };
    EXPECT_NEAR(90.0f, HealthScorer::score(r, HealthScorer::defaultWeights()), 1e-3f);

    ScoreWeights nitrogen_heavy = { 0.5f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f };
    EXPECT_NEAR(70.0f, HealthScorer::score(r, nitrogen_heavy), 1e-3f);
}

TEST(HealthScorer, DefaultWeightsAreValid) {
    EXPECT_EQ(EngineError::OK, HealthScorer::validateWeights(HealthScorer::defaultWeights()));
}

TEST(HealthScorer, RejectsWeightsNotSummingToOne) {
    ScoreWeights w = { 0.2f, 0.2f, 0.2f, 0.2f, 0.2f, 0.2f };
    EXPECT_EQ(EngineError::INVALID_WEIGHTS, HealthScorer::validateWeights(w));
}

TEST(HealthScorer, RejectsNegativeAndNonFiniteWeights) {
    ScoreWeights negative = { 0.5f, 0.5f, 0.2f, -0.2f, 0.0f, 0.0f };
    EXPECT_EQ(EngineError::INVALID_WEIGHTS, HealthScorer::validateWeights(negative));

    ScoreWeights nan = HealthScorer::defaultWeights();
    nan[2] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(EngineError::INVALID_WEIGHTS, HealthScorer::validateWeights(nan));
}
