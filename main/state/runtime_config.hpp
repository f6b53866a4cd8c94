#ifndef RUNTIME_CONFIG_HPP
#define RUNTIME_CONFIG_HPP

#include <cstdint>
#include <main/engine/health_scorer.hpp>
#include <main/engine/engine_error.hpp>

// Operator-tunable engine settings, persisted in NVS.
namespace RuntimeConfig {
    static constexpr const char* nvs_namespace = "engine_cfg";
    static constexpr const char* nvs_key = "data";

    // Layout of the NVS blob under nvs_namespace / nvs_key
    struct StoredSettings {
        float   weights[kSoilParameterCount];
        uint8_t depletion_run;
    };

    // Load defaults from Config::Scoring / Config::Recommendation, then
    // overlay whatever NVS holds. A stored blob with invalid weights
    // (INVALID_WEIGHTS) or run length (INVALID_RANGE) is fatal: the engine
    // must not start on settings nobody chose.
    EngineError init();

    ScoreWeights getWeights();
    uint8_t getDepletionRun();

    // Validate, persist, then apply. INVALID_WEIGHTS / INVALID_RANGE /
    // PERSISTENCE_FAILED leave the current values untouched.
    EngineError setWeights(const ScoreWeights& weights);
    EngineError setDepletionRun(uint8_t run_length);
}

#endif // RUNTIME_CONFIG_HPP
