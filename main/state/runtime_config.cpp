#include <main/state/runtime_config.hpp>
#include <main/config/config.hpp>
#include <main/engine/recommendation_engine.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/portmacro.h>

static const char* TAG = "RUNTIME_CFG";

namespace {
    using ConfigData = RuntimeConfig::StoredSettings;

    static ConfigData s_data;
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
    static portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;
#endif

    static void lock() {
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
        taskENTER_CRITICAL(&s_mux);
#else
        taskENTER_CRITICAL();
#endif
    }

    static void unlock() {
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
        taskEXIT_CRITICAL(&s_mux);
#else
        taskEXIT_CRITICAL();
#endif
    }

    static ScoreWeights toWeights(const ConfigData& d) {
        ScoreWeights w{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            w[i] = d.weights[i];
        }
        return w;
    }

    static ConfigData defaults() {
        ConfigData d{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            d.weights[i] = Config::Scoring::default_weights[i];
        }
        d.depletion_run = Config::Recommendation::default_depletion_run;
        return d;
    }

    static bool loadFromNvs(ConfigData& out) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(RuntimeConfig::nvs_namespace, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            return false;
        }
        size_t required_size = sizeof(ConfigData);
        err = nvs_get_blob(handle, RuntimeConfig::nvs_key, &out, &required_size);
        nvs_close(handle);
        return err == ESP_OK && required_size == sizeof(ConfigData);
    }

    static bool saveToNvs(const ConfigData& data) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(RuntimeConfig::nvs_namespace, NVS_READWRITE, &handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS open failed: %d", static_cast<int>(err));
            return false;
        }
        err = nvs_set_blob(handle, RuntimeConfig::nvs_key, &data, sizeof(ConfigData));
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS set_blob failed: %d", static_cast<int>(err));
            nvs_close(handle);
            return false;
        }
        err = nvs_commit(handle);
        nvs_close(handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS commit failed: %d", static_cast<int>(err));
            return false;
        }
        return true;
    }

    static ConfigData snapshot() {
        lock();
        ConfigData d = s_data;
        unlock();
        return d;
    }

    static void store(const ConfigData& d) {
        lock();
        s_data = d;
        unlock();
    }
}

namespace RuntimeConfig {
    EngineError init() {
        store(defaults());

        ConfigData stored{};
        if (!loadFromNvs(stored)) {
            LOG_INFO(TAG, "%s", "Using default engine settings (NVS not found or empty)");
            if (!saveToNvs(snapshot())) {
                LOG_WARN(TAG, "%s", "Default engine settings not persisted");
            }
            return EngineError::OK;
        }

        EngineError err = HealthScorer::validateWeights(toWeights(stored));
        if (err == EngineError::OK && !RecommendationEngine::isValidDepletionRun(stored.depletion_run)) {
            err = EngineError::INVALID_RANGE;
        }
        if (err != EngineError::OK) {
            LOG_ERROR(TAG, "Stored engine settings rejected: %s", engineErrorName(err));
            return err;
        }
        store(stored);
        LOG_INFO(TAG, "%s", "Loaded engine settings from NVS");
        return EngineError::OK;
    }

    ScoreWeights getWeights() {
        return toWeights(snapshot());
    }

    uint8_t getDepletionRun() {
        return snapshot().depletion_run;
    }

    EngineError setWeights(const ScoreWeights& weights) {
        EngineError err = HealthScorer::validateWeights(weights);
        if (err != EngineError::OK) {
            return err;
        }
        ConfigData d = snapshot();
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            d.weights[i] = weights[i];
        }
        if (!saveToNvs(d)) {
            return EngineError::PERSISTENCE_FAILED;
        }
        store(d);
        LOG_INFO(TAG, "Updated weights N=%.3f P=%.3f K=%.3f pH=%.3f M=%.3f T=%.3f",
                 weights[0], weights[1], weights[2], weights[3], weights[4], weights[5]);
        return EngineError::OK;
    }

    EngineError setDepletionRun(uint8_t run_length) {
        if (!RecommendationEngine::isValidDepletionRun(run_length)) {
            LOG_ERROR(TAG, "Invalid depletion run length: %u", static_cast<unsigned>(run_length));
            return EngineError::INVALID_RANGE;
        }
        ConfigData d = snapshot();
        d.depletion_run = run_length;
        if (!saveToNvs(d)) {
            return EngineError::PERSISTENCE_FAILED;
        }
        store(d);
        LOG_INFO(TAG, "Updated depletion run length to %u", static_cast<unsigned>(run_length));
        return EngineError::OK;
    }
}
