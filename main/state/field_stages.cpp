#include <main/state/field_stages.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/portmacro.h>
#include <cstring>

static const char* TAG = "FIELD_STAGES";

namespace {
    struct StageEntry {
        bool        used;
        char        field_id[Config::Fields::id_capacity];
        GrowthStage stage;
    };
    static StageEntry s_entries[Config::Fields::max_fields];
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

    // Caller holds the lock
    static StageEntry* find(const char* field_id) {
        for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
            if (s_entries[i].used &&
                std::strncmp(s_entries[i].field_id, field_id, sizeof(s_entries[i].field_id)) == 0) {
                return &s_entries[i];
            }
        }
        return nullptr;
    }
}

namespace FieldStages {
    void init() {
        lock();
        for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
            s_entries[i].used = false;
            s_entries[i].field_id[0] = '\0';
            s_entries[i].stage = GrowthStage::PRE_PLANTING;
        }
        unlock();
    }

    EngineError set(const char* field_id, GrowthStage stage) {
        if (field_id == nullptr || field_id[0] == '\0') {
            return EngineError::MISSING_FIELD;
        }
        EngineError err = EngineError::OK;
        GrowthStage previous = GrowthStage::PRE_PLANTING;

        lock();
        StageEntry* e = find(field_id);
        if (e == nullptr) {
            for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
                if (!s_entries[i].used) {
                    e = &s_entries[i];
                    e->used = true;
                    std::strncpy(e->field_id, field_id, sizeof(e->field_id) - 1);
                    e->field_id[sizeof(e->field_id) - 1] = '\0';
                    e->stage = GrowthStage::PRE_PLANTING;
                    break;
                }
            }
        }
        if (e == nullptr) {
            err = EngineError::FIELD_CAPACITY;
        } else {
            previous = e->stage;
            if (stage < previous) {
                err = EngineError::STAGE_REGRESSION;
            } else {
                e->stage = stage;
            }
        }
        unlock();

        if (err == EngineError::STAGE_REGRESSION) {
            LOG_WARN(TAG, "Refused stage regression for %s: %s -> %s", field_id,
                     growthStageName(previous), growthStageName(stage));
        } else if (err == EngineError::FIELD_CAPACITY) {
            LOG_WARN(TAG, "No stage slot left for field %s", field_id);
        } else if (previous != stage) {
            LOG_INFO(TAG, "Field %s: %s -> %s", field_id, growthStageName(previous), growthStageName(stage));
        }
        return err;
    }

    GrowthStage get(const char* field_id) {
        if (field_id == nullptr) {
            return GrowthStage::PRE_PLANTING;
        }
        lock();
        const StageEntry* e = find(field_id);
        GrowthStage stage = e ? e->stage : GrowthStage::PRE_PLANTING;
        unlock();
        return stage;
    }

    std::size_t count() {
        std::size_t n = 0;
        lock();
        for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
            if (s_entries[i].used) {
                ++n;
            }
        }
        unlock();
        return n;
    }
}
