#include <main/tasks/command_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/state/runtime_config.hpp>
#include <main/engine/recommendation_engine.hpp>
#include <mjson.h>
#include <inttypes.h>
#include <cstring>

static const char* TAG = "CMD_TASK";

namespace {
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static SoilHealthEngine* s_engine = nullptr;
    static QueueHandle_t s_command_queue = nullptr;

    static void applyStage(const Command& cmd) {
        EngineError err = s_engine->setGrowthStage(cmd.field_id, cmd.stage);
        if (err == EngineError::OK) {
            LOG_INFO(TAG, "Command executed: %s stage = %s", cmd.field_id, growthStageName(cmd.stage));
        } else {
            LOG_ERROR(TAG, "Command failed: %s stage = %s (%s)", cmd.field_id,
                      growthStageName(cmd.stage), engineErrorName(err));
        }
    }

    static void applyWeights(const Command& cmd) {
        ScoreWeights weights{};
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            weights[i] = cmd.weights[i];
        }
        // Persist first so a rejected or unsaved set leaves both copies unchanged
        EngineError err = RuntimeConfig::setWeights(weights);
        if (err == EngineError::OK) {
            err = s_engine->setWeights(weights);
        }
        if (err == EngineError::OK) {
            LOG_INFO(TAG, "Command executed: weights = %.3f %.3f %.3f %.3f %.3f %.3f",
                     weights[0], weights[1], weights[2], weights[3], weights[4], weights[5]);
        } else {
            LOG_ERROR(TAG, "Command failed: weights (%s)", engineErrorName(err));
        }
    }

    static void applyDepletionRun(const Command& cmd) {
        if (!RecommendationEngine::isValidDepletionRun(cmd.value)) {
            LOG_ERROR(TAG, "Invalid depletion_run value: %" PRId32, cmd.value);
            return;
        }
        const uint8_t run = static_cast<uint8_t>(cmd.value);
        EngineError err = RuntimeConfig::setDepletionRun(run);
        if (err == EngineError::OK) {
            err = s_engine->setDepletionRun(run);
        }
        if (err == EngineError::OK) {
            LOG_INFO(TAG, "Command executed: depletion_run = %u", static_cast<unsigned>(run));
        } else {
            LOG_ERROR(TAG, "Command failed: depletion_run = %u (%s)", static_cast<unsigned>(run),
                      engineErrorName(err));
        }
    }

    static void handleCommand(const Command& cmd) {
        switch (cmd.type) {
            case CommandType::SET_GROWTH_STAGE:
                applyStage(cmd);
                break;
            case CommandType::SET_WEIGHTS:
                applyWeights(cmd);
                break;
            case CommandType::SET_DEPLETION_RUN:
                applyDepletionRun(cmd);
                break;
            default:
                LOG_WARN(TAG, "Unknown command type: %" PRId32, static_cast<int32_t>(cmd.type));
                break;
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Command Task started");

        Command cmd;
        for (;;) {
            if (xQueueReceive(s_command_queue, &cmd, portMAX_DELAY) != pdTRUE) {
                continue;
            }
            handleCommand(cmd);
        }
    }

    static bool parseStage(const char* json, int length, Command& out) {
        if (mjson_get_string(json, length, "$.field", out.field_id, sizeof(out.field_id)) <= 0) {
            return false;
        }
        char stage[16];
        if (mjson_get_string(json, length, "$.stage", stage, sizeof(stage)) <= 0) {
            return false;
        }
        return parseGrowthStage(stage, out.stage);
    }

    static bool parseWeights(const char* json, int length, Command& out) {
        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            char path[16] = "$.";
            std::strncat(path, parameterKey(parameterAt(i)), sizeof(path) - 3);
            double value = 0.0;
            if (!mjson_get_number(json, length, path, &value)) {
                return false;
            }
            out.weights[i] = static_cast<float>(value);
        }
        return true;
    }

    static bool parseDepletionRun(const char* json, int length, Command& out) {
        double value = 0.0;
        if (!mjson_get_number(json, length, "$.value", &value)) {
            return false;
        }
        // Fractional runs are malformed, not rounded
        if (value != static_cast<double>(static_cast<int32_t>(value))) {
            return false;
        }
        out.value = static_cast<int32_t>(value);
        return true;
    }
}

namespace CommandTask {
    void create(SoilHealthEngine& engine, QueueHandle_t command_queue) {
        s_engine = &engine;
        s_command_queue = command_queue;
        xTaskCreateStatic(taskFunction,
                          "cmd_task",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::NORMAL,
                          s_task_stack,
                          &s_task_tcb);
    }

    bool parse(const char* json, int length, Command& out) {
        std::memset(&out, 0, sizeof(out));
        char name[24];
        if (mjson_get_string(json, length, "$.command", name, sizeof(name)) <= 0) {
            return false;
        }
        if (std::strcmp(name, "set_stage") == 0) {
            out.type = CommandType::SET_GROWTH_STAGE;
            return parseStage(json, length, out);
        }
        if (std::strcmp(name, "set_weights") == 0) {
            out.type = CommandType::SET_WEIGHTS;
            return parseWeights(json, length, out);
        }
        if (std::strcmp(name, "set_depletion_run") == 0) {
            out.type = CommandType::SET_DEPLETION_RUN;
            return parseDepletionRun(json, length, out);
        }
        return false;
    }

    bool submitJson(const char* json, int length) {
        Command cmd;
        if (!parse(json, length, cmd)) {
            LOG_WARN(TAG, "%s", "Malformed command payload");
            return false;
        }
        if (s_command_queue == nullptr) {
            return false;
        }
        cmd.timestamp_ms = static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
        if (xQueueSend(s_command_queue, &cmd, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "command_queue full, dropped command");
            return false;
        }
        return true;
    }
}
