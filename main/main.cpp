#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/config/crop_profile.hpp>
#include <main/engine/soil_health_engine.hpp>
#include <main/tasks/soil_sensor_task.hpp>
#include <main/tasks/soil_health_task.hpp>
#include <main/tasks/command_task.hpp>
#include <main/tasks/console_task.hpp>
#include <main/models/sensor_reading.hpp>
#include <main/models/command.hpp>
#include <main/models/recommendation_report.hpp>
#include <main/state/runtime_config.hpp>
#include <main/state/field_stages.hpp>
#include <nvs_flash.h>

namespace {
    static SoilHealthEngine s_engine;

    // A broken crop profile or stored setting must never produce recommendations
    static void haltBoot(const char* what, EngineError err) {
        LOG_ERROR("MAIN", "%s rejected: %s", what, engineErrorName(err));
        for (;;) {
            vTaskDelay(portMAX_DELAY);
        }
    }
}

extern "C" void app_main(void)
{
    Logger::setLevel(Logger::levelFromInt(Config::Logging::default_level));
    LOG_INFO("MAIN", "---Soil health engine started (%s, log level %s)---",
             Config::Device::id, Logger::levelName(Logger::getLevel()));

    // Initialize NVS (required before runtime config can use it)
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR("MAIN", "NVS init failed: %d", static_cast<int>(err));
    }

    // Weights and depletion run (load from NVS or use defaults)
    EngineError config_err = RuntimeConfig::init();
    if (config_err != EngineError::OK) {
        haltBoot("Stored engine settings", config_err);
    }
    FieldStages::init();

    EngineConfig engine_config{
        CropProfile::rangeTable(),
        CropProfile::fertilizerTable(),
        RuntimeConfig::getWeights(),
        RuntimeConfig::getDepletionRun(),
    };
    EngineError engine_err = s_engine.init(engine_config);
    if (engine_err != EngineError::OK) {
        haltBoot("Engine configuration", engine_err);
    }

    // Create static queues
    static uint8_t readings_queue_storage[Config::Queues::readings_length * sizeof(RawSensorSample)];
    static StaticQueue_t readings_queue_tcb;
    QueueHandle_t readings_queue = xQueueCreateStatic(
        Config::Queues::readings_length, sizeof(RawSensorSample), readings_queue_storage, &readings_queue_tcb);

    static uint8_t reports_queue_storage[Config::Queues::reports_length * sizeof(RecommendationReport)];
    static StaticQueue_t reports_queue_tcb;
    QueueHandle_t reports_queue = xQueueCreateStatic(
        Config::Queues::reports_length, sizeof(RecommendationReport), reports_queue_storage, &reports_queue_tcb);

    static uint8_t command_queue_storage[Config::Queues::commands_length * sizeof(Command)];
    static StaticQueue_t command_queue_tcb;
    QueueHandle_t command_queue = xQueueCreateStatic(
        Config::Queues::commands_length, sizeof(Command), command_queue_storage, &command_queue_tcb);

    // Start tasks (honor feature toggles). Consumers first so nothing is
    // produced into a queue nobody drains.
    SoilHealthTask::create(s_engine, readings_queue, reports_queue);
    if (Config::Features::enable_command_task) {
        CommandTask::create(s_engine, command_queue);
    }
    if (Config::Features::enable_simulated_sensor) {
        SoilSensorTask::create(readings_queue);
    }
    if (Config::Features::enable_console) {
        ConsoleTask::create();
    }

    // Main task drains reports when no uplink is attached
    RecommendationReport report{};
    for (;;) {
        if (xQueueReceive(reports_queue, &report, portMAX_DELAY) == pdTRUE) {
            LOG_INFO("MAIN", "%s", report.payload);
        }
    }
}
