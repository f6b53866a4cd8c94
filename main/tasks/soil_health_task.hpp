#ifndef SOIL_HEALTH_TASK_HPP
#define SOIL_HEALTH_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/engine/soil_health_engine.hpp>

namespace SoilHealthTask {
    // Drains RawSensorSample items from readings_queue through the engine and
    // emits one RecommendationReport (success or rejection) per reading on
    // reports_queue. reports_queue may be nullptr, in which case reports are
    // only logged.
    void create(SoilHealthEngine& engine, QueueHandle_t readings_queue, QueueHandle_t reports_queue);

    // Decode a JSON reading from an external transport and queue it.
    // Returns false if the payload is not a JSON object or the queue is full.
    bool submitJson(const char* json, int length);
}

#endif // SOIL_HEALTH_TASK_HPP
