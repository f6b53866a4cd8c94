#ifndef COMMAND_TASK_HPP
#define COMMAND_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/models/command.hpp>
#include <main/engine/soil_health_engine.hpp>

namespace CommandTask {
    // Create task that receives operator commands from command_queue and
    // applies them to the engine (growth stages, weights, depletion run).
    // Weight and run changes are persisted through RuntimeConfig.
    void create(SoilHealthEngine& engine, QueueHandle_t command_queue);

    // Parse one JSON command:
    //   {"command":"set_stage","field":"plot-A","stage":"vegetative"}
    //   {"command":"set_weights","n":0.2,"p":0.15,"k":0.15,"ph":0.2,"moisture":0.2,"temp":0.1}
    //   {"command":"set_depletion_run","value":3}
    // Returns false for unknown commands or missing/malformed members.
    // Value ranges are not checked here; the engine does that on apply.
    bool parse(const char* json, int length, Command& out);

    // parse() and queue; false if parsing fails or the queue is full
    bool submitJson(const char* json, int length);
}

#endif // COMMAND_TASK_HPP
