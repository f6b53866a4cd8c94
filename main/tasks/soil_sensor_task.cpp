#include <main/tasks/soil_sensor_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <esp_random.h>
#include <main/engine/reading_decoder.hpp>
#include <main/models/sensor_reading.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <ctime>

namespace {
    static const char* TAG = "SENSOR_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[3072 / sizeof(StackType_t)];

    static QueueHandle_t s_readings_queue = nullptr;

    // Uniform value in [lo, hi] with the given register scale
    static uint16_t uniformRegister(float lo, float hi, float scale) {
        const float unit = static_cast<float>(esp_random()) / 4294967295.0f;
        return static_cast<uint16_t>((lo + (hi - lo) * unit) * scale + 0.5f);
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "Simulated soil probe started (%u plots)",
                 static_cast<unsigned>(Config::Fields::simulated_count));

        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Sensor::period_ms);

        for (;;) {
            const uint32_t now_s = static_cast<uint32_t>(time(nullptr));
            for (std::size_t i = 0; i < Config::Fields::simulated_count; ++i) {
                uint16_t registers[Config::Sensor::Registers::count];
                SoilSensorTask::simulateRegisters(registers);

                RawSensorSample sample{};
                ReadingDecoder::fromRegisters(registers, Config::Fields::simulated_ids[i], now_s, sample);
                if (xQueueSend(s_readings_queue, &sample, 0) != pdTRUE) {
                    LOG_WARN(TAG, "Readings queue full, dropped sample for %s",
                             Config::Fields::simulated_ids[i]);
                }
            }
            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace SoilSensorTask {
    void simulateRegisters(uint16_t* registers) {
        using namespace Config::Sensor::Registers;
        registers[temperature] = uniformRegister(22.0f, 35.0f, tenths_scale);
        registers[moisture]    = uniformRegister(40.0f, 80.0f, tenths_scale);
        registers[nitrogen]    = uniformRegister(100.0f, 250.0f, 1.0f);
        registers[phosphorus]  = uniformRegister(10.0f, 60.0f, 1.0f);
        registers[potassium]   = uniformRegister(150.0f, 300.0f, 1.0f);
        registers[ph]          = uniformRegister(5.5f, 7.5f, tenths_scale);
        registers[humidity]    = uniformRegister(60.0f, 90.0f, tenths_scale);
    }

    void create(QueueHandle_t readings_queue) {
        s_readings_queue = readings_queue;
        xTaskCreateStatic(taskFunction, "soil_sensor",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
