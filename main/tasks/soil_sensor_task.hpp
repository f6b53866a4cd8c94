#ifndef SOIL_SENSOR_TASK_HPP
#define SOIL_SENSOR_TASK_HPP

#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

// Simulated RS485 soil probe: every period, produces one register frame per
// plot in Config::Fields::simulated_ids and queues it as a RawSensorSample.
// Stands in for the probe driver until one is wired up.
namespace SoilSensorTask {
    void create(QueueHandle_t readings_queue);

    // Fill a Config::Sensor::Registers::count frame with values typical of a
    // black pepper plot (temperature 22-35 degC, moisture 40-80 %, N 100-250,
    // P 10-60, K 150-300 mg/kg, pH 5.5-7.5, humidity 60-90 %)
    void simulateRegisters(uint16_t* registers);
}

#endif // SOIL_SENSOR_TASK_HPP
