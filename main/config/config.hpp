#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <cstddef>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Device {
    static constexpr const char* id = "pepper-node-01";
}

namespace Logging {
    // 0=ERROR, 1=WARN, 2=INFO, 3=DEBUG (see LogLevel)
    static constexpr int default_level = 2;
}

namespace Fields {
    // Field identifiers are fixed-size, null-terminated strings
    static constexpr std::size_t id_capacity = 24;
    // Maximum number of fields tracked concurrently (history + growth stage)
    static constexpr std::size_t max_fields = 8;

    // Plots fed by the simulated sensor source
    static constexpr const char* simulated_ids[] = { "plot-A", "plot-B" };
    static constexpr std::size_t simulated_count = sizeof(simulated_ids) / sizeof(simulated_ids[0]);
}

// Physical plausibility bounds of the RS485 7-in-1 soil probe.
// Readings outside these are rejected, never clamped.
namespace Sensor {
    static constexpr float npk_min_mg_kg = 0.0f;
    static constexpr float npk_max_mg_kg = 1999.0f;
    static constexpr float ph_min = 0.0f;
    static constexpr float ph_max = 14.0f;
    static constexpr float moisture_min_pct = 0.0f;
    static constexpr float moisture_max_pct = 100.0f;
    static constexpr float temp_min_c = -40.0f;
    static constexpr float temp_max_c = 80.0f;

    // Holding register layout (function code 3), one value per register
    namespace Registers {
        static constexpr std::size_t count = 7;
        static constexpr std::size_t temperature = 0; // 0.1 degC, signed
        static constexpr std::size_t moisture    = 1; // 0.1 %
        static constexpr std::size_t nitrogen    = 2; // mg/kg
        static constexpr std::size_t phosphorus  = 3; // mg/kg
        static constexpr std::size_t potassium   = 4; // mg/kg
        static constexpr std::size_t ph          = 5; // 0.1 pH
        static constexpr std::size_t humidity    = 6; // 0.1 % air humidity, not scored
        static constexpr float tenths_scale = 10.0f;
    }
}

namespace Scoring {
    // Default weights in parameter order N, P, K, pH, moisture, temperature.
    // Deployments override them through RuntimeConfig.
    static constexpr float default_weights[6] = {
        1.0f / 6.0f, 1.0f / 6.0f, 1.0f / 6.0f, 1.0f / 6.0f, 1.0f / 6.0f, 1.0f / 6.0f
    };
    static constexpr float weight_sum_tolerance = 1e-3f;
    static constexpr float max_score = 100.0f;
}

namespace Recommendation {
    // Consecutive declining post-planting records needed to flag depletion
    static constexpr uint8_t default_depletion_run = 2;
    static constexpr uint8_t min_depletion_run = 2;
    static constexpr uint8_t max_depletion_run = 8;

    static constexpr const char* maintain_label = "Maintain current regimen";
    static constexpr const char* default_unit = "kg/ha";
    static constexpr const char* depletion_label = "post-growth nutrient depletion";
}

namespace History {
    // Retained records per field (oldest drop out once full)
    static constexpr std::size_t records_per_field = 30;
}

namespace Tasks {
namespace Sensor {
    static constexpr uint32_t period_ms = 60000;
}
namespace Health {
    static constexpr uint32_t idle_wait_ms = 1000;
}
}

// JSON lines accepted on the serial console
namespace Console {
    static constexpr int max_line_length = 256;
    static constexpr uint32_t poll_ms = 100;
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_simulated_sensor = true;
    static constexpr bool enable_command_task     = true;
    static constexpr bool enable_console          = true;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Scoring must keep up with incoming readings
    static constexpr UBaseType_t HIGH     = tskIDLE_PRIORITY + 2;

    // Sample generation and operator commands tolerate latency
    static constexpr UBaseType_t NORMAL   = tskIDLE_PRIORITY + 1;
}

namespace Queues {
    static constexpr UBaseType_t readings_length = 16;
    static constexpr UBaseType_t reports_length  = 8;
    static constexpr UBaseType_t commands_length = 8;
}
}

#endif // CONFIG_HPP
