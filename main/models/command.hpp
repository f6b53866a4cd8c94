#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/growth_stage.hpp>
#include <main/models/soil_parameter.hpp>

// Operator command type. Values are stable; they appear in logs.
enum class CommandType : int32_t {
    SET_GROWTH_STAGE  = 1,
    SET_WEIGHTS       = 2,
    SET_DEPLETION_RUN = 3,
};

// Fixed-size command container for inter-task messaging
struct Command {
    uint32_t    timestamp_ms;                 // time command was created
    CommandType type;
    char        field_id[Config::Fields::id_capacity]; // SET_GROWTH_STAGE
    GrowthStage stage;                        // SET_GROWTH_STAGE
    float       weights[kSoilParameterCount]; // SET_WEIGHTS
    int32_t     value;                        // SET_DEPLETION_RUN
};

#endif // COMMAND_HPP
