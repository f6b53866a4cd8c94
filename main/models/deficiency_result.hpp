#ifndef DEFICIENCY_RESULT_HPP
#define DEFICIENCY_RESULT_HPP

#include <array>
#include <cstdint>
#include <main/models/soil_parameter.hpp>

enum class NutrientStatus : uint8_t {
    DEFICIENT = 0,
    OPTIMAL   = 1,
    EXCESS    = 2
};

// severity: 0 at the optimal boundary, 1 at or beyond the critical boundary
struct DeficiencyResult {
    SoilParameter  parameter;
    NutrientStatus status;
    float          severity;
};

// Always six entries, in SoilParameter order
using DeficiencyResults = std::array<DeficiencyResult, kSoilParameterCount>;

inline const char* nutrientStatusName(NutrientStatus s) {
    switch (s) {
        case NutrientStatus::DEFICIENT: return "deficient";
        case NutrientStatus::OPTIMAL:   return "optimal";
        case NutrientStatus::EXCESS:    return "excess";
    }
    return "unknown";
}

#endif // DEFICIENCY_RESULT_HPP
