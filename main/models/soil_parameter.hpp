#ifndef SOIL_PARAMETER_HPP
#define SOIL_PARAMETER_HPP

#include <cstdint>
#include <cstddef>

// Scored soil parameters. Enumerator order is the fixed processing order and
// also the severity tie-break priority (N > P > K > pH > moisture > temperature).
enum class SoilParameter : uint8_t {
    NITROGEN    = 0,
    PHOSPHORUS  = 1,
    POTASSIUM   = 2,
    PH          = 3,
    MOISTURE    = 4,
    TEMPERATURE = 5
};

static constexpr std::size_t kSoilParameterCount = 6;

// Set of parameters, one bit per SoilParameter
using ParameterMask = uint8_t;
static constexpr ParameterMask kAllParametersMask = 0x3F;

inline constexpr std::size_t parameterIndex(SoilParameter p) {
    return static_cast<std::size_t>(p);
}

inline constexpr SoilParameter parameterAt(std::size_t index) {
    return static_cast<SoilParameter>(index);
}

inline constexpr ParameterMask parameterBit(SoilParameter p) {
    return static_cast<ParameterMask>(1u << static_cast<uint8_t>(p));
}

inline const char* parameterName(SoilParameter p) {
    switch (p) {
        case SoilParameter::NITROGEN:    return "nitrogen";
        case SoilParameter::PHOSPHORUS:  return "phosphorus";
        case SoilParameter::POTASSIUM:   return "potassium";
        case SoilParameter::PH:          return "ph";
        case SoilParameter::MOISTURE:    return "moisture";
        case SoilParameter::TEMPERATURE: return "temperature";
    }
    return "unknown";
}

// Short key used in JSON payloads
inline const char* parameterKey(SoilParameter p) {
    switch (p) {
        case SoilParameter::NITROGEN:    return "n";
        case SoilParameter::PHOSPHORUS:  return "p";
        case SoilParameter::POTASSIUM:   return "k";
        case SoilParameter::PH:          return "ph";
        case SoilParameter::MOISTURE:    return "moisture";
        case SoilParameter::TEMPERATURE: return "temp";
    }
    return "";
}

#endif // SOIL_PARAMETER_HPP
