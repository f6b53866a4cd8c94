#ifndef SENSOR_READING_HPP
#define SENSOR_READING_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/soil_parameter.hpp>

// Sample as received from a source, before validation.
// 'present' carries one bit per parameter that the source actually supplied.
// The *_malformed flags mark a field id or timestamp that was supplied but
// could not be represented (too long, wrong type, out of range).
struct RawSensorSample {
    char          field_id[Config::Fields::id_capacity];
    uint32_t      timestamp_s;                 // UTC epoch seconds
    bool          has_timestamp;
    bool          field_id_malformed;
    bool          timestamp_malformed;
    float         values[kSoilParameterCount]; // indexed by SoilParameter
    ParameterMask present;
};

// Validated measurement; every value lies within its physical bounds.
struct SensorReading {
    char     field_id[Config::Fields::id_capacity];
    uint32_t timestamp_s;
    float    nitrogen_mg_kg;
    float    phosphorus_mg_kg;
    float    potassium_mg_kg;
    float    ph;
    float    moisture_pct;
    float    temperature_c;

    float value(SoilParameter p) const {
        switch (p) {
            case SoilParameter::NITROGEN:    return nitrogen_mg_kg;
            case SoilParameter::PHOSPHORUS:  return phosphorus_mg_kg;
            case SoilParameter::POTASSIUM:   return potassium_mg_kg;
            case SoilParameter::PH:          return ph;
            case SoilParameter::MOISTURE:    return moisture_pct;
            case SoilParameter::TEMPERATURE: return temperature_c;
        }
        return 0.0f;
    }
};

#endif // SENSOR_READING_HPP
