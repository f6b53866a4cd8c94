#ifndef READING_NORMALIZER_HPP
#define READING_NORMALIZER_HPP

#include <main/models/sensor_reading.hpp>
#include <main/models/soil_parameter.hpp>
#include <main/engine/engine_error.hpp>

namespace ReadingNormalizer {
    struct PhysicalBounds {
        float min;
        float max;
    };

    // Inclusive plausibility range of a parameter (Config::Sensor)
    PhysicalBounds physicalBounds(SoilParameter parameter);

    // Validate a raw sample and copy it into 'out' unchanged.
    //  - MISSING_FIELD   : empty field id, no timestamp, or a parameter not supplied
    //  - INVALID_READING : a value that is not finite or lies outside its bounds
    // On failure 'offending' (if non-null) names the field or parameter and
    // 'out' is left untouched.
    EngineError normalize(const RawSensorSample& raw, SensorReading& out, const char** offending);
}

#endif // READING_NORMALIZER_HPP
