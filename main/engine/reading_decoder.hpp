#ifndef READING_DECODER_HPP
#define READING_DECODER_HPP

#include <cstdint>
#include <cstddef>
#include <main/models/sensor_reading.hpp>
#include <main/models/soil_parameter.hpp>

// Turns external payloads into RawSensorSample. Decoding never validates
// ranges; that is ReadingNormalizer's job. Absent inputs leave the matching
// presence bit cleared. A field id that does not fit or a timestamp that is
// not a uint32 epoch is flagged malformed rather than treated as absent.
namespace ReadingDecoder {
    // Empty sample: no field id, no timestamp, no parameters present
    void reset(RawSensorSample& out);

    void setFieldId(RawSensorSample& out, const char* field_id);
    void setTimestamp(RawSensorSample& out, uint32_t timestamp_s);
    void setValue(RawSensorSample& out, SoilParameter parameter, float value);

    // JSON object payload, e.g.
    //   {"field":"plot-A","ts":1765411200,"n":180,"p":32,"k":210,"ph":6.1,"moisture":58.5,"temp":26.4}
    // Returns false if the payload is not a JSON object.
    bool fromJson(const char* json, int length, RawSensorSample& out);

    // Holding registers 0..6 of the RS485 soil probe (Config::Sensor::Registers).
    // Per-parameter conversion:
    //   temperature : signed 16-bit, 0.1 degC  -> degC
    //   moisture    : unsigned, 0.1 %          -> %
    //   N, P, K     : unsigned, mg/kg          -> mg/kg (unchanged)
    //   pH          : unsigned, 0.1 pH         -> pH
    //   humidity    : air humidity, ignored
    // 'registers' must hold Config::Sensor::Registers::count values.
    void fromRegisters(const uint16_t* registers, const char* field_id, uint32_t timestamp_s,
                       RawSensorSample& out);
}

#endif // READING_DECODER_HPP
