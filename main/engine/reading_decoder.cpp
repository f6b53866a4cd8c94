#include <main/engine/reading_decoder.hpp>
#include <main/config/config.hpp>
#include <mjson.h>
#include <cstdio>
#include <cstring>

namespace ReadingDecoder {
    void reset(RawSensorSample& out) {
        std::memset(&out, 0, sizeof(out));
    }

    void setFieldId(RawSensorSample& out, const char* field_id) {
        if (field_id == nullptr) {
            out.field_id[0] = '\0';
            return;
        }
        std::strncpy(out.field_id, field_id, sizeof(out.field_id) - 1);
        out.field_id[sizeof(out.field_id) - 1] = '\0';
    }

    void setTimestamp(RawSensorSample& out, uint32_t timestamp_s) {
        out.timestamp_s = timestamp_s;
        out.has_timestamp = true;
    }

    void setValue(RawSensorSample& out, SoilParameter parameter, float value) {
        out.values[parameterIndex(parameter)] = value;
        out.present = static_cast<ParameterMask>(out.present | parameterBit(parameter));
    }

    bool fromJson(const char* json, int length, RawSensorSample& out) {
        reset(out);
        if (json == nullptr || length <= 0) {
            return false;
        }
        const char* tok = nullptr;
        int tok_len = 0;
        if (mjson_find(json, length, "$", &tok, &tok_len) != MJSON_TOK_OBJECT) {
            return false;
        }

        if (mjson_find(json, length, "$.field", &tok, &tok_len) != MJSON_TOK_INVALID) {
            char field_id[Config::Fields::id_capacity];
            if (mjson_get_string(json, length, "$.field", field_id, sizeof(field_id)) >= 0) {
                setFieldId(out, field_id);
            } else {
                out.field_id_malformed = true;
            }
        }

        if (mjson_find(json, length, "$.ts", &tok, &tok_len) != MJSON_TOK_INVALID) {
            double ts = 0.0;
            if (mjson_get_number(json, length, "$.ts", &ts) == 1 && ts >= 0.0 && ts <= 4294967295.0) {
                setTimestamp(out, static_cast<uint32_t>(ts));
            } else {
                out.timestamp_malformed = true;
            }
        }

        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            const SoilParameter p = parameterAt(i);
            char path[16];
            std::snprintf(path, sizeof(path), "$.%s", parameterKey(p));
            double v = 0.0;
            if (mjson_get_number(json, length, path, &v) == 1) {
                setValue(out, p, static_cast<float>(v));
            }
        }
        return true;
    }

    void fromRegisters(const uint16_t* registers, const char* field_id, uint32_t timestamp_s,
                       RawSensorSample& out) {
        using namespace Config::Sensor::Registers;
        reset(out);
        setFieldId(out, field_id);
        setTimestamp(out, timestamp_s);
        if (registers == nullptr) {
            return;
        }
        // Temperature is two's complement so sub-zero soil reads correctly
        const int16_t temp_raw = static_cast<int16_t>(registers[temperature]);
        setValue(out, SoilParameter::TEMPERATURE, static_cast<float>(temp_raw) / tenths_scale);
        setValue(out, SoilParameter::MOISTURE, static_cast<float>(registers[moisture]) / tenths_scale);
        setValue(out, SoilParameter::NITROGEN, static_cast<float>(registers[nitrogen]));
        setValue(out, SoilParameter::PHOSPHORUS, static_cast<float>(registers[phosphorus]));
        setValue(out, SoilParameter::POTASSIUM, static_cast<float>(registers[potassium]));
        setValue(out, SoilParameter::PH, static_cast<float>(registers[ph]) / tenths_scale);
    }
}
