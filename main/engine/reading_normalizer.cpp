#include <main/engine/reading_normalizer.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <cmath>
#include <cstring>

static const char* TAG = "NORMALIZER";

namespace {
    static EngineError reject(EngineError err, const char* name, const char** offending) {
        if (offending != nullptr) {
            *offending = name;
        }
        return err;
    }
}

namespace ReadingNormalizer {
    PhysicalBounds physicalBounds(SoilParameter parameter) {
        using namespace Config::Sensor;
        switch (parameter) {
            case SoilParameter::NITROGEN:
            case SoilParameter::PHOSPHORUS:
            case SoilParameter::POTASSIUM:
                return { npk_min_mg_kg, npk_max_mg_kg };
            case SoilParameter::PH:
                return { ph_min, ph_max };
            case SoilParameter::MOISTURE:
                return { moisture_min_pct, moisture_max_pct };
            case SoilParameter::TEMPERATURE:
                return { temp_min_c, temp_max_c };
        }
        return { 0.0f, 0.0f };
    }

    EngineError normalize(const RawSensorSample& raw, SensorReading& out, const char** offending) {
        if (offending != nullptr) {
            *offending = nullptr;
        }
        if (raw.field_id_malformed) {
            LOG_WARN(TAG, "%s", "Rejected sample with an unusable field id");
            return reject(EngineError::INVALID_READING, "field_id", offending);
        }
        if (raw.field_id[0] == '\0' ||
            std::memchr(raw.field_id, '\0', sizeof(raw.field_id)) == nullptr) {
            LOG_WARN(TAG, "%s", "Rejected sample without a usable field id");
            return reject(EngineError::MISSING_FIELD, "field_id", offending);
        }
        if (raw.timestamp_malformed) {
            LOG_WARN(TAG, "Rejected sample for %s: timestamp out of range", raw.field_id);
            return reject(EngineError::INVALID_READING, "timestamp", offending);
        }
        if (!raw.has_timestamp) {
            LOG_WARN(TAG, "Rejected sample for %s: missing timestamp", raw.field_id);
            return reject(EngineError::MISSING_FIELD, "timestamp", offending);
        }

        for (std::size_t i = 0; i < kSoilParameterCount; ++i) {
            const SoilParameter p = parameterAt(i);
            if ((raw.present & parameterBit(p)) == 0) {
                LOG_WARN(TAG, "Rejected sample for %s: missing %s", raw.field_id, parameterName(p));
                return reject(EngineError::MISSING_FIELD, parameterName(p), offending);
            }
            const float v = raw.values[i];
            const PhysicalBounds b = physicalBounds(p);
            if (!std::isfinite(v) || v < b.min || v > b.max) {
                LOG_WARN(TAG, "Rejected sample for %s: %s=%.2f outside [%.1f, %.1f]",
                         raw.field_id, parameterName(p), v, b.min, b.max);
                return reject(EngineError::INVALID_READING, parameterName(p), offending);
            }
        }

        SensorReading r{};
        std::memcpy(r.field_id, raw.field_id, sizeof(r.field_id));
        r.timestamp_s      = raw.timestamp_s;
        r.nitrogen_mg_kg   = raw.values[parameterIndex(SoilParameter::NITROGEN)];
        r.phosphorus_mg_kg = raw.values[parameterIndex(SoilParameter::PHOSPHORUS)];
        r.potassium_mg_kg  = raw.values[parameterIndex(SoilParameter::POTASSIUM)];
        r.ph               = raw.values[parameterIndex(SoilParameter::PH)];
        r.moisture_pct     = raw.values[parameterIndex(SoilParameter::MOISTURE)];
        r.temperature_c    = raw.values[parameterIndex(SoilParameter::TEMPERATURE)];
        out = r;
        return EngineError::OK;
    }
}
