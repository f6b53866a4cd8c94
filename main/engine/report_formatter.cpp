#include <main/engine/report_formatter.hpp>
#include <main/config/config.hpp>
#include <mjson.h>
#include <cstdio>

namespace ReportFormatter {
    bool formatRecommendation(const HealthScoreRecord& record, const Recommendation& rec,
                              char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return false;
        }

        // Rationale array body, built in a fixed buffer
        char rationale[160];
        int off = 0;
        rationale[0] = '\0';
        for (uint8_t i = 0; i < rec.rationale.count && off < static_cast<int>(sizeof(rationale)); ++i) {
            off += std::snprintf(rationale + off, sizeof(rationale) - off, "%s\"%s\"",
                                 i == 0 ? "" : ",", parameterName(rec.rationale.parameters[i]));
        }
        if (rec.rationale.post_growth_depletion && off < static_cast<int>(sizeof(rationale))) {
            off += std::snprintf(rationale + off, sizeof(rationale) - off, "%s\"%s\"",
                                 rec.rationale.count == 0 ? "" : ",",
                                 Config::Recommendation::depletion_label);
        }
        if (off >= static_cast<int>(sizeof(rationale))) {
            return false;
        }

        char ts[12];
        std::snprintf(ts, sizeof(ts), "%u", static_cast<unsigned>(record.timestamp_s));

        const int n = mjson_snprintf(out, out_size,
            "{%Q:%Q,%Q:%s,%Q:%g,%Q:%Q,%Q:%Q,%Q:%g,%Q:%Q,%Q:[%s],%Q:%B,%Q:%B}",
            "field", record.field_id,
            "ts", ts,
            "score", static_cast<double>(record.score),
            "stage", growthStageName(record.stage),
            "fertilizer", rec.fertilizer,
            "qty", static_cast<double>(rec.quantity),
            "unit", rec.unit,
            "rationale", rationale,
            "depletion", rec.rationale.post_growth_depletion ? 1 : 0,
            "overdose_clamped", (rec.warnings & WARN_OVERDOSE_CLAMPED) ? 1 : 0);
        // mjson truncates silently; a completely filled buffer counts as overflow
        return n > 0 && static_cast<std::size_t>(n) + 1 < out_size;
    }

    bool formatRejection(const char* field_id, EngineError err, const char* offending,
                         char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        const int n = mjson_snprintf(out, out_size,
            "{%Q:%Q,%Q:%Q,%Q:%Q,%Q:%Q}",
            "field", field_id ? field_id : "",
            "error", engineErrorName(err),
            "category", errorCategoryName(engineErrorCategory(err)),
            "parameter", offending ? offending : "");
        // mjson truncates silently; a completely filled buffer counts as overflow
        return n > 0 && static_cast<std::size_t>(n) + 1 < out_size;
    }
}
