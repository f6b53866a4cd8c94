#ifndef REPORT_FORMATTER_HPP
#define REPORT_FORMATTER_HPP

#include <cstddef>
#include <main/models/health_score_record.hpp>
#include <main/models/recommendation.hpp>
#include <main/engine/engine_error.hpp>

namespace ReportFormatter {
    // Recommendation report for delivery collaborators:
    // {"field":..,"ts":..,"score":..,"stage":..,"fertilizer":..,"qty":..,"unit":..,
    //  "rationale":["nitrogen",..,"post-growth nutrient depletion"],
    //  "depletion":bool,"overdose_clamped":bool}
    // Returns false if the output buffer was too small.
    bool formatRecommendation(const HealthScoreRecord& record, const Recommendation& rec,
                              char* out, std::size_t out_size);

    // Categorized rejection of a single reading:
    // {"field":..,"error":"OUT_OF_ORDER_READING","category":"input","parameter":..}
    bool formatRejection(const char* field_id, EngineError err, const char* offending,
                         char* out, std::size_t out_size);
}

#endif // REPORT_FORMATTER_HPP
