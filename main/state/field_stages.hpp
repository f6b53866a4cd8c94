#ifndef FIELD_STAGES_HPP
#define FIELD_STAGES_HPP

#include <cstddef>
#include <main/models/growth_stage.hpp>
#include <main/engine/engine_error.hpp>

// Growth stage of each field, driven by operator input only.
// Stages move forward monotonically and are never inferred from readings.
namespace FieldStages {
    // Forget all fields (every field reads as PRE_PLANTING afterwards)
    void init();

    // Forward or same-stage transitions only. STAGE_REGRESSION on a backwards
    // move, FIELD_CAPACITY when the field is new and the table is full,
    // MISSING_FIELD for an empty id.
    EngineError set(const char* field_id, GrowthStage stage);

    // PRE_PLANTING for fields never set
    GrowthStage get(const char* field_id);

    std::size_t count();
}

#endif // FIELD_STAGES_HPP
