#ifndef DEFICIENCY_CLASSIFIER_HPP
#define DEFICIENCY_CLASSIFIER_HPP

#include <main/models/sensor_reading.hpp>
#include <main/models/growth_stage.hpp>
#include <main/models/deficiency_result.hpp>
#include <main/engine/nutrient_range_table.hpp>
#include <main/engine/engine_error.hpp>

namespace DeficiencyClassifier {
    // Status and severity of a single value against its range.
    // Severity grows linearly from 0 at the optimal edge to 1 at the critical
    // boundary and stays at 1 beyond it.
    DeficiencyResult classifyValue(const NutrientRange& range, float value);

    // Classify all six parameters in fixed order (N, P, K, pH, moisture, temperature).
    // Returns MISSING_RANGE if the table lacks a row for the stage; 'out' is
    // then left untouched.
    EngineError classify(const SensorReading& reading,
                         GrowthStage stage,
                         const NutrientRangeTable& table,
                         DeficiencyResults& out);
}

#endif // DEFICIENCY_CLASSIFIER_HPP
