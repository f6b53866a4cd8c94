#ifndef RECOMMENDATION_HPP
#define RECOMMENDATION_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/models/soil_parameter.hpp>

// Soft warnings attached to a successful recommendation
enum RecommendationWarning : uint8_t {
    WARN_NONE             = 0,
    WARN_OVERDOSE_CLAMPED = 1 << 0,
};

// Parameters that drove the fertilizer choice, highest severity first
struct Rationale {
    SoilParameter parameters[kSoilParameterCount];
    uint8_t       count;
    bool          post_growth_depletion;
};

struct Recommendation {
    char      field_id[Config::Fields::id_capacity];
    uint32_t  timestamp_s;
    char      fertilizer[40];
    float     quantity;
    char      unit[12];
    Rationale rationale;
    uint8_t   warnings; // RecommendationWarning flags
};

#endif // RECOMMENDATION_HPP
