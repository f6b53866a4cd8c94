#ifndef GROWTH_STAGE_HPP
#define GROWTH_STAGE_HPP

#include <cstdint>
#include <cstddef>
#include <cstring>

// Crop lifecycle phase of a field. Ordered: a field only ever moves forward.
enum class GrowthStage : uint8_t {
    PRE_PLANTING = 0,
    VEGETATIVE   = 1,
    FLOWERING    = 2,
    MATURITY     = 3
};

static constexpr std::size_t kGrowthStageCount = 4;

// Set of stages, one bit per GrowthStage
using StageMask = uint8_t;
static constexpr StageMask kAllStagesMask = 0x0F;

inline constexpr StageMask stageBit(GrowthStage s) {
    return static_cast<StageMask>(1u << static_cast<uint8_t>(s));
}

inline constexpr bool isPostPlanting(GrowthStage s) {
    return s != GrowthStage::PRE_PLANTING;
}

inline const char* growthStageName(GrowthStage s) {
    switch (s) {
        case GrowthStage::PRE_PLANTING: return "pre_planting";
        case GrowthStage::VEGETATIVE:   return "vegetative";
        case GrowthStage::FLOWERING:    return "flowering";
        case GrowthStage::MATURITY:     return "maturity";
    }
    return "unknown";
}

// Parse the name produced by growthStageName(). Returns false if unknown.
inline bool parseGrowthStage(const char* name, GrowthStage& out) {
    if (name == nullptr) {
        return false;
    }
    for (std::size_t i = 0; i < kGrowthStageCount; ++i) {
        GrowthStage s = static_cast<GrowthStage>(i);
        if (std::strcmp(name, growthStageName(s)) == 0) {
            out = s;
            return true;
        }
    }
    return false;
}

#endif // GROWTH_STAGE_HPP
