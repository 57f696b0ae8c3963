#pragma once

#include "RoadTypes.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

enum class ZoneKind : uint8_t {
    RoadCorridor = 0,
    Bridge = 1
};

inline const char* getZoneKindName(ZoneKind kind) {
    return kind == ZoneKind::Bridge ? "bridge" : "road_corridor";
}

// Capsule around a segment that other generators must keep clear of
struct ExclusionZone {
    glm::vec3 start{0.0f};
    glm::vec3 end{0.0f};
    float halfWidth = 0.0f;
    ZoneKind kind = ZoneKind::RoadCorridor;

    bool contains(float x, float z) const;
};

struct ExclusionConfig {
    float margin = 2.0f;            // Extra clearance beyond the road half-width
    float bridgeMargin = 6.0f;      // Extra clearance around water crossings
    float sampleSpacing = 8.0f;     // Water detection spacing along roads
    float seaLevel = 0.0f;
};

// One corridor capsule per path segment, one bridge capsule per water run
std::vector<ExclusionZone> buildExclusionZones(const std::vector<RoadRecord>& roads,
                                               const TerrainOracle& terrain,
                                               const ExclusionConfig& config);

bool isExcluded(const std::vector<ExclusionZone>& zones, float x, float z);

} // namespace RoadNet
