#include "ExclusionZones.h"
#include <algorithm>
#include <cmath>

namespace RoadNet {

bool ExclusionZone::contains(float x, float z) const {
    glm::vec2 p(x, z);
    glm::vec2 a(start.x, start.z);
    glm::vec2 b(end.x, end.z);
    glm::vec2 ab = b - a;

    float lenSq = glm::dot(ab, ab);
    float t = lenSq > 0.0f ? std::clamp(glm::dot(p - a, ab) / lenSq, 0.0f, 1.0f) : 0.0f;
    glm::vec2 closest = a + ab * t;

    return glm::distance(p, closest) <= halfWidth;
}

std::vector<ExclusionZone> buildExclusionZones(const std::vector<RoadRecord>& roads,
                                               const TerrainOracle& terrain,
                                               const ExclusionConfig& config) {
    std::vector<ExclusionZone> zones;
    float spacing = std::max(config.sampleSpacing, 0.5f);

    for (const auto& road : roads) {
        for (size_t i = 1; i < road.path.size(); i++) {
            ExclusionZone zone;
            zone.start = road.path[i-1];
            zone.end = road.path[i];
            zone.halfWidth = road.width * 0.5f + config.margin;
            zone.kind = ZoneKind::RoadCorridor;
            zones.push_back(zone);
        }

        // Contiguous water runs along the road become bridge zones
        bool inWater = false;
        glm::vec3 runStart(0.0f);
        glm::vec3 runEnd(0.0f);

        auto closeRun = [&]() {
            ExclusionZone bridge;
            bridge.start = runStart;
            bridge.end = runEnd;
            bridge.halfWidth = road.width * 0.5f + config.bridgeMargin;
            bridge.kind = ZoneKind::Bridge;
            zones.push_back(bridge);
            inWater = false;
        };

        for (size_t i = 1; i < road.path.size(); i++) {
            const glm::vec3& p0 = road.path[i-1];
            const glm::vec3& p1 = road.path[i];
            float segLength = horizontalDistance(p0, p1);
            int steps = std::max(1, static_cast<int>(std::ceil(segLength / spacing)));

            for (int k = (i == 1 ? 0 : 1); k <= steps; k++) {
                glm::vec3 p = glm::mix(p0, p1, static_cast<float>(k) / static_cast<float>(steps));
                bool water = terrain.height(p.x, p.z) < config.seaLevel;

                if (water) {
                    if (!inWater) {
                        runStart = p;
                        inWater = true;
                    }
                    runEnd = p;
                } else if (inWater) {
                    closeRun();
                }
            }
        }
        if (inWater) closeRun();
    }

    return zones;
}

bool isExcluded(const std::vector<ExclusionZone>& zones, float x, float z) {
    return std::any_of(zones.begin(), zones.end(),
                       [x, z](const ExclusionZone& zone) { return zone.contains(x, z); });
}

} // namespace RoadNet
