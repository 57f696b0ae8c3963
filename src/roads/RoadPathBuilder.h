#pragma once

#include "RoadTypes.h"
#include "Pathfinder.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

struct PathBuilderConfig {
    float cellsPerCorridor = 64.0f;     // Target cell count along a corridor
    float minGridResolution = 4.0f;     // Finest cell size (meters)
    float maxGridResolution = 32.0f;    // Coarsest cell size (meters)
    float verticalOffset = 0.15f;       // Road surface height above terrain
    float minRoadLength = 1.0f;         // Shorter corridors are degenerate
    float uvScale = 0.1f;               // V units per meter travelled
};

struct RoadVertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 uv;
};

// Ribbon strip for one road
struct RoadMesh {
    std::vector<RoadVertex> vertices;
    std::vector<uint32_t> indices;

    size_t triangleCount() const { return indices.size() / 3; }
};

// Turns corridor endpoints into terrain-following road paths and ribbon meshes.
// The pathfinder is optional; without one (or when it fails) roads are straight.
class RoadPathBuilder {
public:
    RoadPathBuilder(const TerrainOracle& terrain, Pathfinder* pathfinder,
                    const PathBuilderConfig& config);

    // Cell size proportional to corridor length, clamped to [min, max]
    float gridResolutionFor(float distance) const;

    // Always returns at least 2 terrain-projected points
    std::vector<glm::vec3> buildPath(const glm::vec3& from, const glm::vec3& to, bool allowBridges);

    // Path realized as a road, or nothing for degenerate corridors
    std::optional<RoadRecord> realizeRoad(const glm::vec3& from, const glm::vec3& to,
                                          RoadClass type, float width, bool allowBridges);

    std::optional<RoadRecord> realizeCorridor(const Corridor& corridor, bool allowBridges);

    // One quad per path segment, corner heights re-sampled from the terrain
    RoadMesh buildRibbonMesh(const RoadRecord& road) const;

    void projectOntoTerrain(std::vector<glm::vec3>& path) const;

    size_t getFallbackCount() const { return fallbackCount; }

private:
    const TerrainOracle& terrain;
    Pathfinder* pathfinder;
    PathBuilderConfig config;
    size_t fallbackCount = 0;
};

} // namespace RoadNet
