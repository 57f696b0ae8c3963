#pragma once

#include "Pathfinder.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

struct TerrainPathfinderConfig {
    float seaLevel = 0.0f;              // Cells below this are water
    float corridorMargin = 0.25f;       // Search area margin as a fraction of corridor length
    float minMargin = 64.0f;            // Minimum search area margin (meters)
    uint32_t maxGridCells = 512;        // Cap on cells per axis

    // Cost weights
    float slopeCostMultiplier = 5.0f;   // Extra cost per unit of slope/45deg
    float waterPenalty = 200.0f;        // Penalty for each water cell entered
    float cliffPenalty = 500.0f;        // Penalty for cliff cells
    float cliffSlopeDegrees = 35.0f;    // Slope above this is a cliff

    // Simplification
    float simplifyEpsilon = 4.0f;       // Douglas-Peucker threshold (meters)
};

// A* over a grid laid across the corridor's bounding box
class TerrainPathfinder : public Pathfinder {
public:
    TerrainPathfinder(const TerrainOracle& terrain, const TerrainPathfinderConfig& config);

    std::vector<glm::vec3> findPath(const glm::vec3& from, const glm::vec3& to,
                                    const PathRequest& request) override;

    size_t getLastIterationCount() const { return lastIterations; }

private:
    struct PathNode {
        int x, y;
        float gCost;
        float hCost;
        float fCost() const { return gCost + hCost; }
    };

    // Search grid covering one request
    struct SearchGrid {
        glm::vec2 origin{0.0f};
        float cellSize = 1.0f;
        int width = 0;
        int height = 0;

        glm::ivec2 worldToGrid(glm::vec2 worldPos) const;
        glm::vec2 gridToWorld(glm::ivec2 gridPos) const;
        bool isValid(glm::ivec2 pos) const;
        int index(glm::ivec2 pos) const { return pos.y * width + pos.x; }
    };

    SearchGrid makeGrid(glm::vec2 start, glm::vec2 end, float resolution) const;

    // Returns a negative cost for impassable steps
    float stepCost(const SearchGrid& grid, glm::ivec2 from, glm::ivec2 to, bool allowBridges) const;

    void simplifyPath(std::vector<glm::vec2>& points) const;
    void douglasPeucker(const std::vector<glm::vec2>& points, float epsilon,
                        std::vector<glm::vec2>& outPoints, size_t startIdx, size_t endIdx) const;

    const TerrainOracle& terrain;
    TerrainPathfinderConfig config;
    size_t lastIterations = 0;
};

} // namespace RoadNet
