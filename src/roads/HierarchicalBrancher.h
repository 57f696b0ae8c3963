#pragma once

#include "RoadTypes.h"
#include "RoadPathBuilder.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <functional>
#include <random>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

struct BranchConfig {
    float branchInterval = 300.0f;          // Arc length between branch points on a trunk
    float densityIntervalScale = 0.5f;      // Interval shrinks by 1 / (1 + density * scale)
    float branchProbability = 0.6f;         // Gate per branch point
    int maxDepth = 3;                       // Depth levels (0 = branch off the trunk)
    float minBranchLength = 150.0f;
    float maxBranchLength = 400.0f;
    float depthLengthScale = 0.6f;          // Length multiplier per depth level
    float angleVariance = 25.0f;            // Degrees either side of the perpendicular
    float subBranchProbability = 0.15f;     // Child probability at depth 0
    float subBranchDecay = 0.05f;           // Child probability lost per depth level
    float subBranchMinAngle = 30.0f;        // Child turn, degrees
    float subBranchMaxAngle = 60.0f;
    float mergeRadius = 60.0f;              // Endpoint snapping radius
    float minSnapDistance = 5.0f;           // Snap targets this close to the branch start are ignored
    float baseWidth = 5.0f;
    float widthDecrement = 1.0f;            // Width lost per depth level
    float minWidth = 2.5f;
    float boundaryMargin = 100.0f;          // Keep endpoints this far inside the map
    float terrainSize = 16384.0f;           // Map is centered on the origin
    float seaLevel = 0.0f;
    size_t maxBranchRoads = 2000;           // Hard cap per pass
    uint32_t seed = 12345;
};

struct BranchStats {
    size_t branchPoints = 0;                // Points sampled along trunk roads
    size_t rootBranches = 0;                // Depth-0 branches built
    size_t subBranches = 0;
    size_t snapped = 0;
    size_t rejectedWater = 0;
    size_t rejectedBoundary = 0;
};

// Grows branch -> sub-branch -> leaf road trees off trunk and arterial roads.
// Traversal is an explicit FIFO worklist capped at maxDepth.
class HierarchicalBrancher {
public:
    using DensityFn = std::function<float(glm::vec2 xz)>;

    HierarchicalBrancher(const TerrainOracle& terrain, RoadPathBuilder& pathBuilder,
                         const BranchConfig& config);

    // Optional local density lookup; higher density shortens the branch interval
    void setDensityLookup(DensityFn fn) { densityAt = std::move(fn); }

    // Returns only the new branch roads
    std::vector<RoadRecord> generate(const std::vector<RoadRecord>& roads);

    // Arc-length positions strictly inside the path, one per interval
    std::vector<float> branchPointDistances(const RoadRecord& road) const;

    float widthAtDepth(int depth) const;
    float childProbability(int depth) const;

    const BranchStats& getStats() const { return stats; }

private:
    struct BranchTask {
        glm::vec2 start;
        glm::vec2 direction;
        int depth;
    };

    struct PathSample {
        glm::vec2 position;
        glm::vec2 tangent;
    };

    PathSample samplePath(const RoadRecord& road, float distance) const;
    float intervalAt(glm::vec2 position) const;

    bool isNearBoundary(glm::vec2 position) const;

    // Nearest existing endpoint within mergeRadius of candidate, far enough from start
    bool trySnap(glm::vec2 start, glm::vec2 candidate, glm::vec2& outSnapped) const;

    static glm::vec2 rotate(glm::vec2 v, float degrees);

    const TerrainOracle& terrain;
    RoadPathBuilder& pathBuilder;
    BranchConfig config;
    DensityFn densityAt;
    std::mt19937 rng;

    std::vector<glm::vec2> endpoints;   // Append-only within one pass
    BranchStats stats;
};

} // namespace RoadNet
