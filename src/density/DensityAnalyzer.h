#pragma once

#include "roads/RoadTypes.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

enum class DensityClass : uint8_t {
    UrbanCore = 0,
    Urban = 1,
    Suburban = 2,
    Rural = 3
};

inline const char* getDensityClassName(DensityClass densityClass) {
    switch (densityClass) {
        case DensityClass::UrbanCore: return "urban_core";
        case DensityClass::Urban:     return "urban";
        case DensityClass::Suburban:  return "suburban";
        case DensityClass::Rural:     return "rural";
        default:                      return "unknown";
    }
}

// Minimum smoothed scores per class (descending) and the fixed radius per class
struct DensityThresholds {
    float urbanCore = 12.0f;
    float urban = 6.0f;
    float suburban = 3.0f;
    float rural = 1.5f;

    float urbanCoreRadius = 300.0f;
    float urbanRadius = 200.0f;
    float suburbanRadius = 120.0f;
    float ruralRadius = 60.0f;
};

struct DensityConfig {
    float cellSize = 50.0f;
    float intersectionDistance = 20.0f;     // Endpoints closer than this form an intersection
    bool detectSegmentCrossings = false;    // Also count true segment crossings between roads
    float roadWeight = 1.0f;
    float intersectionWeight = 5.0f;
    int smoothingIterations = 2;
    DensityThresholds thresholds;
};

struct CellKey {
    int x = 0;
    int z = 0;

    bool operator==(const CellKey& other) const { return x == other.x && z == other.z; }
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(key.x)) << 32) |
                          static_cast<uint32_t>(key.z);
        return std::hash<uint64_t>()(packed);
    }
};

struct DensityCell {
    int roadCount = 0;
    int intersectionCount = 0;
    float score = 0.0f;
};

// Sparse uniform grid; cells exist only where something was rasterized
class DensityGrid {
public:
    explicit DensityGrid(float cellSize = 50.0f);

    CellKey keyFor(float x, float z) const;
    glm::vec2 cellCenter(const CellKey& key) const;

    DensityCell& touch(const CellKey& key) { return cells[key]; }
    const DensityCell* find(const CellKey& key) const;

    // Score at a world position (0 outside the populated cells)
    float scoreAt(float x, float z) const;

    float getCellSize() const { return cellSize; }
    size_t size() const { return cells.size(); }
    bool empty() const { return cells.empty(); }

    using CellMap = std::unordered_map<CellKey, DensityCell, CellKeyHash>;
    const CellMap& getCells() const { return cells; }
    CellMap& getCells() { return cells; }

private:
    float cellSize;
    CellMap cells;
};

struct EmergentSettlement {
    glm::vec3 center{0.0f};
    float radius = 0.0f;
    float densityScore = 0.0f;
    DensityClass densityClass = DensityClass::Rural;
};

// Infers settlement centers from road network topology
class DensityAnalyzer {
public:
    explicit DensityAnalyzer(const DensityConfig& config = DensityConfig(),
                             const TerrainOracle* terrain = nullptr);

    // Road and intersection counts per cell, scored but not smoothed
    DensityGrid rasterize(const std::vector<RoadRecord>& roads) const;

    // Intersection points from endpoint proximity (and segment crossings when enabled)
    std::vector<glm::vec2> findIntersections(const std::vector<RoadRecord>& roads) const;

    void score(DensityGrid& grid) const;

    // Each pass averages every cell with its present 8-neighbours
    void smooth(DensityGrid& grid, int iterations) const;

    // Local maxima at or above the rural threshold, strongest first.
    // Connected maxima sharing one score are a plateau and yield a single centre.
    std::vector<EmergentSettlement> extractSettlements(const DensityGrid& grid,
                                                       const DensityThresholds& thresholds) const;

    // rasterize -> smooth -> extract
    std::vector<EmergentSettlement> analyze(const std::vector<RoadRecord>& roads,
                                            DensityGrid* outGrid = nullptr) const;

    static DensityClass classify(float score, const DensityThresholds& thresholds);
    static float radiusFor(DensityClass densityClass, const DensityThresholds& thresholds);

    const DensityConfig& getConfig() const { return config; }

private:
    void findSegmentCrossings(const std::vector<RoadRecord>& roads,
                              std::vector<glm::vec2>& outPoints) const;

    DensityConfig config;
    const TerrainOracle* terrain;
};

} // namespace RoadNet
