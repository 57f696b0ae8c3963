#pragma once

#include "TerrainOracle.h"
#include <cstdint>
#include <string>
#include <vector>

namespace RoadNet {

struct HeightmapConfig {
    float terrainSize = 16384.0f;   // World size in meters, centered on the origin
    float minAltitude = -20.0f;     // World height of normalized 0
    float maxAltitude = 200.0f;     // World height of normalized 1
};

// Terrain oracle backed by a square grid of normalized heights.
// Heightmap texel (0,0) sits at world (-terrainSize/2, -terrainSize/2).
class HeightmapTerrain : public TerrainOracle {
public:
    HeightmapTerrain() = default;
    explicit HeightmapTerrain(const HeightmapConfig& config);

    // Load 16-bit greyscale PNG (normalized to [0,1])
    bool loadHeightmap(const std::string& path);

    // Use an in-memory grid of normalized heights (row-major, resolution^2 values)
    bool setHeights(std::vector<float> normalized, uint32_t resolution);

    float height(float x, float z) const override;
    float slope(float x, float z) const override;

    bool isLoaded() const { return resolution > 1; }
    uint32_t getResolution() const { return resolution; }
    const HeightmapConfig& getConfig() const { return config; }

private:
    float sampleNormalized(float x, float z) const;

    HeightmapConfig config;
    std::vector<float> heights;
    uint32_t resolution = 0;
};

} // namespace RoadNet
