#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <glm/glm.hpp>

namespace RoadNet {

// Height and slope queries the planner consumes.
// Implementations must be deterministic and side-effect free.
class TerrainOracle {
public:
    virtual ~TerrainOracle() = default;

    // World elevation at XZ position (meters)
    virtual float height(float x, float z) const = 0;

    // Surface slope at XZ position (degrees, 0 = flat)
    virtual float slope(float x, float z) const = 0;

    glm::vec3 project(glm::vec2 xz, float offset = 0.0f) const {
        return glm::vec3(xz.x, height(xz.x, xz.y) + offset, xz.y);
    }
};

// Slope in degrees from central differences of a height function
float slopeFromHeights(const TerrainOracle& terrain, float x, float z, float step);

// Terrain defined by plain functions. Used for analytic terrains and tests.
class FunctionTerrain : public TerrainOracle {
public:
    using HeightFn = std::function<float(float x, float z)>;
    using SlopeFn = std::function<float(float x, float z)>;

    explicit FunctionTerrain(HeightFn heightFn, SlopeFn slopeFn = nullptr, float sampleStep = 1.0f);

    float height(float x, float z) const override;
    float slope(float x, float z) const override;

    static FunctionTerrain flat(float elevation);

private:
    HeightFn heightFn;
    SlopeFn slopeFn;
    float sampleStep;
};

// Memoizes another oracle on a quantized coordinate. Queries are answered at the
// centre of their quantum cell, so results do not depend on query order.
class CachedTerrain : public TerrainOracle {
public:
    CachedTerrain(const TerrainOracle& source, float quantum = 0.25f);

    float height(float x, float z) const override;
    float slope(float x, float z) const override;

    size_t cachedCount() const { return heights.size() + slopes.size(); }
    void clear();

private:
    uint64_t makeKey(float x, float z) const;
    glm::vec2 quantize(float x, float z) const;

    const TerrainOracle& source;
    float quantum;
    mutable std::unordered_map<uint64_t, float> heights;
    mutable std::unordered_map<uint64_t, float> slopes;
};

} // namespace RoadNet
