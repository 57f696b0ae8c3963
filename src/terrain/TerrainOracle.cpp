#include "TerrainOracle.h"
#include <cmath>
#include <utility>

namespace RoadNet {

float slopeFromHeights(const TerrainOracle& terrain, float x, float z, float step) {
    float hL = terrain.height(x - step, z);
    float hR = terrain.height(x + step, z);
    float hU = terrain.height(x, z - step);
    float hD = terrain.height(x, z + step);

    float dhdx = (hR - hL) / (2.0f * step);
    float dhdz = (hD - hU) / (2.0f * step);

    float gradient = std::sqrt(dhdx * dhdx + dhdz * dhdz);
    return glm::degrees(std::atan(gradient));
}

// ============================================================================
// FunctionTerrain
// ============================================================================

FunctionTerrain::FunctionTerrain(HeightFn h, SlopeFn s, float step)
    : heightFn(std::move(h)), slopeFn(std::move(s)), sampleStep(step) {}

float FunctionTerrain::height(float x, float z) const {
    return heightFn ? heightFn(x, z) : 0.0f;
}

float FunctionTerrain::slope(float x, float z) const {
    if (slopeFn) return slopeFn(x, z);
    return slopeFromHeights(*this, x, z, sampleStep);
}

FunctionTerrain FunctionTerrain::flat(float elevation) {
    return FunctionTerrain(
        [elevation](float, float) { return elevation; },
        [](float, float) { return 0.0f; });
}

// ============================================================================
// CachedTerrain
// ============================================================================

CachedTerrain::CachedTerrain(const TerrainOracle& src, float q)
    : source(src), quantum(q > 0.0f ? q : 0.25f) {}

uint64_t CachedTerrain::makeKey(float x, float z) const {
    int32_t qx = static_cast<int32_t>(std::floor(x / quantum));
    int32_t qz = static_cast<int32_t>(std::floor(z / quantum));
    return (static_cast<uint64_t>(static_cast<uint32_t>(qx)) << 32) |
           static_cast<uint32_t>(qz);
}

// Every query inside a cell is answered from the cell centre
glm::vec2 CachedTerrain::quantize(float x, float z) const {
    return glm::vec2((std::floor(x / quantum) + 0.5f) * quantum,
                     (std::floor(z / quantum) + 0.5f) * quantum);
}

float CachedTerrain::height(float x, float z) const {
    uint64_t key = makeKey(x, z);
    auto it = heights.find(key);
    if (it != heights.end()) return it->second;

    glm::vec2 q = quantize(x, z);
    float h = source.height(q.x, q.y);
    heights.emplace(key, h);
    return h;
}

float CachedTerrain::slope(float x, float z) const {
    uint64_t key = makeKey(x, z);
    auto it = slopes.find(key);
    if (it != slopes.end()) return it->second;

    glm::vec2 q = quantize(x, z);
    float s = source.slope(q.x, q.y);
    slopes.emplace(key, s);
    return s;
}

void CachedTerrain::clear() {
    heights.clear();
    slopes.clear();
}

} // namespace RoadNet
