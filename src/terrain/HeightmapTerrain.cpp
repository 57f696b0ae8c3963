#include "HeightmapTerrain.h"
#include <SDL3/SDL_log.h>
#include <lodepng.h>
#include <algorithm>
#include <cmath>

namespace RoadNet {

HeightmapTerrain::HeightmapTerrain(const HeightmapConfig& cfg) : config(cfg) {}

bool HeightmapTerrain::loadHeightmap(const std::string& path) {
    std::vector<unsigned char> image;
    unsigned w, h;

    unsigned error = lodepng::decode(image, w, h, path, LCT_GREY, 16);
    if (error) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load heightmap %s: %s",
                     path.c_str(), lodepng_error_text(error));
        return false;
    }

    if (w != h || w < 2) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Heightmap %s must be square and at least 2x2 (got %u x %u)", path.c_str(), w, h);
        return false;
    }

    std::vector<float> normalized(static_cast<size_t>(w) * h);

    // 16-bit big-endian greyscale
    for (size_t i = 0; i < normalized.size(); i++) {
        uint16_t val = (static_cast<uint16_t>(image[i * 2]) << 8) | image[i * 2 + 1];
        normalized[i] = static_cast<float>(val) / 65535.0f;
    }

    SDL_Log("Loaded heightmap: %s (%u x %u)", path.c_str(), w, h);
    return setHeights(std::move(normalized), w);
}

bool HeightmapTerrain::setHeights(std::vector<float> normalized, uint32_t res) {
    if (res < 2 || normalized.size() != static_cast<size_t>(res) * res) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "HeightmapTerrain: expected %u x %u heights, got %zu", res, res, normalized.size());
        return false;
    }

    heights = std::move(normalized);
    resolution = res;
    return true;
}

float HeightmapTerrain::sampleNormalized(float x, float z) const {
    if (resolution < 2) return 0.0f;

    float u = std::clamp(x / config.terrainSize + 0.5f, 0.0f, 1.0f);
    float v = std::clamp(z / config.terrainSize + 0.5f, 0.0f, 1.0f);

    float fx = u * (resolution - 1);
    float fy = v * (resolution - 1);

    int x0 = static_cast<int>(fx);
    int y0 = static_cast<int>(fy);
    int x1 = std::min(x0 + 1, static_cast<int>(resolution - 1));
    int y1 = std::min(y0 + 1, static_cast<int>(resolution - 1));

    float tx = fx - x0;
    float ty = fy - y0;

    float h00 = heights[y0 * resolution + x0];
    float h10 = heights[y0 * resolution + x1];
    float h01 = heights[y1 * resolution + x0];
    float h11 = heights[y1 * resolution + x1];

    float h0 = glm::mix(h00, h10, tx);
    float h1 = glm::mix(h01, h11, tx);

    return glm::mix(h0, h1, ty);
}

float HeightmapTerrain::height(float x, float z) const {
    float range = config.maxAltitude - config.minAltitude;
    return config.minAltitude + sampleNormalized(x, z) * range;
}

float HeightmapTerrain::slope(float x, float z) const {
    if (resolution < 2) return 0.0f;
    float cellSize = config.terrainSize / static_cast<float>(resolution - 1);
    return slopeFromHeights(*this, x, z, cellSize);
}

} // namespace RoadNet
