#include "DensityAnalyzer.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace RoadNet {

namespace {

const CellKey kNeighborOffsets[] = {
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1}
};

float cross2(glm::vec2 a, glm::vec2 b) {
    return a.x * b.y - a.y * b.x;
}

// Proper crossing of p0-p1 and q0-q1 away from both segments' ends
bool segmentsCross(glm::vec2 p0, glm::vec2 p1, glm::vec2 q0, glm::vec2 q1, glm::vec2& outPoint) {
    glm::vec2 r = p1 - p0;
    glm::vec2 s = q1 - q0;
    float denom = cross2(r, s);
    if (std::abs(denom) < 1e-6f) return false;

    glm::vec2 qp = q0 - p0;
    float t = cross2(qp, s) / denom;
    float u = cross2(qp, r) / denom;

    const float eps = 1e-3f;
    if (t <= eps || t >= 1.0f - eps || u <= eps || u >= 1.0f - eps) return false;

    outPoint = p0 + r * t;
    return true;
}

} // namespace

// ============================================================================
// DensityGrid
// ============================================================================

DensityGrid::DensityGrid(float size) : cellSize(size > 0.0f ? size : 50.0f) {}

CellKey DensityGrid::keyFor(float x, float z) const {
    return CellKey{static_cast<int>(std::floor(x / cellSize)),
                   static_cast<int>(std::floor(z / cellSize))};
}

glm::vec2 DensityGrid::cellCenter(const CellKey& key) const {
    return glm::vec2((static_cast<float>(key.x) + 0.5f) * cellSize,
                     (static_cast<float>(key.z) + 0.5f) * cellSize);
}

const DensityCell* DensityGrid::find(const CellKey& key) const {
    auto it = cells.find(key);
    return it != cells.end() ? &it->second : nullptr;
}

float DensityGrid::scoreAt(float x, float z) const {
    const DensityCell* cell = find(keyFor(x, z));
    return cell ? cell->score : 0.0f;
}

// ============================================================================
// DensityAnalyzer
// ============================================================================

DensityAnalyzer::DensityAnalyzer(const DensityConfig& cfg, const TerrainOracle* t)
    : config(cfg), terrain(t) {}

DensityGrid DensityAnalyzer::rasterize(const std::vector<RoadRecord>& roads) const {
    DensityGrid grid(config.cellSize);

    for (const auto& road : roads) {
        for (size_t i = 1; i < road.path.size(); i++) {
            glm::vec2 p0(road.path[i-1].x, road.path[i-1].z);
            glm::vec2 p1(road.path[i].x, road.path[i].z);
            float segLength = glm::length(p1 - p0);

            int steps = std::max(1, static_cast<int>(std::ceil(segLength / grid.getCellSize())));

            // A cell counts once per segment
            std::unordered_set<CellKey, CellKeyHash> visited;
            for (int k = 0; k <= steps; k++) {
                float t = static_cast<float>(k) / static_cast<float>(steps);
                glm::vec2 p = glm::mix(p0, p1, t);
                CellKey key = grid.keyFor(p.x, p.y);
                if (visited.insert(key).second) {
                    grid.touch(key).roadCount++;
                }
            }
        }
    }

    for (const auto& point : findIntersections(roads)) {
        grid.touch(grid.keyFor(point.x, point.y)).intersectionCount++;
    }

    score(grid);
    return grid;
}

std::vector<glm::vec2> DensityAnalyzer::findIntersections(const std::vector<RoadRecord>& roads) const {
    std::vector<glm::vec2> points;

    struct Endpoint {
        glm::vec2 position;
        size_t roadIdx;
    };

    std::vector<Endpoint> endpoints;
    endpoints.reserve(roads.size() * 2);
    for (size_t r = 0; r < roads.size(); r++) {
        if (roads[r].path.size() < 2) continue;
        glm::vec3 s = roads[r].startPoint();
        glm::vec3 e = roads[r].endPoint();
        endpoints.push_back({glm::vec2(s.x, s.z), r});
        endpoints.push_back({glm::vec2(e.x, e.z), r});
    }

    // Bucket endpoints so each only meets its spatial neighbours
    float bucketSize = std::max(config.intersectionDistance, 0.001f);
    auto bucketKey = [bucketSize](glm::vec2 p) {
        return CellKey{static_cast<int>(std::floor(p.x / bucketSize)),
                       static_cast<int>(std::floor(p.y / bucketSize))};
    };

    std::unordered_map<CellKey, std::vector<size_t>, CellKeyHash> buckets;
    for (size_t i = 0; i < endpoints.size(); i++) {
        buckets[bucketKey(endpoints[i].position)].push_back(i);
    }

    for (size_t i = 0; i < endpoints.size(); i++) {
        CellKey home = bucketKey(endpoints[i].position);

        for (int dz = -1; dz <= 1; dz++) {
            for (int dx = -1; dx <= 1; dx++) {
                auto it = buckets.find(CellKey{home.x + dx, home.z + dz});
                if (it == buckets.end()) continue;

                for (size_t j : it->second) {
                    if (j <= i) continue;
                    if (endpoints[j].roadIdx == endpoints[i].roadIdx) continue;

                    float dist = glm::distance(endpoints[i].position, endpoints[j].position);
                    if (dist < config.intersectionDistance) {
                        points.push_back((endpoints[i].position + endpoints[j].position) * 0.5f);
                    }
                }
            }
        }
    }

    if (config.detectSegmentCrossings) {
        findSegmentCrossings(roads, points);
    }

    return points;
}

void DensityAnalyzer::findSegmentCrossings(const std::vector<RoadRecord>& roads,
                                           std::vector<glm::vec2>& outPoints) const {
    struct Segment {
        glm::vec2 p0, p1;
        glm::vec2 lo, hi;
        size_t roadIdx;
    };

    std::vector<Segment> segments;
    for (size_t r = 0; r < roads.size(); r++) {
        const auto& path = roads[r].path;
        for (size_t i = 1; i < path.size(); i++) {
            glm::vec2 p0(path[i-1].x, path[i-1].z);
            glm::vec2 p1(path[i].x, path[i].z);
            segments.push_back({p0, p1, glm::min(p0, p1), glm::max(p0, p1), r});
        }
    }

    for (size_t a = 0; a < segments.size(); a++) {
        for (size_t b = a + 1; b < segments.size(); b++) {
            const Segment& sa = segments[a];
            const Segment& sb = segments[b];
            if (sa.roadIdx == sb.roadIdx) continue;

            // Bounding box rejection
            if (sa.hi.x < sb.lo.x || sb.hi.x < sa.lo.x ||
                sa.hi.y < sb.lo.y || sb.hi.y < sa.lo.y) continue;

            glm::vec2 point;
            if (segmentsCross(sa.p0, sa.p1, sb.p0, sb.p1, point)) {
                outPoints.push_back(point);
            }
        }
    }
}

void DensityAnalyzer::score(DensityGrid& grid) const {
    for (auto& [key, cell] : grid.getCells()) {
        cell.score = static_cast<float>(cell.roadCount) * config.roadWeight +
                     static_cast<float>(cell.intersectionCount) * config.intersectionWeight;
    }
}

void DensityAnalyzer::smooth(DensityGrid& grid, int iterations) const {
    auto& cells = grid.getCells();

    for (int iter = 0; iter < iterations; iter++) {
        // Separate buffer so the result does not depend on visiting order
        std::unordered_map<CellKey, float, CellKeyHash> smoothed;
        smoothed.reserve(cells.size());

        for (const auto& [key, cell] : cells) {
            float sum = cell.score;
            int count = 1;

            for (const auto& offset : kNeighborOffsets) {
                auto it = cells.find(CellKey{key.x + offset.x, key.z + offset.z});
                if (it == cells.end()) continue;
                sum += it->second.score;
                count++;
            }

            smoothed[key] = sum / static_cast<float>(count);
        }

        for (auto& [key, cell] : cells) {
            cell.score = smoothed[key];
        }
    }
}

DensityClass DensityAnalyzer::classify(float score, const DensityThresholds& thresholds) {
    if (score >= thresholds.urbanCore) return DensityClass::UrbanCore;
    if (score >= thresholds.urban) return DensityClass::Urban;
    if (score >= thresholds.suburban) return DensityClass::Suburban;
    return DensityClass::Rural;
}

float DensityAnalyzer::radiusFor(DensityClass densityClass, const DensityThresholds& thresholds) {
    switch (densityClass) {
        case DensityClass::UrbanCore: return thresholds.urbanCoreRadius;
        case DensityClass::Urban:     return thresholds.urbanRadius;
        case DensityClass::Suburban:  return thresholds.suburbanRadius;
        case DensityClass::Rural:     return thresholds.ruralRadius;
        default:                      return thresholds.ruralRadius;
    }
}

std::vector<EmergentSettlement> DensityAnalyzer::extractSettlements(const DensityGrid& grid,
                                                                    const DensityThresholds& thresholds) const {
    std::unordered_set<CellKey, CellKeyHash> maxima;
    for (const auto& [key, cell] : grid.getCells()) {
        if (cell.score < thresholds.rural) continue;

        bool isMax = true;
        for (const auto& offset : kNeighborOffsets) {
            const DensityCell* neighbor = grid.find(CellKey{key.x + offset.x, key.z + offset.z});
            if (neighbor && neighbor->score > cell.score) {
                isMax = false;
                break;
            }
        }
        if (isMax) maxima.insert(key);
    }

    // Connected maxima of equal score form one plateau with one centre
    struct Plateau {
        CellKey anchor;
        float score;
        glm::vec2 center;
    };

    std::vector<CellKey> ordered(maxima.begin(), maxima.end());
    std::sort(ordered.begin(), ordered.end(), [](const CellKey& a, const CellKey& b) {
        if (a.x != b.x) return a.x < b.x;
        return a.z < b.z;
    });

    std::vector<Plateau> plateaus;
    std::unordered_set<CellKey, CellKeyHash> assigned;
    for (const auto& start : ordered) {
        if (!assigned.insert(start).second) continue;

        float score = grid.find(start)->score;
        glm::vec2 sum(0.0f);
        size_t count = 0;

        std::vector<CellKey> stack = {start};
        while (!stack.empty()) {
            CellKey key = stack.back();
            stack.pop_back();
            sum += grid.cellCenter(key);
            count++;

            for (const auto& offset : kNeighborOffsets) {
                CellKey next{key.x + offset.x, key.z + offset.z};
                if (maxima.count(next) == 0 || grid.find(next)->score != score) continue;
                if (assigned.insert(next).second) stack.push_back(next);
            }
        }

        plateaus.push_back({start, score, sum / static_cast<float>(count)});
    }

    std::sort(plateaus.begin(), plateaus.end(), [](const Plateau& a, const Plateau& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.anchor.x != b.anchor.x) return a.anchor.x < b.anchor.x;
        return a.anchor.z < b.anchor.z;
    });

    std::vector<EmergentSettlement> settlements;
    settlements.reserve(plateaus.size());
    for (const auto& plateau : plateaus) {
        EmergentSettlement settlement;
        settlement.densityScore = plateau.score;
        settlement.densityClass = classify(plateau.score, thresholds);
        settlement.radius = radiusFor(settlement.densityClass, thresholds);
        float y = terrain ? terrain->height(plateau.center.x, plateau.center.y) : 0.0f;
        settlement.center = glm::vec3(plateau.center.x, y, plateau.center.y);
        settlements.push_back(settlement);
    }

    return settlements;
}

std::vector<EmergentSettlement> DensityAnalyzer::analyze(const std::vector<RoadRecord>& roads,
                                                         DensityGrid* outGrid) const {
    if (roads.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Density analysis: no roads to rasterize");
        if (outGrid) *outGrid = DensityGrid(config.cellSize);
        return {};
    }

    DensityGrid grid = rasterize(roads);
    smooth(grid, config.smoothingIterations);
    auto settlements = extractSettlements(grid, config.thresholds);

    SDL_Log("Density analysis: %zu cells, %zu emergent settlements", grid.size(), settlements.size());

    if (outGrid) *outGrid = std::move(grid);
    return settlements;
}

} // namespace RoadNet
