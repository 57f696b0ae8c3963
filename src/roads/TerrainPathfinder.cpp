#include "TerrainPathfinder.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>

namespace RoadNet {

glm::ivec2 TerrainPathfinder::SearchGrid::worldToGrid(glm::vec2 worldPos) const {
    glm::vec2 local = (worldPos - origin) / cellSize;
    glm::ivec2 cell(static_cast<int>(std::round(local.x)), static_cast<int>(std::round(local.y)));
    return glm::clamp(cell, glm::ivec2(0), glm::ivec2(width - 1, height - 1));
}

glm::vec2 TerrainPathfinder::SearchGrid::gridToWorld(glm::ivec2 gridPos) const {
    return origin + glm::vec2(gridPos) * cellSize;
}

bool TerrainPathfinder::SearchGrid::isValid(glm::ivec2 pos) const {
    return pos.x >= 0 && pos.x < width && pos.y >= 0 && pos.y < height;
}

TerrainPathfinder::TerrainPathfinder(const TerrainOracle& t, const TerrainPathfinderConfig& cfg)
    : terrain(t), config(cfg) {}

TerrainPathfinder::SearchGrid TerrainPathfinder::makeGrid(glm::vec2 start, glm::vec2 end,
                                                          float resolution) const {
    float length = glm::length(end - start);
    float margin = std::max(config.minMargin, length * config.corridorMargin);

    glm::vec2 lo = glm::min(start, end) - glm::vec2(margin);
    glm::vec2 hi = glm::max(start, end) + glm::vec2(margin);

    SearchGrid grid;
    grid.origin = lo;
    grid.cellSize = std::max(resolution, 0.5f);

    // Coarsen the cells rather than exceed the per-axis cap
    float extent = std::max(hi.x - lo.x, hi.y - lo.y);
    if (extent / grid.cellSize > static_cast<float>(config.maxGridCells - 1)) {
        grid.cellSize = extent / static_cast<float>(config.maxGridCells - 1);
    }

    grid.width = static_cast<int>(std::ceil((hi.x - lo.x) / grid.cellSize)) + 1;
    grid.height = static_cast<int>(std::ceil((hi.y - lo.y) / grid.cellSize)) + 1;
    return grid;
}

float TerrainPathfinder::stepCost(const SearchGrid& grid, glm::ivec2 from, glm::ivec2 to,
                                  bool allowBridges) const {
    glm::vec2 worldFrom = grid.gridToWorld(from);
    glm::vec2 worldTo = grid.gridToWorld(to);

    float distance = glm::length(worldTo - worldFrom);

    float slopeDeg = terrain.slope(worldTo.x, worldTo.y);
    bool isWater = terrain.height(worldTo.x, worldTo.y) < config.seaLevel;

    if (isWater && !allowBridges) return -1.0f;

    float cost = distance * (1.0f + (slopeDeg / 45.0f) * config.slopeCostMultiplier);

    if (isWater) {
        cost += config.waterPenalty;
    }

    if (slopeDeg > config.cliffSlopeDegrees) {
        cost += config.cliffPenalty;
    }

    return cost;
}

std::vector<glm::vec3> TerrainPathfinder::findPath(const glm::vec3& from, const glm::vec3& to,
                                                   const PathRequest& request) {
    lastIterations = 0;

    glm::vec2 start(from.x, from.z);
    glm::vec2 end(to.x, to.z);

    SearchGrid grid = makeGrid(start, end, request.gridResolution);
    glm::ivec2 startGrid = grid.worldToGrid(start);
    glm::ivec2 endGrid = grid.worldToGrid(end);

    if (startGrid == endGrid) {
        return {from, to};
    }

    const size_t cellCount = static_cast<size_t>(grid.width) * grid.height;
    const float inf = std::numeric_limits<float>::infinity();

    std::vector<float> gCost(cellCount, inf);
    std::vector<int> parent(cellCount, -1);
    std::vector<uint8_t> closed(cellCount, 0);

    auto heuristic = [&grid, endGrid](glm::ivec2 pos) {
        return glm::length(glm::vec2(endGrid - pos)) * grid.cellSize;
    };

    auto cmp = [](const PathNode& a, const PathNode& b) {
        return a.fCost() > b.fCost();
    };
    std::priority_queue<PathNode, std::vector<PathNode>, decltype(cmp)> openSet(cmp);

    gCost[grid.index(startGrid)] = 0.0f;
    openSet.push(PathNode{startGrid.x, startGrid.y, 0.0f, heuristic(startGrid)});

    static const glm::ivec2 offsets[] = {
        {-1, -1}, {0, -1}, {1, -1},
        {-1,  0},          {1,  0},
        {-1,  1}, {0,  1}, {1,  1}
    };

    const size_t maxIterations = cellCount;
    bool found = false;

    while (!openSet.empty() && lastIterations < maxIterations) {
        lastIterations++;

        PathNode current = openSet.top();
        openSet.pop();

        glm::ivec2 currentPos(current.x, current.y);
        int currentIdx = grid.index(currentPos);

        if (closed[currentIdx]) continue;
        closed[currentIdx] = 1;

        if (currentPos == endGrid) {
            found = true;
            break;
        }

        for (const auto& offset : offsets) {
            glm::ivec2 neighborPos = currentPos + offset;
            if (!grid.isValid(neighborPos)) continue;

            int neighborIdx = grid.index(neighborPos);
            if (closed[neighborIdx]) continue;

            float step = stepCost(grid, currentPos, neighborPos, request.allowBridges);
            if (step < 0.0f) continue;

            float tentativeG = current.gCost + step;
            if (tentativeG < gCost[neighborIdx]) {
                gCost[neighborIdx] = tentativeG;
                parent[neighborIdx] = currentIdx;
                openSet.push(PathNode{neighborPos.x, neighborPos.y, tentativeG, heuristic(neighborPos)});
            }
        }
    }

    if (!found) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "No path found from (%.1f, %.1f) to (%.1f, %.1f) after %zu iterations",
                    start.x, start.y, end.x, end.y, lastIterations);
        return {};
    }

    // Reconstruct path
    std::vector<glm::vec2> points;
    int idx = grid.index(endGrid);
    while (idx >= 0) {
        glm::ivec2 pos(idx % grid.width, idx / grid.width);
        points.push_back(grid.gridToWorld(pos));
        idx = parent[idx];
    }
    std::reverse(points.begin(), points.end());

    // Exact endpoints
    points.front() = start;
    points.back() = end;

    simplifyPath(points);

    std::vector<glm::vec3> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(glm::vec3(p.x, 0.0f, p.y));
    }
    return result;
}

void TerrainPathfinder::simplifyPath(std::vector<glm::vec2>& points) const {
    if (points.size() <= 2) return;

    std::vector<glm::vec2> simplified;
    simplified.push_back(points.front());
    douglasPeucker(points, config.simplifyEpsilon, simplified, 0, points.size() - 1);
    simplified.push_back(points.back());

    points = std::move(simplified);
}

void TerrainPathfinder::douglasPeucker(const std::vector<glm::vec2>& points, float epsilon,
                                       std::vector<glm::vec2>& outPoints,
                                       size_t startIdx, size_t endIdx) const {
    if (endIdx <= startIdx + 1) return;

    glm::vec2 lineStart = points[startIdx];
    glm::vec2 lineEnd = points[endIdx];
    glm::vec2 lineDir = lineEnd - lineStart;
    float lineLength = glm::length(lineDir);

    if (lineLength < 0.0001f) return;

    lineDir /= lineLength;

    float maxDist = 0.0f;
    size_t maxIdx = startIdx;

    for (size_t i = startIdx + 1; i < endIdx; i++) {
        glm::vec2 toPoint = points[i] - lineStart;
        float projLength = glm::dot(toPoint, lineDir);
        glm::vec2 projPoint = lineStart + lineDir * projLength;
        float dist = glm::length(points[i] - projPoint);

        if (dist > maxDist) {
            maxDist = dist;
            maxIdx = i;
        }
    }

    if (maxDist > epsilon) {
        douglasPeucker(points, epsilon, outPoints, startIdx, maxIdx);
        outPoints.push_back(points[maxIdx]);
        douglasPeucker(points, epsilon, outPoints, maxIdx, endIdx);
    }
}

} // namespace RoadNet
