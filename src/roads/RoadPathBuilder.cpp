#include "RoadPathBuilder.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace RoadNet {

RoadPathBuilder::RoadPathBuilder(const TerrainOracle& t, Pathfinder* finder,
                                 const PathBuilderConfig& cfg)
    : terrain(t), pathfinder(finder), config(cfg) {}

float RoadPathBuilder::gridResolutionFor(float distance) const {
    float resolution = distance / std::max(config.cellsPerCorridor, 1.0f);
    return std::clamp(resolution, config.minGridResolution, config.maxGridResolution);
}

void RoadPathBuilder::projectOntoTerrain(std::vector<glm::vec3>& path) const {
    for (auto& p : path) {
        p.y = terrain.height(p.x, p.z) + config.verticalOffset;
    }
}

std::vector<glm::vec3> RoadPathBuilder::buildPath(const glm::vec3& from, const glm::vec3& to,
                                                  bool allowBridges) {
    std::vector<glm::vec3> path;

    if (pathfinder) {
        PathRequest request;
        request.gridResolution = gridResolutionFor(horizontalDistance(from, to));
        request.allowBridges = allowBridges;
        path = pathfinder->findPath(from, to, request);
    }

    if (path.size() < 2) {
        if (pathfinder) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Pathfinder returned %zu points from (%.1f, %.1f) to (%.1f, %.1f), using direct line",
                        path.size(), from.x, from.z, to.x, to.z);
            fallbackCount++;
        }
        path = {from, to};
    }

    projectOntoTerrain(path);
    return path;
}

std::optional<RoadRecord> RoadPathBuilder::realizeRoad(const glm::vec3& from, const glm::vec3& to,
                                                       RoadClass type, float width, bool allowBridges) {
    if (horizontalDistance(from, to) < config.minRoadLength) {
        return std::nullopt;
    }

    RoadRecord road;
    road.type = type;
    road.width = width;
    road.path = buildPath(from, to, allowBridges);
    road.from = road.path.front();
    road.to = road.path.back();

    if (road.getLength() < config.minRoadLength) {
        return std::nullopt;
    }
    return road;
}

std::optional<RoadRecord> RoadPathBuilder::realizeCorridor(const Corridor& corridor, bool allowBridges) {
    auto road = realizeRoad(corridor.from, corridor.to, corridor.roadClass,
                            getRoadWidth(corridor.roadClass), allowBridges);
    if (!road) return std::nullopt;

    road->demand = corridor.trafficDemand;
    road->fromDestination = static_cast<uint32_t>(corridor.fromIdx);
    road->toDestination = static_cast<uint32_t>(corridor.toIdx);
    return road;
}

RoadMesh RoadPathBuilder::buildRibbonMesh(const RoadRecord& road) const {
    RoadMesh mesh;
    if (road.path.size() < 2) return mesh;

    float halfWidth = road.width * 0.5f;
    float travelled = 0.0f;

    auto corner = [this](glm::vec2 xz) {
        return glm::vec3(xz.x, terrain.height(xz.x, xz.y) + config.verticalOffset, xz.y);
    };

    for (size_t i = 1; i < road.path.size(); i++) {
        glm::vec2 p0(road.path[i-1].x, road.path[i-1].z);
        glm::vec2 p1(road.path[i].x, road.path[i].z);
        glm::vec2 delta = p1 - p0;
        float segLength = glm::length(delta);

        if (segLength < 0.001f) continue;

        glm::vec2 dir = delta / segLength;
        glm::vec2 perp(-dir.y, dir.x);

        glm::vec3 left0 = corner(p0 + perp * halfWidth);
        glm::vec3 right0 = corner(p0 - perp * halfWidth);
        glm::vec3 left1 = corner(p1 + perp * halfWidth);
        glm::vec3 right1 = corner(p1 - perp * halfWidth);

        glm::vec3 normal = glm::cross(left1 - left0, right0 - left0);
        float normalLen = glm::length(normal);
        normal = normalLen > 0.0001f ? normal / normalLen : glm::vec3(0.0f, 1.0f, 0.0f);
        if (normal.y < 0.0f) normal = -normal;

        float v0 = travelled * config.uvScale;
        float v1 = (travelled + segLength) * config.uvScale;

        uint32_t base = static_cast<uint32_t>(mesh.vertices.size());
        mesh.vertices.push_back({left0, normal, glm::vec2(0.0f, v0)});
        mesh.vertices.push_back({right0, normal, glm::vec2(1.0f, v0)});
        mesh.vertices.push_back({left1, normal, glm::vec2(0.0f, v1)});
        mesh.vertices.push_back({right1, normal, glm::vec2(1.0f, v1)});

        // Counter-clockwise seen from above
        mesh.indices.insert(mesh.indices.end(), {
            base + 0, base + 2, base + 1,
            base + 1, base + 2, base + 3
        });

        travelled += segLength;
    }

    return mesh;
}

} // namespace RoadNet
