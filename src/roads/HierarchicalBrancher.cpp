#include "HierarchicalBrancher.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <deque>

namespace RoadNet {

HierarchicalBrancher::HierarchicalBrancher(const TerrainOracle& t, RoadPathBuilder& builder,
                                           const BranchConfig& cfg)
    : terrain(t), pathBuilder(builder), config(cfg), rng(cfg.seed) {}

glm::vec2 HierarchicalBrancher::rotate(glm::vec2 v, float degrees) {
    float r = glm::radians(degrees);
    float c = std::cos(r);
    float s = std::sin(r);
    return glm::vec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

float HierarchicalBrancher::widthAtDepth(int depth) const {
    return std::max(config.minWidth, config.baseWidth - config.widthDecrement * static_cast<float>(depth));
}

float HierarchicalBrancher::childProbability(int depth) const {
    return std::max(0.0f, config.subBranchProbability - config.subBranchDecay * static_cast<float>(depth));
}

float HierarchicalBrancher::intervalAt(glm::vec2 position) const {
    float density = densityAt ? std::max(0.0f, densityAt(position)) : 0.0f;
    return std::max(1.0f, config.branchInterval / (1.0f + density * config.densityIntervalScale));
}

HierarchicalBrancher::PathSample HierarchicalBrancher::samplePath(const RoadRecord& road,
                                                                  float distance) const {
    PathSample sample{glm::vec2(road.startPoint().x, road.startPoint().z), glm::vec2(1.0f, 0.0f)};

    float accumulated = 0.0f;
    for (size_t i = 1; i < road.path.size(); i++) {
        glm::vec2 segStart(road.path[i-1].x, road.path[i-1].z);
        glm::vec2 segEnd(road.path[i].x, road.path[i].z);
        float segLength = glm::length(segEnd - segStart);
        if (segLength < 0.0001f) continue;

        sample.tangent = (segEnd - segStart) / segLength;
        if (accumulated + segLength >= distance) {
            float localT = (distance - accumulated) / segLength;
            sample.position = glm::mix(segStart, segEnd, localT);
            return sample;
        }
        accumulated += segLength;
        sample.position = segEnd;
    }
    return sample;
}

std::vector<float> HierarchicalBrancher::branchPointDistances(const RoadRecord& road) const {
    std::vector<float> distances;
    float length = road.getLength();
    if (length <= 0.0f || config.branchInterval <= 0.0f) return distances;

    float s = intervalAt(samplePath(road, 0.0f).position);
    while (s < length) {
        distances.push_back(s);
        s += intervalAt(samplePath(road, s).position);
    }
    return distances;
}

bool HierarchicalBrancher::isNearBoundary(glm::vec2 position) const {
    float halfSize = config.terrainSize * 0.5f - config.boundaryMargin;
    return std::abs(position.x) > halfSize || std::abs(position.y) > halfSize;
}

bool HierarchicalBrancher::trySnap(glm::vec2 start, glm::vec2 candidate, glm::vec2& outSnapped) const {
    float bestDist = config.mergeRadius;
    bool found = false;

    for (const auto& endpoint : endpoints) {
        if (glm::distance(endpoint, start) <= config.minSnapDistance) continue;

        float dist = glm::distance(endpoint, candidate);
        if (dist <= bestDist) {
            bestDist = dist;
            outSnapped = endpoint;
            found = true;
        }
    }
    return found;
}

std::vector<RoadRecord> HierarchicalBrancher::generate(const std::vector<RoadRecord>& roads) {
    stats = BranchStats();
    endpoints.clear();
    rng.seed(config.seed);

    std::vector<RoadRecord> branches;
    if (config.maxDepth <= 0) return branches;

    for (const auto& road : roads) {
        if (road.path.size() < 2) continue;
        endpoints.push_back(glm::vec2(road.startPoint().x, road.startPoint().z));
        endpoints.push_back(glm::vec2(road.endPoint().x, road.endPoint().z));
    }

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::uniform_real_distribution<float> variance(-config.angleVariance, config.angleVariance);
    std::uniform_real_distribution<float> lengthDist(config.minBranchLength,
                                                     std::max(config.minBranchLength, config.maxBranchLength));
    std::uniform_real_distribution<float> turnDist(config.subBranchMinAngle,
                                                   std::max(config.subBranchMinAngle, config.subBranchMaxAngle));

    // Phase 1: seed depth-0 tasks along trunk and arterial roads
    std::deque<BranchTask> worklist;

    for (const auto& road : roads) {
        if (!isPrimaryRoad(road.type) || road.path.size() < 2) continue;

        float side = 1.0f;
        for (float distance : branchPointDistances(road)) {
            stats.branchPoints++;

            if (unit(rng) >= config.branchProbability) continue;

            PathSample sample = samplePath(road, distance);
            glm::vec2 perp = glm::vec2(-sample.tangent.y, sample.tangent.x) * side;
            side = -side;

            worklist.push_back({sample.position, rotate(perp, variance(rng)), 0});
        }
    }

    // Phase 2: process the worklist breadth-first
    while (!worklist.empty()) {
        if (branches.size() >= config.maxBranchRoads) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Branch road cap reached (%zu), dropping %zu pending branches",
                        config.maxBranchRoads, worklist.size());
            break;
        }

        BranchTask task = worklist.front();
        worklist.pop_front();

        float length = lengthDist(rng) * std::pow(config.depthLengthScale, static_cast<float>(task.depth));
        glm::vec2 candidate = task.start + task.direction * length;

        if (isNearBoundary(candidate)) {
            stats.rejectedBoundary++;
            continue;
        }

        if (terrain.height(candidate.x, candidate.y) < config.seaLevel) {
            stats.rejectedWater++;
            continue;
        }

        glm::vec2 end = candidate;
        bool snapped = trySnap(task.start, candidate, end);

        auto road = pathBuilder.realizeRoad(terrain.project(task.start), terrain.project(end),
                                            RoadClass::Branch, widthAtDepth(task.depth), false);
        if (!road) continue;

        road->depth = task.depth;
        branches.push_back(std::move(*road));
        endpoints.push_back(task.start);
        endpoints.push_back(end);

        if (task.depth == 0) {
            stats.rootBranches++;
        } else {
            stats.subBranches++;
        }

        // A snapped branch forms a T-junction and ends there
        if (snapped) {
            stats.snapped++;
            continue;
        }

        if (task.depth + 1 >= config.maxDepth) continue;
        if (unit(rng) >= childProbability(task.depth)) continue;

        float turn = turnDist(rng) * (unit(rng) < 0.5f ? -1.0f : 1.0f);
        worklist.push_back({end, rotate(task.direction, turn), task.depth + 1});
    }

    SDL_Log("Branching: %zu branch points, %zu root branches, %zu sub-branches, %zu snapped",
            stats.branchPoints, stats.rootBranches, stats.subBranches, stats.snapped);

    return branches;
}

} // namespace RoadNet
