#include "TrafficDemandModel.h"
#include <algorithm>
#include <cmath>

namespace RoadNet {

TrafficDemandModel::TrafficDemandModel(const TerrainOracle* t, const TrafficDemandConfig& cfg)
    : terrain(t), config(cfg) {}

float TrafficDemandModel::terrainBonus(TerrainClass terrain) {
    switch (terrain) {
        case TerrainClass::Plateau:  return 4.0f;
        case TerrainClass::Coast:    return 3.0f;
        case TerrainClass::Valley:   return 2.0f;
        case TerrainClass::Lowland:  return 1.0f;
        case TerrainClass::Mountain: return 0.0f;
        default:                     return 0.0f;
    }
}

float TrafficDemandModel::importance(const Destination& destination) const {
    float distToCenter = glm::length(destination.xz() - config.mapCenter);
    float centrality = 1.0f - distToCenter / (config.terrainSize * 0.7f);

    float score = destination.buildability * config.buildabilityWeight +
                  terrainBonus(destination.terrain) +
                  centrality * config.centralityWeight;

    return std::max(1.0f, score);
}

float TrafficDemandModel::terrainPenalty(const glm::vec3& a, const glm::vec3& b) const {
    if (!terrain || config.slopeSamples <= 0) return 0.0f;

    float total = 0.0f;
    for (int i = 0; i < config.slopeSamples; i++) {
        float t = (static_cast<float>(i) + 0.5f) / static_cast<float>(config.slopeSamples);
        glm::vec3 p = glm::mix(a, b, t);
        total += terrain->slope(p.x, p.z) / 45.0f;
    }
    return total / static_cast<float>(config.slopeSamples);
}

float TrafficDemandModel::demand(float importanceA, float importanceB,
                                 const glm::vec3& a, const glm::vec3& b) const {
    float distance = std::max(horizontalDistance(a, b), 1.0f);
    float normalized = distance / config.decayDistance;

    float gravity = (importanceA * importanceB) / std::pow(normalized, 1.5f);
    return gravity / (1.0f + terrainPenalty(a, b) * 0.3f);
}

float TrafficDemandModel::demand(const Destination& a, const Destination& b) const {
    return demand(importance(a), importance(b), a.position, b.position);
}

std::vector<Corridor> TrafficDemandModel::rankCorridors(std::vector<Corridor> corridors,
                                                        size_t destinationCount) const {
    std::sort(corridors.begin(), corridors.end(), [](const Corridor& a, const Corridor& b) {
        if (a.trafficDemand != b.trafficDemand) return a.trafficDemand > b.trafficDemand;
        return a.pairKey() < b.pairKey();
    });

    size_t cap = static_cast<size_t>(config.corridorCapFactor * static_cast<float>(destinationCount));
    if (corridors.size() > cap) {
        corridors.resize(cap);
    }
    return corridors;
}

} // namespace RoadNet
