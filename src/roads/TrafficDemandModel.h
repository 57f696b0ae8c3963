#pragma once

#include "RoadTypes.h"
#include "terrain/TerrainOracle.h"
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

struct TrafficDemandConfig {
    float terrainSize = 16384.0f;       // Used to normalize centrality
    glm::vec2 mapCenter{0.0f};          // World XZ of the map center
    float decayDistance = 1000.0f;      // Distance at which demand equals the importance product
    float buildabilityWeight = 4.0f;
    float centralityWeight = 3.0f;
    int slopeSamples = 8;               // Slope samples for the terrain penalty
    float corridorCapFactor = 3.0f;     // Ranked corridors kept per destination
};

// Gravity-style demand between destinations
class TrafficDemandModel {
public:
    TrafficDemandModel(const TerrainOracle* terrain, const TrafficDemandConfig& config);

    // buildability + terrain bonus + centrality, floored at 1
    float importance(const Destination& destination) const;

    float demand(const Destination& a, const Destination& b) const;

    // Demand from explicit importances
    float demand(float importanceA, float importanceB, const glm::vec3& a, const glm::vec3& b) const;

    // Mean of slope / 45 degrees along a->b (0 without a terrain oracle)
    float terrainPenalty(const glm::vec3& a, const glm::vec3& b) const;

    // Sort descending by demand and keep min(|corridors|, capFactor * destinationCount)
    std::vector<Corridor> rankCorridors(std::vector<Corridor> corridors, size_t destinationCount) const;

    static float terrainBonus(TerrainClass terrain);

    const TrafficDemandConfig& getConfig() const { return config; }

private:
    const TerrainOracle* terrain;
    TrafficDemandConfig config;
};

} // namespace RoadNet
