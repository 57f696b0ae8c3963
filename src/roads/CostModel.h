#pragma once

#include "terrain/TerrainOracle.h"
#include <glm/glm.hpp>

namespace RoadNet {

struct CostModelConfig {
    int samples = 32;                   // Interval count along a candidate edge
    float seaLevel = 0.0f;              // Elevations below this are water
    float bridgeCostMultiplier = 8.0f;  // Water meters cost this many land meters
    int minPopulationForBridge = 200;   // Smaller populations never get bridges
    float maxCostPerCapita = 40.0f;     // Economic cost per inhabitant served
};

struct EdgeCost {
    float landDistance = 0.0f;
    float waterDistance = 0.0f;
    float economicCost = 0.0f;
};

// Economic cost of candidate edges, split into land and water crossing distance
class CostModel {
public:
    CostModel(const TerrainOracle& terrain, const CostModelConfig& config);

    // Each of the sampled intervals along a->b accrues its length to water or land
    // depending on the elevation at the interval midpoint.
    EdgeCost edgeCost(const glm::vec3& a, const glm::vec3& b) const;

    // Zero water distance is always viable. Otherwise the population gate and the
    // cost-per-capita gate must both pass.
    bool isEconomicallyViable(const EdgeCost& cost, int populationServed) const;

    const CostModelConfig& getConfig() const { return config; }

private:
    const TerrainOracle& terrain;
    CostModelConfig config;
};

} // namespace RoadNet
