#include "CostModel.h"
#include <algorithm>

namespace RoadNet {

CostModel::CostModel(const TerrainOracle& t, const CostModelConfig& cfg)
    : terrain(t), config(cfg) {
    config.samples = std::max(1, config.samples);
}

EdgeCost CostModel::edgeCost(const glm::vec3& a, const glm::vec3& b) const {
    EdgeCost cost;

    glm::vec2 start(a.x, a.z);
    glm::vec2 end(b.x, b.z);
    float length = glm::length(end - start);
    if (length <= 0.0f) return cost;

    // Interval midpoints are symmetric under reversal of the segment,
    // so edgeCost(a, b) == edgeCost(b, a).
    int waterIntervals = 0;
    for (int i = 0; i < config.samples; i++) {
        float t = (static_cast<float>(i) + 0.5f) / static_cast<float>(config.samples);
        glm::vec2 p = glm::mix(start, end, t);
        if (terrain.height(p.x, p.y) < config.seaLevel) {
            waterIntervals++;
        }
    }

    float interval = length / static_cast<float>(config.samples);
    cost.waterDistance = interval * static_cast<float>(waterIntervals);
    cost.landDistance = interval * static_cast<float>(config.samples - waterIntervals);
    cost.economicCost = cost.landDistance + cost.waterDistance * config.bridgeCostMultiplier;
    return cost;
}

bool CostModel::isEconomicallyViable(const EdgeCost& cost, int populationServed) const {
    if (cost.waterDistance <= 0.0f) return true;

    if (populationServed < config.minPopulationForBridge) {
        return false;
    }

    float perCapita = cost.economicCost / static_cast<float>(std::max(populationServed, 1));
    return perCapita <= config.maxCostPerCapita;
}

} // namespace RoadNet
