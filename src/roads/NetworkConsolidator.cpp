#include "NetworkConsolidator.h"
#include <SDL3/SDL_log.h>

namespace RoadNet {

NetworkConsolidator::NetworkConsolidator(const ConsolidationConfig& cfg) : config(cfg) {}

bool NetworkConsolidator::areParallel(const RoadRecord& a, const RoadRecord& b, float threshold) {
    glm::vec3 startA = a.startPoint();
    glm::vec3 endA = a.endPoint();
    glm::vec3 startB = b.startPoint();
    glm::vec3 endB = b.endPoint();

    bool sameDirection = horizontalDistance(startA, startB) <= threshold &&
                         horizontalDistance(endA, endB) <= threshold;
    bool reversed = horizontalDistance(startA, endB) <= threshold &&
                    horizontalDistance(endA, startB) <= threshold;

    return sameDirection || reversed;
}

std::vector<RoadRecord> NetworkConsolidator::consolidate(const std::vector<RoadRecord>& roads,
                                                         float threshold) {
    stats.merged = 0;

    std::vector<RoadRecord> result;
    std::vector<bool> merged(roads.size(), false);

    for (size_t i = 0; i < roads.size(); i++) {
        if (merged[i]) continue;

        RoadRecord keeper = roads[i];
        float keeperDemand = keeper.demand.value_or(0.0f);

        // Rescan when the keeper is replaced so its new geometry is checked too
        bool replaced = true;
        while (replaced) {
            replaced = false;
            for (size_t j = i + 1; j < roads.size(); j++) {
                if (merged[j]) continue;
                if (!areParallel(keeper, roads[j], threshold)) continue;

                merged[j] = true;
                stats.merged++;

                float candidateDemand = roads[j].demand.value_or(0.0f);
                if (candidateDemand > keeperDemand) {
                    keeper = roads[j];
                    keeperDemand = candidateDemand;
                    replaced = true;
                }
            }
        }

        result.push_back(std::move(keeper));
    }

    if (stats.merged > 0) {
        SDL_Log("Consolidation merged %zu parallel roads (%zu -> %zu)",
                stats.merged, roads.size(), result.size());
    }
    return result;
}

std::vector<RoadRecord> NetworkConsolidator::consolidate(const std::vector<RoadRecord>& roads) {
    return consolidate(roads, config.mergeDistance);
}

float NetworkConsolidator::roadValue(const RoadRecord& road) {
    float length = road.getLength();
    if (!road.demand || length < 0.001f) return 0.0f;
    return (*road.demand * 100.0f) / length;
}

std::vector<RoadRecord> NetworkConsolidator::prune(const std::vector<RoadRecord>& roads, float minValue) {
    stats.pruned = 0;

    std::vector<RoadRecord> result;
    result.reserve(roads.size());

    for (const auto& road : roads) {
        if (isTopTier(road.type) || !road.demand) {
            result.push_back(road);
            continue;
        }

        if (roadValue(road) >= minValue) {
            result.push_back(road);
        } else {
            stats.pruned++;
        }
    }

    if (stats.pruned > 0) {
        SDL_Log("Pruned %zu low-value roads (min value %.2f)", stats.pruned, minValue);
    }
    return result;
}

std::vector<RoadRecord> NetworkConsolidator::prune(const std::vector<RoadRecord>& roads) {
    return prune(roads, config.minRoadValue);
}

} // namespace RoadNet
