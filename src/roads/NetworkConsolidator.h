#pragma once

#include "RoadTypes.h"
#include <limits>
#include <vector>

namespace RoadNet {

struct ConsolidationConfig {
    float mergeDistance = 80.0f;    // Endpoint tolerance for parallel routes
    float minRoadValue = 1.0f;      // (demand * 100) / length below this is pruned
};

struct ConsolidationStats {
    size_t merged = 0;
    size_t pruned = 0;
};

// Merges duplicate corridors and prunes low-value roads
class NetworkConsolidator {
public:
    explicit NetworkConsolidator(const ConsolidationConfig& config = ConsolidationConfig());

    // Same corridor in either direction, endpoints within threshold
    static bool areParallel(const RoadRecord& a, const RoadRecord& b, float threshold);

    // Keeps the higher-demand road of every parallel pair; output holds no parallel pair
    std::vector<RoadRecord> consolidate(const std::vector<RoadRecord>& roads, float threshold);
    std::vector<RoadRecord> consolidate(const std::vector<RoadRecord>& roads);

    // Highways always survive. Roads with no recorded demand are not judged.
    std::vector<RoadRecord> prune(const std::vector<RoadRecord>& roads, float minValue);
    std::vector<RoadRecord> prune(const std::vector<RoadRecord>& roads);

    // (demand * 100) / length; 0 for degenerate roads or missing demand
    static float roadValue(const RoadRecord& road);

    const ConsolidationStats& getStats() const { return stats; }

private:
    ConsolidationConfig config;
    ConsolidationStats stats;
};

} // namespace RoadNet
