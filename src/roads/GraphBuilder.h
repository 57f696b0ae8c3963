#pragma once

#include "RoadTypes.h"
#include "CostModel.h"
#include "TrafficDemandModel.h"
#include <cstdint>
#include <vector>

namespace RoadNet {

struct GraphConfig {
    size_t maxDestinations = 400;   // Cap before the O(n^2) complete edge set
    float loopFactor = 2.5f;        // Loop augmentation target as a multiple of MST size
};

// Edge weight used for MST ordering
enum class WeightMode : uint8_t {
    Distance = 0,       // Topology-only: straight-line distance
    EconomicCost = 1    // Cost-aware: land + weighted water distance
};

// Disjoint-set forest with path compression and union by rank
class UnionFind {
public:
    explicit UnionFind(size_t count);

    size_t find(size_t x);

    // Returns false if a and b were already connected
    bool unite(size_t a, size_t b);

    size_t componentCount() const { return components; }

private:
    std::vector<size_t> parent;
    std::vector<uint8_t> rank;
    size_t components;
};

class GraphBuilder {
public:
    explicit GraphBuilder(const GraphConfig& config = GraphConfig());

    // All i<j pairs with cost, demand and population served filled in.
    // Either model may be null; the corresponding fields stay zero (economic cost
    // then falls back to the straight-line distance).
    std::vector<Corridor> buildCompleteEdges(const std::vector<Destination>& destinations,
                                             const CostModel* costModel,
                                             const TrafficDemandModel* demandModel) const;

    // Kruskal MST, ascending by weight with the index pair as tie-breaker.
    // Stops after nodeCount - 1 accepted edges.
    std::vector<Corridor> buildMst(const std::vector<Corridor>& edges, size_t nodeCount,
                                   WeightMode mode) const;

    // Appends the cheapest remaining edges not already in the tree until
    // the list holds targetCount edges or no edges remain.
    std::vector<Corridor> addLoopEdges(const std::vector<Corridor>& mst,
                                       const std::vector<Corridor>& allEdges,
                                       size_t targetCount, WeightMode mode) const;

    // floor(mstSize * loopFactor)
    size_t loopTarget(size_t mstSize) const;

    // Keeps the most important destinations (lowest priority number, then population)
    // when the set exceeds maxDestinations.
    std::vector<Destination> capDestinations(std::vector<Destination> destinations) const;

    static float edgeWeight(const Corridor& edge, WeightMode mode);

    const GraphConfig& getConfig() const { return config; }

private:
    std::vector<Corridor> sortedByWeight(std::vector<Corridor> edges, WeightMode mode) const;

    GraphConfig config;
};

} // namespace RoadNet
