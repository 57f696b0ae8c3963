#include "GraphBuilder.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace RoadNet {

// ============================================================================
// UnionFind
// ============================================================================

UnionFind::UnionFind(size_t count)
    : parent(count), rank(count, 0), components(count) {
    std::iota(parent.begin(), parent.end(), size_t(0));
}

size_t UnionFind::find(size_t x) {
    size_t root = x;
    while (parent[root] != root) root = parent[root];

    // Path compression
    while (parent[x] != root) {
        size_t next = parent[x];
        parent[x] = root;
        x = next;
    }
    return root;
}

bool UnionFind::unite(size_t a, size_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return false;

    if (rank[a] < rank[b]) std::swap(a, b);
    parent[b] = a;
    if (rank[a] == rank[b]) rank[a]++;

    components--;
    return true;
}

// ============================================================================
// GraphBuilder
// ============================================================================

GraphBuilder::GraphBuilder(const GraphConfig& cfg) : config(cfg) {}

float GraphBuilder::edgeWeight(const Corridor& edge, WeightMode mode) {
    return mode == WeightMode::EconomicCost ? edge.economicCost : edge.distance;
}

std::vector<Destination> GraphBuilder::capDestinations(std::vector<Destination> destinations) const {
    if (destinations.size() <= config.maxDestinations) return destinations;

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "Capping %zu destinations to %zu before building the complete edge set",
                destinations.size(), config.maxDestinations);

    std::stable_sort(destinations.begin(), destinations.end(),
                     [](const Destination& a, const Destination& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.population > b.population;
    });
    destinations.resize(config.maxDestinations);
    return destinations;
}

std::vector<Corridor> GraphBuilder::buildCompleteEdges(const std::vector<Destination>& destinations,
                                                       const CostModel* costModel,
                                                       const TrafficDemandModel* demandModel) const {
    std::vector<Corridor> edges;
    size_t n = destinations.size();
    if (n < 2) return edges;

    edges.reserve(n * (n - 1) / 2);

    std::vector<float> importances;
    if (demandModel) {
        importances.reserve(n);
        for (const auto& d : destinations) {
            importances.push_back(demandModel->importance(d));
        }
    }

    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            const Destination& a = destinations[i];
            const Destination& b = destinations[j];

            Corridor edge;
            edge.fromIdx = i;
            edge.toIdx = j;
            edge.from = a.position;
            edge.to = b.position;
            edge.distance = horizontalDistance(a.position, b.position);
            edge.populationServed = a.population + b.population;

            if (costModel) {
                EdgeCost cost = costModel->edgeCost(a.position, b.position);
                edge.landDistance = cost.landDistance;
                edge.waterDistance = cost.waterDistance;
                edge.economicCost = cost.economicCost;
            } else {
                edge.landDistance = edge.distance;
                edge.economicCost = edge.distance;
            }

            if (demandModel) {
                edge.trafficDemand = demandModel->demand(importances[i], importances[j],
                                                         a.position, b.position);
            }

            edges.push_back(edge);
        }
    }

    return edges;
}

std::vector<Corridor> GraphBuilder::sortedByWeight(std::vector<Corridor> edges, WeightMode mode) const {
    std::sort(edges.begin(), edges.end(), [mode](const Corridor& a, const Corridor& b) {
        float wa = edgeWeight(a, mode);
        float wb = edgeWeight(b, mode);
        if (wa != wb) return wa < wb;
        return a.pairKey() < b.pairKey();
    });
    return edges;
}

std::vector<Corridor> GraphBuilder::buildMst(const std::vector<Corridor>& edges, size_t nodeCount,
                                             WeightMode mode) const {
    std::vector<Corridor> tree;
    if (nodeCount < 2) return tree;

    tree.reserve(nodeCount - 1);
    UnionFind sets(nodeCount);

    for (const auto& edge : sortedByWeight(edges, mode)) {
        if (edge.fromIdx >= nodeCount || edge.toIdx >= nodeCount) continue;
        if (sets.unite(edge.fromIdx, edge.toIdx)) {
            tree.push_back(edge);
            if (tree.size() == nodeCount - 1) break;
        }
    }

    if (tree.size() < nodeCount - 1) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Candidate edges leave %zu disconnected components; spanning forest has %zu edges",
                    sets.componentCount(), tree.size());
    }

    return tree;
}

std::vector<Corridor> GraphBuilder::addLoopEdges(const std::vector<Corridor>& mst,
                                                 const std::vector<Corridor>& allEdges,
                                                 size_t targetCount, WeightMode mode) const {
    std::vector<Corridor> result = mst;

    std::unordered_set<uint64_t> present;
    for (const auto& edge : mst) {
        present.insert(edge.pairKey());
    }

    for (const auto& edge : sortedByWeight(allEdges, mode)) {
        if (result.size() >= targetCount) break;
        if (!present.insert(edge.pairKey()).second) continue;
        result.push_back(edge);
    }

    return result;
}

size_t GraphBuilder::loopTarget(size_t mstSize) const {
    return static_cast<size_t>(std::floor(static_cast<float>(mstSize) * config.loopFactor));
}

} // namespace RoadNet
