#include "RoadNetworkPlanner.h"
#include "roads/CostModel.h"
#include "roads/CorridorClassifier.h"
#include "roads/GraphBuilder.h"
#include "roads/HierarchicalBrancher.h"
#include "roads/NetworkConsolidator.h"
#include "roads/RoadPathBuilder.h"
#include "roads/TerrainPathfinder.h"
#include "roads/TrafficDemandModel.h"
#include <SDL3/SDL_log.h>
#include <cstddef>
#include <memory>

namespace RoadNet {

std::vector<Corridor> CorridorSelection::all() const {
    std::vector<Corridor> result = tree;
    result.insert(result.end(), loops.begin(), loops.end());
    return result;
}

RoadNetworkPlanner::RoadNetworkPlanner(const PlannerConfig& cfg) : config(cfg) {
    config.applyShared();
}

// ============================================================================
// Stages
// ============================================================================

std::vector<Destination> RoadNetworkPlanner::gatherDestinations(const TerrainOracle& terrain,
                                                                const PlanInput& input) const {
    DestinationCollector collector(terrain, config.destinations);
    std::vector<Destination> destinations = collector.collect(input.settlements, input.landmarks);
    destinations.insert(destinations.end(), input.destinations.begin(), input.destinations.end());

    GraphBuilder graph(config.graph);
    return graph.capDestinations(std::move(destinations));
}

std::vector<Corridor> RoadNetworkPlanner::scoreCorridors(const TerrainOracle& terrain,
                                                         const std::vector<Destination>& destinations) const {
    CostModel costModel(terrain, config.cost);
    TrafficDemandModel demandModel(&terrain, config.demand);
    GraphBuilder graph(config.graph);

    std::vector<Corridor> edges = graph.buildCompleteEdges(destinations, &costModel, &demandModel);
    for (auto& edge : edges) {
        edge.roadClass = classifyCorridor(destinations[edge.fromIdx], destinations[edge.toIdx],
                                          edge.populationServed, config.classification);
    }

    SDL_Log("Scored %zu candidate corridors between %zu destinations", edges.size(), destinations.size());
    return edges;
}

CorridorSelection RoadNetworkPlanner::selectCorridors(const TerrainOracle& terrain,
                                                      const std::vector<Destination>& destinations,
                                                      const std::vector<Corridor>& candidates) const {
    CorridorSelection selection;

    CostModel costModel(terrain, config.cost);
    TrafficDemandModel demandModel(&terrain, config.demand);
    GraphBuilder graph(config.graph);

    std::vector<Corridor> viable;
    viable.reserve(candidates.size());

    for (const auto& edge : candidates) {
        EdgeCost cost{edge.landDistance, edge.waterDistance, edge.economicCost};

        bool minorCrossing = edge.waterDistance > 0.0f &&
            !allowsWaterCrossing(destinations[edge.fromIdx], destinations[edge.toIdx], config.classification);

        if (minorCrossing || !costModel.isEconomicallyViable(cost, edge.populationServed)) {
            selection.rejected++;
            continue;
        }
        viable.push_back(edge);
    }

    if (selection.rejected > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Rejected %zu water-crossing corridors as not economically viable",
                    selection.rejected);
    }

    selection.tree = graph.buildMst(viable, destinations.size(), config.weightMode);

    // Loops are drawn from the highest-demand corridors only
    std::vector<Corridor> ranked = demandModel.rankCorridors(viable, destinations.size());
    std::vector<Corridor> augmented = graph.addLoopEdges(selection.tree, ranked,
                                                         graph.loopTarget(selection.tree.size()),
                                                         config.weightMode);
    selection.loops.assign(augmented.begin() + static_cast<std::ptrdiff_t>(selection.tree.size()),
                           augmented.end());

    SDL_Log("Selected %zu corridors (%zu tree, %zu loop) from %zu viable",
            augmented.size(), selection.tree.size(), selection.loops.size(), viable.size());
    return selection;
}

// ============================================================================
// Full pass
// ============================================================================

bool RoadNetworkPlanner::plan(const TerrainOracle* terrainSource, const PlanInput& input, PlanResult& result) {
    result = PlanResult();

    if (!terrainSource) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Road network planning requires a terrain oracle");
        return false;
    }

    std::unique_ptr<CachedTerrain> cache;
    const TerrainOracle* terrainPtr = terrainSource;
    if (config.terrainCacheQuantum > 0.0f) {
        cache = std::make_unique<CachedTerrain>(*terrainSource, config.terrainCacheQuantum);
        terrainPtr = cache.get();
    }
    const TerrainOracle& terrain = *terrainPtr;

    PlanStats& stats = result.stats;

    // Destinations
    result.destinations = gatherDestinations(terrain, input);
    stats.destinations = result.destinations.size();

    if (result.destinations.size() < 2) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Only %zu destinations; no corridors to build", result.destinations.size());
        result.densityGrid = DensityGrid(config.density.cellSize);
        return true;
    }

    // Corridors
    std::vector<Corridor> candidates = scoreCorridors(terrain, result.destinations);
    stats.candidateEdges = candidates.size();

    CorridorSelection selection = selectCorridors(terrain, result.destinations, candidates);
    stats.rejectedEdges = selection.rejected;
    stats.mstEdges = selection.tree.size();
    stats.loopEdges = selection.loops.size();
    result.corridors = selection.all();

    // Road paths
    TerrainPathfinder pathfinder(terrain, config.pathfinder);
    RoadPathBuilder pathBuilder(terrain, config.usePathfinder ? &pathfinder : nullptr, config.pathBuilder);

    std::vector<RoadRecord> roads;
    roads.reserve(result.corridors.size());
    for (const auto& corridor : result.corridors) {
        bool allowBridges = allowsWaterCrossing(result.destinations[corridor.fromIdx],
                                                result.destinations[corridor.toIdx],
                                                config.classification);
        if (auto road = pathBuilder.realizeCorridor(corridor, allowBridges)) {
            roads.push_back(std::move(*road));
        } else {
            stats.degenerateCorridors++;
        }
    }
    stats.corridorRoads = roads.size();

    SDL_Log("Realized %zu corridor roads (%zu degenerate, %.1f km)",
            roads.size(), stats.degenerateCorridors, getTotalLength(roads) / 1000.0f);

    // Branches
    if (config.enableBranching && !roads.empty()) {
        HierarchicalBrancher brancher(terrain, pathBuilder, config.branching);

        DensityGrid trunkDensity(config.density.cellSize);
        if (config.densityGuidedBranching) {
            DensityAnalyzer analyzer(config.density);
            trunkDensity = analyzer.rasterize(roads);
            analyzer.smooth(trunkDensity, config.density.smoothingIterations);
            brancher.setDensityLookup([&trunkDensity](glm::vec2 xz) {
                return trunkDensity.scoreAt(xz.x, xz.y);
            });
        }

        std::vector<RoadRecord> branches = brancher.generate(roads);
        stats.branchRoads = branches.size();
        roads.insert(roads.end(), branches.begin(), branches.end());
    }
    stats.pathfinderFallbacks = pathBuilder.getFallbackCount();

    // Consolidation
    NetworkConsolidator consolidator(config.consolidation);
    roads = consolidator.consolidate(roads);
    stats.merged = consolidator.getStats().merged;
    roads = consolidator.prune(roads);
    stats.pruned = consolidator.getStats().pruned;

    // Exclusion zones
    result.exclusionZones = buildExclusionZones(roads, terrain, config.exclusion);
    stats.exclusionZones = result.exclusionZones.size();

    // Density
    if (config.enableDensity) {
        DensityAnalyzer analyzer(config.density, &terrain);
        result.emergentSettlements = analyzer.analyze(roads, &result.densityGrid);
    } else {
        result.densityGrid = DensityGrid(config.density.cellSize);
    }
    stats.emergentSettlements = result.emergentSettlements.size();

    result.roads = std::move(roads);
    stats.totalLength = getTotalLength(result.roads);

    SDL_Log("Road network: %zu roads (%zu highway, %zu arterial, %zu settlement, %zu lane, %zu branch), %.1f km",
            result.roads.size(),
            countByType(result.roads, RoadClass::Highway),
            countByType(result.roads, RoadClass::Arterial),
            countByType(result.roads, RoadClass::SettlementRoad),
            countByType(result.roads, RoadClass::Lane),
            countByType(result.roads, RoadClass::Branch),
            stats.totalLength / 1000.0f);

    return true;
}

} // namespace RoadNet
