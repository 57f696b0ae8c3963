#pragma once

#include "PlannerConfig.h"
#include "roads/RoadTypes.h"
#include "roads/ExclusionZones.h"
#include "roads/DestinationCollector.h"
#include "density/DensityAnalyzer.h"
#include "terrain/TerrainOracle.h"
#include <vector>

namespace RoadNet {

struct PlanInput {
    std::vector<SettlementInput> settlements;
    std::vector<LandmarkInput> landmarks;
    std::vector<Destination> destinations;  // Already gathered; appended after collected ones
};

struct PlanStats {
    size_t destinations = 0;
    size_t candidateEdges = 0;
    size_t rejectedEdges = 0;       // Failed economic viability
    size_t mstEdges = 0;
    size_t loopEdges = 0;
    size_t corridorRoads = 0;
    size_t degenerateCorridors = 0;
    size_t branchRoads = 0;
    size_t merged = 0;
    size_t pruned = 0;
    size_t pathfinderFallbacks = 0;
    size_t exclusionZones = 0;
    size_t emergentSettlements = 0;
    float totalLength = 0.0f;
};

struct PlanResult {
    std::vector<Destination> destinations;
    std::vector<Corridor> corridors;            // Selected corridors (MST first, then loops)
    std::vector<RoadRecord> roads;
    std::vector<ExclusionZone> exclusionZones;
    std::vector<EmergentSettlement> emergentSettlements;
    DensityGrid densityGrid;
    PlanStats stats;
};

// Output of corridor selection
struct CorridorSelection {
    std::vector<Corridor> tree;
    std::vector<Corridor> loops;
    size_t rejected = 0;

    std::vector<Corridor> all() const;
};

// Runs one generation pass: destinations -> corridors -> roads -> branches ->
// consolidation -> exclusion zones -> density.
// Each stage takes the full output of the previous one.
class RoadNetworkPlanner {
public:
    explicit RoadNetworkPlanner(const PlannerConfig& config);

    // Fails only when the terrain oracle is missing
    bool plan(const TerrainOracle* terrain, const PlanInput& input, PlanResult& result);

    // Individual stages
    std::vector<Destination> gatherDestinations(const TerrainOracle& terrain, const PlanInput& input) const;
    std::vector<Corridor> scoreCorridors(const TerrainOracle& terrain,
                                         const std::vector<Destination>& destinations) const;
    CorridorSelection selectCorridors(const TerrainOracle& terrain,
                                      const std::vector<Destination>& destinations,
                                      const std::vector<Corridor>& candidates) const;

    const PlannerConfig& getConfig() const { return config; }

private:
    PlannerConfig config;
};

} // namespace RoadNet
