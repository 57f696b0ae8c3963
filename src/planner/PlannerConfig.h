#pragma once

#include "roads/CostModel.h"
#include "roads/GraphBuilder.h"
#include "roads/TrafficDemandModel.h"
#include "roads/CorridorClassifier.h"
#include "roads/TerrainPathfinder.h"
#include "roads/RoadPathBuilder.h"
#include "roads/NetworkConsolidator.h"
#include "roads/HierarchicalBrancher.h"
#include "roads/DestinationCollector.h"
#include "roads/ExclusionZones.h"
#include "density/DensityAnalyzer.h"
#include <cstdint>
#include <string>

namespace RoadNet {

// Every tunable of one planning pass.
// terrainSize, seaLevel and seed are shared; applyShared() copies them into the stages.
struct PlannerConfig {
    float terrainSize = 16384.0f;       // Map centered on the origin
    float seaLevel = 0.0f;
    uint32_t seed = 12345;

    WeightMode weightMode = WeightMode::EconomicCost;
    bool usePathfinder = true;          // Straight roads when false
    bool enableBranching = true;
    bool enableDensity = true;
    bool densityGuidedBranching = true; // Shorter branch intervals where the network is dense
    float terrainCacheQuantum = 0.25f;  // 0 disables terrain memoization

    DestinationConfig destinations;
    CostModelConfig cost;
    GraphConfig graph;
    TrafficDemandConfig demand;
    ClassificationConfig classification;
    TerrainPathfinderConfig pathfinder;
    PathBuilderConfig pathBuilder;
    BranchConfig branching;
    ConsolidationConfig consolidation;
    ExclusionConfig exclusion;
    DensityConfig density;

    void applyShared();
};

// Flat JSON object of key -> number/bool overrides, e.g. {"bridge_cost_multiplier": 10}.
// Unknown keys are warned about and skipped. A value of the wrong type fails the load.
bool applyConfigOverrides(const std::string& jsonString, PlannerConfig& config);

bool loadPlannerConfig(const std::string& path, PlannerConfig& config);

} // namespace RoadNet
