#include "PlannerConfig.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <variant>
#include <vector>

using json = nlohmann::json;

namespace RoadNet {

void PlannerConfig::applyShared() {
    destinations.terrainSize = terrainSize;
    destinations.seaLevel = seaLevel;
    destinations.seed = seed;

    cost.seaLevel = seaLevel;
    demand.terrainSize = terrainSize;
    pathfinder.seaLevel = seaLevel;

    branching.terrainSize = terrainSize;
    branching.seaLevel = seaLevel;
    branching.seed = seed;

    exclusion.seaLevel = seaLevel;
}

namespace {

using FieldRef = std::variant<float*, int*, uint32_t*, size_t*, bool*>;

struct ConfigField {
    const char* key;
    FieldRef ref;
};

std::vector<ConfigField> describeFields(PlannerConfig& c) {
    return {
        // Shared
        {"terrain_size", &c.terrainSize},
        {"sea_level", &c.seaLevel},
        {"seed", &c.seed},
        {"use_pathfinder", &c.usePathfinder},
        {"enable_branching", &c.enableBranching},
        {"enable_density", &c.enableDensity},
        {"density_guided_branching", &c.densityGuidedBranching},
        {"terrain_cache_quantum", &c.terrainCacheQuantum},

        // Destinations
        {"scan_spacing", &c.destinations.scanSpacing},
        {"max_coastline_points", &c.destinations.maxCoastlinePoints},
        {"coastline_min_spacing", &c.destinations.coastlineMinSpacing},
        {"max_farms", &c.destinations.maxFarms},
        {"farm_max_slope", &c.destinations.farmMaxSlope},
        {"farm_min_settlement_distance", &c.destinations.farmMinSettlementDistance},
        {"farm_min_spacing", &c.destinations.farmMinSpacing},

        // Cost model
        {"cost_samples", &c.cost.samples},
        {"bridge_cost_multiplier", &c.cost.bridgeCostMultiplier},
        {"min_population_for_bridge", &c.cost.minPopulationForBridge},
        {"max_cost_per_capita", &c.cost.maxCostPerCapita},

        // Graph
        {"max_destinations", &c.graph.maxDestinations},
        {"loop_factor", &c.graph.loopFactor},

        // Demand
        {"decay_distance", &c.demand.decayDistance},
        {"buildability_weight", &c.demand.buildabilityWeight},
        {"centrality_weight", &c.demand.centralityWeight},
        {"corridor_cap_factor", &c.demand.corridorCapFactor},

        // Classification
        {"highway_max_priority", &c.classification.highwayMaxPriority},
        {"highway_min_population", &c.classification.highwayMinPopulation},
        {"arterial_max_priority", &c.classification.arterialMaxPriority},
        {"minor_priority", &c.classification.minorPriority},

        // Pathfinding
        {"slope_cost_multiplier", &c.pathfinder.slopeCostMultiplier},
        {"water_penalty", &c.pathfinder.waterPenalty},
        {"cliff_penalty", &c.pathfinder.cliffPenalty},
        {"cliff_slope_degrees", &c.pathfinder.cliffSlopeDegrees},
        {"simplify_epsilon", &c.pathfinder.simplifyEpsilon},
        {"max_grid_cells", &c.pathfinder.maxGridCells},
        {"cells_per_corridor", &c.pathBuilder.cellsPerCorridor},
        {"min_grid_resolution", &c.pathBuilder.minGridResolution},
        {"max_grid_resolution", &c.pathBuilder.maxGridResolution},
        {"vertical_offset", &c.pathBuilder.verticalOffset},

        // Branching
        {"branch_interval", &c.branching.branchInterval},
        {"branch_probability", &c.branching.branchProbability},
        {"max_depth", &c.branching.maxDepth},
        {"min_branch_length", &c.branching.minBranchLength},
        {"max_branch_length", &c.branching.maxBranchLength},
        {"angle_variance", &c.branching.angleVariance},
        {"sub_branch_probability", &c.branching.subBranchProbability},
        {"sub_branch_decay", &c.branching.subBranchDecay},
        {"merge_radius", &c.branching.mergeRadius},
        {"boundary_margin", &c.branching.boundaryMargin},
        {"max_branch_roads", &c.branching.maxBranchRoads},

        // Consolidation
        {"merge_distance", &c.consolidation.mergeDistance},
        {"min_road_value", &c.consolidation.minRoadValue},

        // Exclusion zones
        {"exclusion_margin", &c.exclusion.margin},
        {"bridge_margin", &c.exclusion.bridgeMargin},

        // Density
        {"cell_size", &c.density.cellSize},
        {"intersection_distance", &c.density.intersectionDistance},
        {"detect_segment_crossings", &c.density.detectSegmentCrossings},
        {"road_weight", &c.density.roadWeight},
        {"intersection_weight", &c.density.intersectionWeight},
        {"smoothing_iterations", &c.density.smoothingIterations},
        {"urban_core_threshold", &c.density.thresholds.urbanCore},
        {"urban_threshold", &c.density.thresholds.urban},
        {"suburban_threshold", &c.density.thresholds.suburban},
        {"rural_threshold", &c.density.thresholds.rural},
    };
}

bool assignField(const char* key, const FieldRef& ref, const json& value) {
    if (auto p = std::get_if<float*>(&ref)) {
        if (!value.is_number()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key '%s' expects a number", key);
            return false;
        }
        **p = value.get<float>();
    } else if (auto p = std::get_if<int*>(&ref)) {
        if (!value.is_number_integer()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key '%s' expects an integer", key);
            return false;
        }
        **p = value.get<int>();
    } else if (auto p = std::get_if<uint32_t*>(&ref)) {
        if (!value.is_number_unsigned()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key '%s' expects a non-negative integer", key);
            return false;
        }
        **p = value.get<uint32_t>();
    } else if (auto p = std::get_if<size_t*>(&ref)) {
        if (!value.is_number_unsigned()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key '%s' expects a non-negative integer", key);
            return false;
        }
        **p = value.get<size_t>();
    } else if (auto p = std::get_if<bool*>(&ref)) {
        if (!value.is_boolean()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key '%s' expects true or false", key);
            return false;
        }
        **p = value.get<bool>();
    }
    return true;
}

} // namespace

bool applyConfigOverrides(const std::string& jsonString, PlannerConfig& config) {
    json j;
    try {
        j = json::parse(jsonString);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to parse config JSON: %s", e.what());
        return false;
    }

    if (!j.is_object()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config JSON must be an object of key/value overrides");
        return false;
    }

    // Work on a copy so a failed load leaves the caller's config untouched
    PlannerConfig updated = config;
    auto fields = describeFields(updated);
    size_t applied = 0;

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();

        if (key == "cost_aware") {
            if (!it.value().is_boolean()) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config key 'cost_aware' expects true or false");
                return false;
            }
            updated.weightMode = it.value().get<bool>() ? WeightMode::EconomicCost : WeightMode::Distance;
            applied++;
            continue;
        }

        bool known = false;
        for (const auto& field : fields) {
            if (key != field.key) continue;
            known = true;
            if (!assignField(field.key, field.ref, it.value())) {
                return false;
            }
            applied++;
            break;
        }

        if (!known) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring unknown config key '%s'", key.c_str());
        }
    }

    config = updated;
    SDL_Log("Applied %zu config overrides", applied);
    return true;
}

bool loadPlannerConfig(const std::string& path, PlannerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open config file: %s", path.c_str());
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return applyConfigOverrides(content, config);
}

} // namespace RoadNet
