// Road network planner tool
// Plans a hierarchical road network between settlements and infers settlement
// density from the resulting topology

#include "planner/PlannerConfig.h"
#include "planner/RoadNetworkPlanner.h"
#include "io/RoadNetworkIO.h"
#include "terrain/HeightmapTerrain.h"
#include "roads/RoadPathBuilder.h"
#include <SDL3/SDL_log.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <settlements.json> <output_dir> [options]\n"
              << "\n"
              << "Plans a road network connecting settlements, landmarks, coastline and farms,\n"
              << "then infers settlement density from the finished network.\n"
              << "\n"
              << "Arguments:\n"
              << "  settlements.json  Settlement data from the settlement generator\n"
              << "  output_dir        Directory for output files\n"
              << "\n"
              << "Options:\n"
              << "  --heightmap <file>          16-bit PNG heightmap (default: flat terrain)\n"
              << "  --config <file>             JSON object of planner setting overrides\n"
              << "  --terrain-size <value>      World size in meters (default: 16384.0)\n"
              << "  --min-altitude <value>      Min altitude in heightmap (default: -20.0)\n"
              << "  --max-altitude <value>      Max altitude in heightmap (default: 200.0)\n"
              << "  --sea-level <value>         Water level in meters (default: 0.0)\n"
              << "  --seed <value>              Random seed (default: 12345)\n"
              << "  --no-density                Skip emergent settlement inference\n"
              << "  --mesh                      Also write road ribbon meshes (roads.obj)\n"
              << "  --help                      Show this help message\n"
              << "\n"
              << "Output files:\n"
              << "  roads.json              Road network data in JSON format\n"
              << "  roads.bin               Binary road network for runtime loading\n"
              << "  emergent_settlements.json  Settlements inferred from road density\n"
              << "  roads.obj               Road ribbon meshes (with --mesh)\n"
              << "  roads.svg               Debug visualization of the network\n"
              << "\n"
              << "Example:\n"
              << "  " << programName << " settlements.json ./generated --heightmap terrain.png\n";
}

int main(int argc, char* argv[]) {
    // Check for help flag first
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string settlementsPath = argv[1];
    std::string outputDir = argv[2];

    std::string heightmapPath;
    std::string configPath;
    bool writeMesh = false;
    bool skipDensity = false;

    RoadNet::HeightmapConfig heightmapConfig;

    // Command line values are applied after the config file
    std::optional<float> terrainSizeArg;
    std::optional<float> seaLevelArg;
    std::optional<uint32_t> seedArg;

    try {
        for (int i = 3; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--heightmap" && i + 1 < argc) {
                heightmapPath = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--terrain-size" && i + 1 < argc) {
                terrainSizeArg = std::stof(argv[++i]);
            } else if (arg == "--min-altitude" && i + 1 < argc) {
                heightmapConfig.minAltitude = std::stof(argv[++i]);
            } else if (arg == "--max-altitude" && i + 1 < argc) {
                heightmapConfig.maxAltitude = std::stof(argv[++i]);
            } else if (arg == "--sea-level" && i + 1 < argc) {
                seaLevelArg = std::stof(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seedArg = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--no-density") {
                skipDensity = true;
            } else if (arg == "--mesh") {
                writeMesh = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid numeric argument: %s", e.what());
        return 1;
    }

    // Load settlements
    std::vector<RoadNet::SettlementInput> settlements;
    std::vector<RoadNet::LandmarkInput> landmarks;
    float settlementsTerrainSize = 16384.0f;

    if (!RoadNet::loadSettlementsJson(settlementsPath, settlements, landmarks, settlementsTerrainSize)) {
        return 1;
    }

    // Configuration: defaults, settlements file terrain size, config file, command line
    RoadNet::PlannerConfig config;
    config.terrainSize = settlementsTerrainSize;

    if (!configPath.empty() && !RoadNet::loadPlannerConfig(configPath, config)) {
        return 1;
    }
    if (terrainSizeArg) config.terrainSize = *terrainSizeArg;
    if (seaLevelArg) config.seaLevel = *seaLevelArg;
    if (seedArg) config.seed = *seedArg;
    if (skipDensity) config.enableDensity = false;
    config.applyShared();

    // Create output directory if needed
    fs::create_directories(outputDir);

    SDL_Log("Road Network Planner");
    SDL_Log("====================");
    SDL_Log("Settlements: %s", settlementsPath.c_str());
    SDL_Log("Heightmap: %s", heightmapPath.empty() ? "(flat)" : heightmapPath.c_str());
    SDL_Log("Output: %s", outputDir.c_str());
    SDL_Log("Terrain size: %.1f m", config.terrainSize);
    SDL_Log("Sea level: %.1f m", config.seaLevel);
    SDL_Log("Seed: %u", config.seed);

    // Terrain
    std::unique_ptr<RoadNet::TerrainOracle> terrain;
    if (!heightmapPath.empty()) {
        heightmapConfig.terrainSize = config.terrainSize;
        auto heightmap = std::make_unique<RoadNet::HeightmapTerrain>(heightmapConfig);
        if (!heightmap->loadHeightmap(heightmapPath)) {
            return 1;
        }
        terrain = std::move(heightmap);
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No heightmap given, planning over flat dry terrain");
        float flatElevation = config.seaLevel + 10.0f;
        terrain = std::make_unique<RoadNet::FunctionTerrain>(RoadNet::FunctionTerrain::flat(flatElevation));
    }

    // Plan
    SDL_Log("Planning road network...");

    RoadNet::RoadNetworkPlanner planner(config);
    RoadNet::PlanInput input;
    input.settlements = std::move(settlements);
    input.landmarks = std::move(landmarks);

    RoadNet::PlanResult result;
    if (!planner.plan(terrain.get(), input, result)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Road network planning failed!");
        return 1;
    }

    // Save outputs
    std::string jsonPath = outputDir + "/roads.json";
    std::string binPath = outputDir + "/roads.bin";
    std::string settlementsOutPath = outputDir + "/emergent_settlements.json";
    std::string svgPath = outputDir + "/roads.svg";
    std::string meshPath = outputDir + "/roads.obj";

    if (!RoadNet::saveRoadsJson(jsonPath, result.roads, config.terrainSize)) {
        return 1;
    }

    if (!RoadNet::saveRoadsBinary(binPath, result.roads, config.terrainSize)) {
        return 1;
    }

    if (config.enableDensity &&
        !RoadNet::saveSettlementsJson(settlementsOutPath, result.emergentSettlements)) {
        return 1;
    }

    if (writeMesh) {
        RoadNet::RoadPathBuilder meshBuilder(*terrain, nullptr, config.pathBuilder);
        std::vector<RoadNet::RoadMesh> meshes;
        meshes.reserve(result.roads.size());
        for (const auto& road : result.roads) {
            meshes.push_back(meshBuilder.buildRibbonMesh(road));
        }
        if (!RoadNet::saveRoadMeshObj(meshPath, meshes)) {
            return 1;
        }
    }

    RoadNet::writeNetworkSVG(svgPath, result.roads, result.destinations,
                             result.emergentSettlements, config.terrainSize);

    const auto& stats = result.stats;
    SDL_Log("Road planning complete!");
    SDL_Log("  Destinations: %zu", stats.destinations);
    SDL_Log("  Corridors: %zu tree + %zu loop (%zu rejected)", stats.mstEdges, stats.loopEdges, stats.rejectedEdges);
    SDL_Log("  Roads: %zu corridor, %zu branch, %zu merged, %zu pruned",
            stats.corridorRoads, stats.branchRoads, stats.merged, stats.pruned);
    SDL_Log("  Total length: %.1f km", stats.totalLength / 1000.0f);
    SDL_Log("  Emergent settlements: %zu", stats.emergentSettlements);
    SDL_Log("Output files:");
    SDL_Log("  %s", jsonPath.c_str());
    SDL_Log("  %s", binPath.c_str());
    if (config.enableDensity) SDL_Log("  %s", settlementsOutPath.c_str());
    if (writeMesh) SDL_Log("  %s", meshPath.c_str());
    SDL_Log("  %s", svgPath.c_str());

    return 0;
}
