#pragma once

#include "roads/RoadTypes.h"
#include "roads/RoadPathBuilder.h"
#include "roads/DestinationCollector.h"
#include "density/DensityAnalyzer.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace RoadNet {

// Settlements file as written by the settlement generator:
// {"terrain_size": f, "settlements": [{"id", "type", "x", "z", "radius", "population",
//  "building_count"}], "landmarks": [{"id", "x", "z", "name"}]}
// Type may come from "type", "settlement_type" or "kind"; it is inferred from
// population when none is recognised.
bool parseSettlementsJson(const std::string& jsonString, std::vector<SettlementInput>& settlements,
                          std::vector<LandmarkInput>& landmarks, float& terrainSize);

bool loadSettlementsJson(const std::string& path, std::vector<SettlementInput>& settlements,
                         std::vector<LandmarkInput>& landmarks, float& terrainSize);

nlohmann::json roadsToJson(const std::vector<RoadRecord>& roads, float terrainSize);
nlohmann::json emergentSettlementsToJson(const std::vector<EmergentSettlement>& settlements);

bool saveRoadsJson(const std::string& path, const std::vector<RoadRecord>& roads, float terrainSize);

// Binary layout ("RNET", version 1, little endian):
//   char[4] magic, u32 version, f32 terrainSize, u32 roadCount
//   per road: u8 type, f32 width, u32 fromDestination, u32 toDestination,
//             f32 demand (-1 when absent), i32 depth, u32 pointCount, pointCount * f32[3]
bool saveRoadsBinary(const std::string& path, const std::vector<RoadRecord>& roads, float terrainSize);
bool loadRoadsBinary(const std::string& path, std::vector<RoadRecord>& roads, float& terrainSize);

bool saveSettlementsJson(const std::string& path, const std::vector<EmergentSettlement>& settlements);

// All ribbon meshes as one Wavefront OBJ, one object per road
bool saveRoadMeshObj(const std::string& path, const std::vector<RoadMesh>& meshes);

// Top-down debug view of roads, destinations and emergent settlements
void writeNetworkSVG(
    const std::string& filename,
    const std::vector<RoadRecord>& roads,
    const std::vector<Destination>& destinations,
    const std::vector<EmergentSettlement>& settlements,
    float terrainSize,
    int outputWidth = 1024,
    int outputHeight = 1024
);

} // namespace RoadNet
