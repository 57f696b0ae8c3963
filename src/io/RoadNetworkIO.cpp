#include "RoadNetworkIO.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

using json = nlohmann::json;

namespace RoadNet {

// ============================================================================
// Settlements input
// ============================================================================

static std::optional<std::string> optionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool parseSettlementsJson(const std::string& jsonString, std::vector<SettlementInput>& settlements,
                          std::vector<LandmarkInput>& landmarks, float& terrainSize) {
    try {
        json j = json::parse(jsonString);

        if (j.contains("terrain_size")) {
            terrainSize = j["terrain_size"].get<float>();
        }

        if (j.contains("settlements")) {
            uint32_t nextId = 0;
            for (const auto& s : j["settlements"]) {
                SettlementInput settlement;
                settlement.id = s.value("id", nextId);
                settlement.center.x = s.at("x").get<float>();
                settlement.center.y = s.at("z").get<float>();
                settlement.radius = s.value("radius", 100.0f);
                settlement.population = s.value("population", 0);
                settlement.buildingCount = s.value("building_count", 0);

                SettlementTypeSources sources;
                sources.type = optionalString(s, "type");
                sources.settlementType = optionalString(s, "settlement_type");
                sources.kind = optionalString(s, "kind");
                sources.population = settlement.population;
                sources.buildingCount = settlement.buildingCount;
                settlement.type = resolveSettlementType(sources);

                settlements.push_back(settlement);
                nextId = std::max(nextId, settlement.id + 1);
            }
        }

        if (j.contains("landmarks")) {
            uint32_t nextId = 0;
            for (const auto& l : j["landmarks"]) {
                LandmarkInput landmark;
                landmark.id = l.value("id", nextId);
                landmark.position.x = l.at("x").get<float>();
                landmark.position.y = l.at("z").get<float>();
                landmark.name = l.value("name", std::string());
                landmarks.push_back(landmark);
                nextId = std::max(nextId, landmark.id + 1);
            }
        }

        SDL_Log("Loaded %zu settlements and %zu landmarks", settlements.size(), landmarks.size());
        return true;

    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to parse settlements JSON: %s", e.what());
        return false;
    }
}

bool loadSettlementsJson(const std::string& path, std::vector<SettlementInput>& settlements,
                         std::vector<LandmarkInput>& landmarks, float& terrainSize) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open settlements file: %s", path.c_str());
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return parseSettlementsJson(content, settlements, landmarks, terrainSize);
}

// ============================================================================
// Roads output
// ============================================================================

json roadsToJson(const std::vector<RoadRecord>& roads, float terrainSize) {
    json j;
    j["terrain_size"] = terrainSize;
    j["total_length_m"] = getTotalLength(roads);

    json roadArray = json::array();
    for (const auto& road : roads) {
        json r;
        r["type"] = getRoadClassName(road.type);
        r["width"] = road.width;
        r["depth"] = road.depth;
        r["length_m"] = road.getLength();
        if (road.demand) r["demand"] = *road.demand;
        if (road.fromDestination != UINT32_MAX) r["from_destination"] = road.fromDestination;
        if (road.toDestination != UINT32_MAX) r["to_destination"] = road.toDestination;

        json points = json::array();
        for (const auto& p : road.path) {
            points.push_back({{"x", p.x}, {"y", p.y}, {"z", p.z}});
        }
        r["path"] = points;
        roadArray.push_back(r);
    }
    j["roads"] = roadArray;
    return j;
}

bool saveRoadsJson(const std::string& path, const std::vector<RoadRecord>& roads, float terrainSize) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create roads JSON file: %s", path.c_str());
        return false;
    }

    file << roadsToJson(roads, terrainSize).dump(2) << "\n";

    SDL_Log("Saved roads JSON: %s", path.c_str());
    return true;
}

bool saveRoadsBinary(const std::string& path, const std::vector<RoadRecord>& roads, float terrainSize) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create roads binary file: %s", path.c_str());
        return false;
    }

    // Header
    const char magic[] = "RNET";
    file.write(magic, 4);

    uint32_t version = 1;
    file.write(reinterpret_cast<const char*>(&version), sizeof(version));
    file.write(reinterpret_cast<const char*>(&terrainSize), sizeof(terrainSize));

    uint32_t numRoads = static_cast<uint32_t>(roads.size());
    file.write(reinterpret_cast<const char*>(&numRoads), sizeof(numRoads));

    // Roads
    for (const auto& road : roads) {
        uint8_t type = static_cast<uint8_t>(road.type);
        file.write(reinterpret_cast<const char*>(&type), sizeof(type));
        file.write(reinterpret_cast<const char*>(&road.width), sizeof(road.width));
        file.write(reinterpret_cast<const char*>(&road.fromDestination), sizeof(road.fromDestination));
        file.write(reinterpret_cast<const char*>(&road.toDestination), sizeof(road.toDestination));

        float demand = road.demand.value_or(-1.0f);
        file.write(reinterpret_cast<const char*>(&demand), sizeof(demand));

        int32_t depth = road.depth;
        file.write(reinterpret_cast<const char*>(&depth), sizeof(depth));

        uint32_t numPoints = static_cast<uint32_t>(road.path.size());
        file.write(reinterpret_cast<const char*>(&numPoints), sizeof(numPoints));

        for (const auto& p : road.path) {
            file.write(reinterpret_cast<const char*>(&p.x), sizeof(p.x));
            file.write(reinterpret_cast<const char*>(&p.y), sizeof(p.y));
            file.write(reinterpret_cast<const char*>(&p.z), sizeof(p.z));
        }
    }

    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed writing roads binary file: %s", path.c_str());
        return false;
    }

    SDL_Log("Saved roads binary: %s (%lld bytes)", path.c_str(), static_cast<long long>(file.tellp()));
    return true;
}

bool loadRoadsBinary(const std::string& path, std::vector<RoadRecord>& roads, float& terrainSize) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open roads binary file: %s", path.c_str());
        return false;
    }

    char magic[4];
    file.read(magic, 4);
    if (!file || std::memcmp(magic, "RNET", 4) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid roads binary file: %s", path.c_str());
        return false;
    }

    uint32_t version = 0;
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    if (version != 1) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unsupported roads binary version %u", version);
        return false;
    }

    uint32_t numRoads = 0;
    file.read(reinterpret_cast<char*>(&terrainSize), sizeof(terrainSize));
    file.read(reinterpret_cast<char*>(&numRoads), sizeof(numRoads));

    std::vector<RoadRecord> loaded;
    for (uint32_t i = 0; i < numRoads && file; i++) {
        RoadRecord road;

        uint8_t type = 0;
        file.read(reinterpret_cast<char*>(&type), sizeof(type));
        if (type >= static_cast<uint8_t>(RoadClass::Count)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid road type %u in %s", type, path.c_str());
            return false;
        }
        road.type = static_cast<RoadClass>(type);

        file.read(reinterpret_cast<char*>(&road.width), sizeof(road.width));
        file.read(reinterpret_cast<char*>(&road.fromDestination), sizeof(road.fromDestination));
        file.read(reinterpret_cast<char*>(&road.toDestination), sizeof(road.toDestination));

        float demand = -1.0f;
        file.read(reinterpret_cast<char*>(&demand), sizeof(demand));
        if (demand >= 0.0f) road.demand = demand;

        int32_t depth = 0;
        file.read(reinterpret_cast<char*>(&depth), sizeof(depth));
        road.depth = depth;

        uint32_t numPoints = 0;
        file.read(reinterpret_cast<char*>(&numPoints), sizeof(numPoints));
        for (uint32_t p = 0; p < numPoints && file; p++) {
            glm::vec3 point;
            file.read(reinterpret_cast<char*>(&point.x), sizeof(point.x));
            file.read(reinterpret_cast<char*>(&point.y), sizeof(point.y));
            file.read(reinterpret_cast<char*>(&point.z), sizeof(point.z));
            road.path.push_back(point);
        }

        if (!road.path.empty()) {
            road.from = road.path.front();
            road.to = road.path.back();
        }
        loaded.push_back(std::move(road));
    }

    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Truncated roads binary file: %s", path.c_str());
        return false;
    }

    roads = std::move(loaded);
    SDL_Log("Loaded %zu roads from %s", roads.size(), path.c_str());
    return true;
}

// ============================================================================
// Emergent settlements and meshes
// ============================================================================

json emergentSettlementsToJson(const std::vector<EmergentSettlement>& settlements) {
    json j;
    json array = json::array();
    for (size_t i = 0; i < settlements.size(); i++) {
        const auto& s = settlements[i];
        array.push_back({
            {"id", i},
            {"x", s.center.x},
            {"y", s.center.y},
            {"z", s.center.z},
            {"radius", s.radius},
            {"density_score", s.densityScore},
            {"density_class", getDensityClassName(s.densityClass)}
        });
    }
    j["settlements"] = array;
    return j;
}

bool saveSettlementsJson(const std::string& path, const std::vector<EmergentSettlement>& settlements) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create settlements JSON file: %s", path.c_str());
        return false;
    }

    file << emergentSettlementsToJson(settlements).dump(2) << "\n";

    SDL_Log("Saved %zu emergent settlements: %s", settlements.size(), path.c_str());
    return true;
}

bool saveRoadMeshObj(const std::string& path, const std::vector<RoadMesh>& meshes) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create road mesh file: %s", path.c_str());
        return false;
    }

    file << std::fixed << std::setprecision(3);
    file << "# Road ribbon meshes\n";

    // OBJ indices are 1-based and global across objects
    size_t vertexBase = 1;
    size_t triangles = 0;

    for (size_t m = 0; m < meshes.size(); m++) {
        const auto& mesh = meshes[m];
        if (mesh.vertices.empty()) continue;

        file << "o road_" << m << "\n";
        for (const auto& v : mesh.vertices) {
            file << "v " << v.position.x << " " << v.position.y << " " << v.position.z << "\n";
        }
        for (const auto& v : mesh.vertices) {
            file << "vt " << v.uv.x << " " << v.uv.y << "\n";
        }
        for (const auto& v : mesh.vertices) {
            file << "vn " << v.normal.x << " " << v.normal.y << " " << v.normal.z << "\n";
        }

        for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
            file << "f";
            for (size_t k = 0; k < 3; k++) {
                size_t idx = vertexBase + mesh.indices[i + k];
                file << " " << idx << "/" << idx << "/" << idx;
            }
            file << "\n";
        }

        vertexBase += mesh.vertices.size();
        triangles += mesh.triangleCount();
    }

    SDL_Log("Saved road mesh: %s (%zu triangles)", path.c_str(), triangles);
    return true;
}

// ============================================================================
// SVG
// ============================================================================

static const char* getRoadColor(RoadClass type) {
    switch (type) {
        case RoadClass::Highway:        return "#d4a574";  // Tan/brown
        case RoadClass::Arterial:       return "#b8956e";  // Lighter brown
        case RoadClass::SettlementRoad: return "#a0826a";
        case RoadClass::Lane:           return "#8b7355";  // Medium brown
        case RoadClass::Branch:         return "#6b5344";  // Dark brown
        default:                        return "#888888";
    }
}

static const char* getDestinationColor(DestinationKind kind) {
    switch (kind) {
        case DestinationKind::Settlement: return "#cc3333";  // Red
        case DestinationKind::Coastline:  return "#3366cc";  // Blue
        case DestinationKind::Landmark:   return "#9933cc";  // Purple
        case DestinationKind::Farm:       return "#669933";  // Green
        default:                          return "#666666";
    }
}

static const char* getDensityColor(DensityClass densityClass) {
    switch (densityClass) {
        case DensityClass::UrbanCore: return "#b30000";
        case DensityClass::Urban:     return "#e34a33";
        case DensityClass::Suburban:  return "#fc8d59";
        case DensityClass::Rural:     return "#fdcc8a";
        default:                      return "#cccccc";
    }
}

void writeNetworkSVG(
    const std::string& filename,
    const std::vector<RoadRecord>& roads,
    const std::vector<Destination>& destinations,
    const std::vector<EmergentSettlement>& settlements,
    float terrainSize,
    int outputWidth,
    int outputHeight
) {
    std::ofstream file(filename);
    if (!file) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Could not write %s", filename.c_str());
        return;
    }

    float scale = static_cast<float>(outputWidth) / terrainSize;
    float halfSize = terrainSize * 0.5f;
    auto toPixel = [&](float x, float z) {
        return glm::vec2((x + halfSize) * scale, (z + halfSize) * scale);
    };

    file << std::fixed << std::setprecision(2);
    file << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    file << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
         << "width=\"" << outputWidth << "\" height=\"" << outputHeight << "\" "
         << "viewBox=\"0 0 " << outputWidth << " " << outputHeight << "\">\n";

    // Background
    file << "  <rect width=\"100%\" height=\"100%\" fill=\"#f5f5dc\"/>\n";

    // Metadata
    file << "  <!-- Roads: " << roads.size() << " -->\n";
    file << "  <!-- Total length: " << (getTotalLength(roads) / 1000.0f) << " km -->\n";

    // Emergent settlement areas underneath the roads
    file << "  <g id=\"density\">\n";
    for (const auto& s : settlements) {
        glm::vec2 c = toPixel(s.center.x, s.center.z);
        const char* color = getDensityColor(s.densityClass);
        file << "    <circle cx=\"" << c.x << "\" cy=\"" << c.y
             << "\" r=\"" << std::max(1.0f, s.radius * scale) << "\" fill=\"" << color
             << "\" fill-opacity=\"0.35\" stroke=\"" << color << "\" stroke-width=\"1\"/>\n";
    }
    file << "  </g>\n";

    // Minor roads first so trunks are drawn on top
    std::vector<size_t> roadOrder;
    roadOrder.reserve(roads.size());
    for (size_t i = 0; i < roads.size(); i++) {
        roadOrder.push_back(i);
    }
    std::sort(roadOrder.begin(), roadOrder.end(), [&](size_t a, size_t b) {
        return static_cast<int>(roads[a].type) > static_cast<int>(roads[b].type);
    });

    file << "  <g id=\"roads\" fill=\"none\" stroke-linecap=\"round\" stroke-linejoin=\"round\">\n";
    for (size_t idx : roadOrder) {
        const auto& road = roads[idx];
        if (road.path.size() < 2) continue;

        std::ostringstream d;
        d << std::fixed << std::setprecision(2);
        for (size_t i = 0; i < road.path.size(); i++) {
            glm::vec2 p = toPixel(road.path[i].x, road.path[i].z);
            d << (i == 0 ? "M " : " L ") << p.x << " " << p.y;
        }

        file << "    <path d=\"" << d.str() << "\" "
             << "stroke=\"" << getRoadColor(road.type) << "\" "
             << "stroke-width=\"" << std::max(0.5f, road.width * 0.3f) << "\"/>\n";
    }
    file << "  </g>\n";

    // Destinations
    file << "  <g id=\"destinations\">\n";
    for (const auto& dest : destinations) {
        glm::vec2 c = toPixel(dest.position.x, dest.position.z);
        float r = std::max(2.0f, 9.0f - 1.5f * static_cast<float>(dest.priority));
        file << "    <circle cx=\"" << c.x << "\" cy=\"" << c.y
             << "\" r=\"" << r << "\" fill=\"" << getDestinationColor(dest.kind)
             << "\" stroke=\"#ffffff\" stroke-width=\"1\"/>\n";
    }
    file << "  </g>\n";

    file << "</svg>\n";

    SDL_Log("Wrote network SVG: %s", filename.c_str());
}

} // namespace RoadNet
