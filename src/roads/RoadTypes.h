#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

// Road classes, ordered from top tier down.
// Highway is the top tier and is never pruned.
enum class RoadClass : uint8_t {
    Highway = 0,        // 12m wide - trunk routes between major hubs
    Arterial = 1,       // 8m wide - routes reaching towns and landmarks
    SettlementRoad = 2, // 6m wide - village to village connections
    Lane = 3,           // 4m wide - farm and coast access
    Branch = 4,         // 2.5-5m wide - secondary roads grown off trunks
    Count
};

inline float getRoadWidth(RoadClass type) {
    switch (type) {
        case RoadClass::Highway:        return 12.0f;
        case RoadClass::Arterial:       return 8.0f;
        case RoadClass::SettlementRoad: return 6.0f;
        case RoadClass::Lane:           return 4.0f;
        case RoadClass::Branch:         return 3.5f;
        default:                        return 4.0f;
    }
}

inline const char* getRoadClassName(RoadClass type) {
    switch (type) {
        case RoadClass::Highway:        return "highway";
        case RoadClass::Arterial:       return "arterial";
        case RoadClass::SettlementRoad: return "settlement_road";
        case RoadClass::Lane:           return "lane";
        case RoadClass::Branch:         return "branch";
        default:                        return "unknown";
    }
}

inline std::optional<RoadClass> parseRoadClass(const std::string& name) {
    if (name == "highway") return RoadClass::Highway;
    if (name == "arterial") return RoadClass::Arterial;
    if (name == "settlement_road") return RoadClass::SettlementRoad;
    if (name == "lane") return RoadClass::Lane;
    if (name == "branch") return RoadClass::Branch;
    return std::nullopt;
}

inline bool isTopTier(RoadClass type) {
    return type == RoadClass::Highway;
}

// Trunk/arterial roads are the ones branches grow from
inline bool isPrimaryRoad(RoadClass type) {
    return type == RoadClass::Highway || type == RoadClass::Arterial;
}

enum class DestinationKind : uint8_t {
    Settlement = 0,
    Coastline = 1,
    Landmark = 2,
    Farm = 3
};

inline const char* getDestinationKindName(DestinationKind kind) {
    switch (kind) {
        case DestinationKind::Settlement: return "settlement";
        case DestinationKind::Coastline:  return "coastline";
        case DestinationKind::Landmark:   return "landmark";
        case DestinationKind::Farm:       return "farm";
        default:                          return "unknown";
    }
}

// Terrain classification used for destination importance
enum class TerrainClass : uint8_t {
    Plateau = 0,
    Coast = 1,
    Valley = 2,
    Lowland = 3,
    Mountain = 4
};

inline const char* getTerrainClassName(TerrainClass terrain) {
    switch (terrain) {
        case TerrainClass::Plateau:  return "plateau";
        case TerrainClass::Coast:    return "coast";
        case TerrainClass::Valley:   return "valley";
        case TerrainClass::Lowland:  return "lowland";
        case TerrainClass::Mountain: return "mountain";
        default:                     return "unknown";
    }
}

// A point of interest the network must service
struct Destination {
    glm::vec3 position{0.0f};
    int priority = 3;               // 1 = major hub ... 5 = minor
    int population = 0;
    DestinationKind kind = DestinationKind::Settlement;
    float buildability = 0.5f;      // [0,1], 1 = flat and dry
    TerrainClass terrain = TerrainClass::Lowland;
    uint32_t sourceId = 0;          // Settlement/landmark id, or running index for sampled points

    glm::vec2 xz() const { return glm::vec2(position.x, position.z); }
};

// Canonical key for an unordered destination pair
inline uint64_t makePairKey(size_t a, size_t b) {
    if (a > b) std::swap(a, b);
    return (static_cast<uint64_t>(a) << 32) | static_cast<uint64_t>(b);
}

// Candidate connection between two destinations
struct Corridor {
    size_t fromIdx = 0;
    size_t toIdx = 0;
    glm::vec3 from{0.0f};
    glm::vec3 to{0.0f};
    float distance = 0.0f;          // Straight-line horizontal distance
    float landDistance = 0.0f;
    float waterDistance = 0.0f;
    float economicCost = 0.0f;      // land + water * bridge multiplier
    float trafficDemand = 0.0f;
    int populationServed = 0;
    RoadClass roadClass = RoadClass::Lane;

    uint64_t pairKey() const { return makePairKey(fromIdx, toIdx); }
};

// A realized road. Path points are terrain projected.
struct RoadRecord {
    std::vector<glm::vec3> path;
    float width = 4.0f;
    RoadClass type = RoadClass::Lane;
    glm::vec3 from{0.0f};
    glm::vec3 to{0.0f};
    std::optional<float> demand;
    int depth = 0;                  // Branch depth (0 for corridor roads and first-level branches)
    uint32_t fromDestination = UINT32_MAX;
    uint32_t toDestination = UINT32_MAX;

    float getLength() const {
        float length = 0.0f;
        for (size_t i = 1; i < path.size(); i++) {
            length += glm::length(glm::vec2(path[i].x - path[i-1].x, path[i].z - path[i-1].z));
        }
        return length;
    }

    glm::vec3 startPoint() const { return path.empty() ? from : path.front(); }
    glm::vec3 endPoint() const { return path.empty() ? to : path.back(); }
};

// Horizontal distance between two terrain points
inline float horizontalDistance(const glm::vec3& a, const glm::vec3& b) {
    return glm::length(glm::vec2(b.x - a.x, b.z - a.z));
}

inline float getTotalLength(const std::vector<RoadRecord>& roads) {
    float total = 0.0f;
    for (const auto& road : roads) total += road.getLength();
    return total;
}

inline size_t countByType(const std::vector<RoadRecord>& roads, RoadClass type) {
    size_t count = 0;
    for (const auto& road : roads) {
        if (road.type == type) count++;
    }
    return count;
}

} // namespace RoadNet
