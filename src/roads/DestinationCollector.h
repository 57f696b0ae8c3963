#pragma once

#include "RoadTypes.h"
#include "terrain/TerrainOracle.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace RoadNet {

enum class SettlementType : uint8_t {
    Hamlet = 0,
    Village = 1,
    Town = 2,
    City = 3
};

const char* getSettlementTypeName(SettlementType type);
std::optional<SettlementType> parseSettlementType(const std::string& name);

// Raw type fields a settlement record may carry, in priority order
struct SettlementTypeSources {
    std::optional<std::string> type;
    std::optional<std::string> settlementType;
    std::optional<std::string> kind;
    int population = 0;
    int buildingCount = 0;
};

// First recognised explicit field wins; otherwise inferred from population
SettlementType resolveSettlementType(const SettlementTypeSources& sources);

// Explicit population, else buildingCount * 3.5
int estimatePopulation(int population, int buildingCount);

// Upstream settlement as produced by the settlement generator
struct SettlementInput {
    uint32_t id = 0;
    SettlementType type = SettlementType::Village;
    glm::vec2 center{0.0f};         // World XZ
    float radius = 100.0f;
    int population = 0;
    int buildingCount = 0;
};

struct LandmarkInput {
    uint32_t id = 0;
    glm::vec2 position{0.0f};
    std::string name;
};

struct DestinationConfig {
    float terrainSize = 16384.0f;   // Map centered on the origin
    float seaLevel = 0.0f;
    float scanSpacing = 256.0f;     // Coarse grid spacing for coastline/farm sampling
    size_t maxCoastlinePoints = 12;
    float coastlineMinSpacing = 1500.0f;
    int coastlinePopulation = 40;
    size_t maxFarms = 16;
    float farmMaxSlope = 6.0f;      // Degrees
    float farmMinSettlementDistance = 400.0f;
    float farmMinSpacing = 600.0f;
    int farmPopulation = 15;
    int landmarkPopulation = 25;
    float plateauMinHeight = 80.0f;
    float mountainMinSlope = 20.0f;
    float coastMaxHeight = 6.0f;
    float valleyProbeDistance = 200.0f;
    uint32_t seed = 12345;
};

// Terrain classification from local samples, resolved by an ordered rule list
TerrainClass resolveTerrainClass(const TerrainOracle& terrain, glm::vec2 position,
                                 const DestinationConfig& config);

int priorityFor(SettlementType type);

// Gathers every destination for one generation pass
class DestinationCollector {
public:
    DestinationCollector(const TerrainOracle& terrain, const DestinationConfig& config);

    std::vector<Destination> collect(const std::vector<SettlementInput>& settlements,
                                     const std::vector<LandmarkInput>& landmarks);

    Destination fromSettlement(const SettlementInput& settlement) const;
    Destination fromLandmark(const LandmarkInput& landmark) const;

    // Land cells with a water neighbour on the scan grid, spaced apart
    std::vector<Destination> sampleCoastline() const;

    // Flat dry cells away from settlements, chosen at random
    std::vector<Destination> sampleFarms(const std::vector<SettlementInput>& settlements);

    float buildability(glm::vec2 position) const;

private:
    Destination makeDestination(glm::vec2 position, DestinationKind kind, int priority,
                                int population, uint32_t sourceId) const;

    const TerrainOracle& terrain;
    DestinationConfig config;
};

} // namespace RoadNet
