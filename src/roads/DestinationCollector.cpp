#include "DestinationCollector.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <random>

namespace RoadNet {

const char* getSettlementTypeName(SettlementType type) {
    switch (type) {
        case SettlementType::Hamlet:  return "hamlet";
        case SettlementType::Village: return "village";
        case SettlementType::Town:    return "town";
        case SettlementType::City:    return "city";
        default:                      return "unknown";
    }
}

std::optional<SettlementType> parseSettlementType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "hamlet") return SettlementType::Hamlet;
    if (lower == "village" || lower == "fishing_village" || lower == "fishingvillage") return SettlementType::Village;
    if (lower == "town") return SettlementType::Town;
    if (lower == "city") return SettlementType::City;
    return std::nullopt;
}

int estimatePopulation(int population, int buildingCount) {
    if (population > 0) return population;
    return static_cast<int>(std::lround(static_cast<double>(buildingCount) * 3.5));
}

SettlementType resolveSettlementType(const SettlementTypeSources& sources) {
    const std::optional<std::string>* explicitFields[] = {
        &sources.type,
        &sources.settlementType,
        &sources.kind
    };

    for (const auto* field : explicitFields) {
        if (!field->has_value()) continue;
        if (auto parsed = parseSettlementType(**field)) {
            return *parsed;
        }
    }

    int population = estimatePopulation(sources.population, sources.buildingCount);
    if (population >= 5000) return SettlementType::City;
    if (population >= 1000) return SettlementType::Town;
    if (population >= 150) return SettlementType::Village;
    return SettlementType::Hamlet;
}

int priorityFor(SettlementType type) {
    switch (type) {
        case SettlementType::City:    return 1;
        case SettlementType::Town:    return 2;
        case SettlementType::Village: return 3;
        case SettlementType::Hamlet:  return 4;
        default:                      return 4;
    }
}

TerrainClass resolveTerrainClass(const TerrainOracle& terrain, glm::vec2 position,
                                 const DestinationConfig& config) {
    float h = terrain.height(position.x, position.y);
    float s = terrain.slope(position.x, position.y);

    float probe = config.valleyProbeDistance;
    const glm::vec2 probes[] = {
        position + glm::vec2(probe, 0.0f), position - glm::vec2(probe, 0.0f),
        position + glm::vec2(0.0f, probe), position - glm::vec2(0.0f, probe)
    };

    float probeMean = 0.0f;
    bool waterNearby = false;
    for (const auto& p : probes) {
        float ph = terrain.height(p.x, p.y);
        probeMean += ph * 0.25f;
        if (ph < config.seaLevel) waterNearby = true;
    }

    struct Rule {
        TerrainClass terrainClass;
        std::function<bool()> matches;
    };

    const Rule rules[] = {
        {TerrainClass::Coast,    [&] { return waterNearby && h < config.seaLevel + config.coastMaxHeight; }},
        {TerrainClass::Mountain, [&] { return s >= config.mountainMinSlope; }},
        {TerrainClass::Plateau,  [&] { return h >= config.plateauMinHeight && s < config.mountainMinSlope * 0.5f; }},
        {TerrainClass::Valley,   [&] { return probeMean - h > 10.0f; }},
    };

    for (const auto& rule : rules) {
        if (rule.matches()) return rule.terrainClass;
    }
    return TerrainClass::Lowland;
}

// ============================================================================
// DestinationCollector
// ============================================================================

DestinationCollector::DestinationCollector(const TerrainOracle& t, const DestinationConfig& cfg)
    : terrain(t), config(cfg) {}

float DestinationCollector::buildability(glm::vec2 position) const {
    float s = terrain.slope(position.x, position.y);
    return std::clamp(1.0f - s / 45.0f, 0.0f, 1.0f);
}

Destination DestinationCollector::makeDestination(glm::vec2 position, DestinationKind kind, int priority,
                                                  int population, uint32_t sourceId) const {
    Destination d;
    d.position = terrain.project(position);
    d.kind = kind;
    d.priority = priority;
    d.population = population;
    d.buildability = buildability(position);
    d.terrain = resolveTerrainClass(terrain, position, config);
    d.sourceId = sourceId;
    return d;
}

Destination DestinationCollector::fromSettlement(const SettlementInput& settlement) const {
    int population = estimatePopulation(settlement.population, settlement.buildingCount);
    return makeDestination(settlement.center, DestinationKind::Settlement,
                           priorityFor(settlement.type), population, settlement.id);
}

Destination DestinationCollector::fromLandmark(const LandmarkInput& landmark) const {
    return makeDestination(landmark.position, DestinationKind::Landmark, 3,
                           config.landmarkPopulation, landmark.id);
}

std::vector<Destination> DestinationCollector::sampleCoastline() const {
    std::vector<Destination> points;
    if (config.maxCoastlinePoints == 0 || config.scanSpacing <= 0.0f) return points;

    float half = config.terrainSize * 0.5f;
    float step = config.scanSpacing;
    uint32_t nextId = 0;

    for (float z = -half + step * 0.5f; z < half; z += step) {
        for (float x = -half + step * 0.5f; x < half; x += step) {
            if (points.size() >= config.maxCoastlinePoints) return points;
            if (terrain.height(x, z) < config.seaLevel) continue;

            bool nextToWater =
                terrain.height(x + step, z) < config.seaLevel ||
                terrain.height(x - step, z) < config.seaLevel ||
                terrain.height(x, z + step) < config.seaLevel ||
                terrain.height(x, z - step) < config.seaLevel;
            if (!nextToWater) continue;

            glm::vec2 p(x, z);
            bool tooClose = std::any_of(points.begin(), points.end(), [&](const Destination& d) {
                return glm::distance(d.xz(), p) < config.coastlineMinSpacing;
            });
            if (tooClose) continue;

            points.push_back(makeDestination(p, DestinationKind::Coastline, 4,
                                             config.coastlinePopulation, nextId++));
        }
    }
    return points;
}

std::vector<Destination> DestinationCollector::sampleFarms(const std::vector<SettlementInput>& settlements) {
    std::vector<Destination> farms;
    if (config.maxFarms == 0 || config.scanSpacing <= 0.0f) return farms;

    float half = config.terrainSize * 0.5f;
    float step = config.scanSpacing;

    std::vector<glm::vec2> candidates;
    for (float z = -half + step * 0.5f; z < half; z += step) {
        for (float x = -half + step * 0.5f; x < half; x += step) {
            if (terrain.height(x, z) < config.seaLevel) continue;
            if (terrain.slope(x, z) > config.farmMaxSlope) continue;

            glm::vec2 p(x, z);
            bool nearSettlement = std::any_of(settlements.begin(), settlements.end(),
                [&](const SettlementInput& s) {
                    return glm::distance(s.center, p) < s.radius + config.farmMinSettlementDistance;
                });
            if (nearSettlement) continue;

            candidates.push_back(p);
        }
    }

    std::mt19937 rng(config.seed);
    std::shuffle(candidates.begin(), candidates.end(), rng);

    uint32_t nextId = 0;
    for (const auto& p : candidates) {
        if (farms.size() >= config.maxFarms) break;

        bool tooClose = std::any_of(farms.begin(), farms.end(), [&](const Destination& d) {
            return glm::distance(d.xz(), p) < config.farmMinSpacing;
        });
        if (tooClose) continue;

        farms.push_back(makeDestination(p, DestinationKind::Farm, 5, config.farmPopulation, nextId++));
    }
    return farms;
}

std::vector<Destination> DestinationCollector::collect(const std::vector<SettlementInput>& settlements,
                                                       const std::vector<LandmarkInput>& landmarks) {
    std::vector<Destination> destinations;

    for (const auto& settlement : settlements) {
        destinations.push_back(fromSettlement(settlement));
    }
    for (const auto& landmark : landmarks) {
        destinations.push_back(fromLandmark(landmark));
    }

    auto coast = sampleCoastline();
    auto farms = sampleFarms(settlements);
    destinations.insert(destinations.end(), coast.begin(), coast.end());
    destinations.insert(destinations.end(), farms.begin(), farms.end());

    SDL_Log("Gathered %zu destinations (%zu settlements, %zu landmarks, %zu coastline, %zu farms)",
            destinations.size(), settlements.size(), landmarks.size(), coast.size(), farms.size());

    return destinations;
}

} // namespace RoadNet
