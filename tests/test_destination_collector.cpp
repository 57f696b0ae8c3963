#include <doctest/doctest.h>
#include "roads/DestinationCollector.h"
#include "roads/CorridorClassifier.h"
#include <cmath>
#include <string>

using namespace RoadNet;

namespace {

DestinationConfig settlementsOnly() {
    DestinationConfig config;
    config.maxCoastlinePoints = 0;
    config.maxFarms = 0;
    return config;
}

Destination makeDestination(int priority, DestinationKind kind = DestinationKind::Settlement) {
    Destination d;
    d.priority = priority;
    d.kind = kind;
    return d;
}

} // namespace

TEST_SUITE("SettlementType") {
    TEST_CASE("names parse case-insensitively") {
        CHECK(parseSettlementType("town") == SettlementType::Town);
        CHECK(parseSettlementType("VILLAGE") == SettlementType::Village);
        CHECK(parseSettlementType("FishingVillage") == SettlementType::Village);
        CHECK(parseSettlementType("fishing_village") == SettlementType::Village);
        CHECK_FALSE(parseSettlementType("metropolis").has_value());

        CHECK(std::string(getSettlementTypeName(SettlementType::Hamlet)) == "hamlet");
    }

    TEST_CASE("first recognised explicit field wins") {
        SettlementTypeSources sources;
        sources.type = "town";
        sources.settlementType = "city";
        sources.population = 10;
        CHECK(resolveSettlementType(sources) == SettlementType::Town);

        // Unrecognised values fall through to the next field
        sources.type = "metropolis";
        CHECK(resolveSettlementType(sources) == SettlementType::City);

        sources.settlementType.reset();
        sources.kind = "Hamlet";
        CHECK(resolveSettlementType(sources) == SettlementType::Hamlet);
    }

    TEST_CASE("type is inferred from population without explicit fields") {
        SettlementTypeSources sources;
        CHECK(resolveSettlementType(sources) == SettlementType::Hamlet);

        sources.population = 6000;
        CHECK(resolveSettlementType(sources) == SettlementType::City);

        sources.population = 0;
        sources.buildingCount = 400;    // 1400 people
        CHECK(resolveSettlementType(sources) == SettlementType::Town);

        sources.buildingCount = 50;     // 175 people
        CHECK(resolveSettlementType(sources) == SettlementType::Village);
    }

    TEST_CASE("population estimate prefers the explicit count") {
        CHECK(estimatePopulation(250, 1000) == 250);
        CHECK(estimatePopulation(0, 10) == 35);
        CHECK(estimatePopulation(0, 0) == 0);
    }

    TEST_CASE("larger settlements get more important priorities") {
        CHECK(priorityFor(SettlementType::City) == 1);
        CHECK(priorityFor(SettlementType::Town) == 2);
        CHECK(priorityFor(SettlementType::Village) == 3);
        CHECK(priorityFor(SettlementType::Hamlet) == 4);
    }
}

TEST_SUITE("DestinationCollector") {
    TEST_CASE("terrain classification") {
        DestinationConfig config;

        FunctionTerrain lowland = FunctionTerrain::flat(10.0f);
        CHECK(resolveTerrainClass(lowland, glm::vec2(0.0f), config) == TerrainClass::Lowland);

        FunctionTerrain plateau = FunctionTerrain::flat(120.0f);
        CHECK(resolveTerrainClass(plateau, glm::vec2(0.0f), config) == TerrainClass::Plateau);

        FunctionTerrain steep([](float, float) { return 50.0f; }, [](float, float) { return 30.0f; });
        CHECK(resolveTerrainClass(steep, glm::vec2(0.0f), config) == TerrainClass::Mountain);

        FunctionTerrain shore([](float x, float) { return x < 100.0f ? -5.0f : 2.0f; },
                              [](float, float) { return 0.0f; });
        CHECK(resolveTerrainClass(shore, glm::vec2(200.0f, 0.0f), config) == TerrainClass::Coast);

        // Hollow 30m below its surroundings
        FunctionTerrain hollow([](float x, float z) { return (std::abs(x) < 50.0f && std::abs(z) < 50.0f) ? 20.0f : 50.0f; },
                               [](float, float) { return 0.0f; });
        CHECK(resolveTerrainClass(hollow, glm::vec2(0.0f), config) == TerrainClass::Valley);
    }

    TEST_CASE("settlements and landmarks become destinations") {
        FunctionTerrain terrain = FunctionTerrain::flat(15.0f);
        DestinationCollector collector(terrain, settlementsOnly());

        SettlementInput city;
        city.id = 4;
        city.type = SettlementType::City;
        city.center = glm::vec2(100.0f, -200.0f);
        city.population = 8000;

        SettlementInput hamlet;
        hamlet.id = 9;
        hamlet.type = SettlementType::Hamlet;
        hamlet.center = glm::vec2(-900.0f, 50.0f);
        hamlet.buildingCount = 8;

        LandmarkInput tower;
        tower.id = 2;
        tower.position = glm::vec2(300.0f, 300.0f);
        tower.name = "Watchtower";

        auto destinations = collector.collect({city, hamlet}, {tower});
        REQUIRE(destinations.size() == 3);

        CHECK(destinations[0].kind == DestinationKind::Settlement);
        CHECK(destinations[0].priority == 1);
        CHECK(destinations[0].population == 8000);
        CHECK(destinations[0].sourceId == 4);
        CHECK(destinations[0].position.x == doctest::Approx(100.0f));
        CHECK(destinations[0].position.y == doctest::Approx(15.0f));
        CHECK(destinations[0].position.z == doctest::Approx(-200.0f));
        CHECK(destinations[0].buildability == doctest::Approx(1.0f));

        CHECK(destinations[1].priority == 4);
        CHECK(destinations[1].population == 28);

        CHECK(destinations[2].kind == DestinationKind::Landmark);
        CHECK(destinations[2].priority == 3);
    }

    TEST_CASE("buildability falls with slope") {
        FunctionTerrain terrain([](float, float) { return 0.0f; }, [](float x, float) { return x; });
        DestinationCollector collector(terrain, settlementsOnly());

        CHECK(collector.buildability(glm::vec2(0.0f, 0.0f)) == doctest::Approx(1.0f));
        CHECK(collector.buildability(glm::vec2(22.5f, 0.0f)) == doctest::Approx(0.5f));
        CHECK(collector.buildability(glm::vec2(60.0f, 0.0f)) == doctest::Approx(0.0f));
    }

    TEST_CASE("coastline samples sit on land next to water") {
        FunctionTerrain terrain([](float x, float) { return x < 0.0f ? -5.0f : 3.0f; },
                                [](float, float) { return 0.0f; });
        DestinationConfig config;
        config.maxFarms = 0;
        DestinationCollector collector(terrain, config);

        auto coast = collector.sampleCoastline();
        REQUIRE_FALSE(coast.empty());
        CHECK(coast.size() <= config.maxCoastlinePoints);

        for (size_t i = 0; i < coast.size(); i++) {
            CHECK(coast[i].kind == DestinationKind::Coastline);
            CHECK(coast[i].priority == 4);
            CHECK(coast[i].position.x > 0.0f);
            CHECK(coast[i].position.x < 256.0f);
            CHECK(coast[i].terrain == TerrainClass::Coast);
            for (size_t j = i + 1; j < coast.size(); j++) {
                CHECK(glm::distance(coast[i].xz(), coast[j].xz()) >= config.coastlineMinSpacing);
            }
        }
    }

    TEST_CASE("farms keep away from settlements and each other") {
        FunctionTerrain terrain = FunctionTerrain::flat(10.0f);
        DestinationConfig config;
        config.maxCoastlinePoints = 0;
        config.seed = 31;

        SettlementInput village;
        village.center = glm::vec2(0.0f);
        village.radius = 150.0f;

        DestinationCollector first(terrain, config);
        auto farms = first.sampleFarms({village});
        REQUIRE_FALSE(farms.empty());
        CHECK(farms.size() <= config.maxFarms);

        for (size_t i = 0; i < farms.size(); i++) {
            CHECK(farms[i].kind == DestinationKind::Farm);
            CHECK(farms[i].priority == 5);
            CHECK(glm::length(farms[i].xz()) >= village.radius + config.farmMinSettlementDistance);
            for (size_t j = i + 1; j < farms.size(); j++) {
                CHECK(glm::distance(farms[i].xz(), farms[j].xz()) >= config.farmMinSpacing);
            }
        }

        // Same seed, same farms
        DestinationCollector second(terrain, config);
        auto again = second.sampleFarms({village});
        REQUIRE(again.size() == farms.size());
        for (size_t i = 0; i < farms.size(); i++) {
            CHECK(again[i].position == farms[i].position);
        }
    }
}

TEST_SUITE("CorridorClassifier") {
    TEST_CASE("highways join major hubs with enough population") {
        ClassificationConfig config;
        CHECK(classifyCorridor(makeDestination(1), makeDestination(2), 3000, config) == RoadClass::Highway);
        CHECK(classifyCorridor(makeDestination(1), makeDestination(2), 500, config) == RoadClass::Arterial);
    }

    TEST_CASE("one important end makes an arterial") {
        ClassificationConfig config;
        CHECK(classifyCorridor(makeDestination(1), makeDestination(5, DestinationKind::Farm), 5000, config) ==
              RoadClass::Arterial);
        CHECK(classifyCorridor(makeDestination(3), makeDestination(4), 100, config) == RoadClass::Arterial);
    }

    TEST_CASE("minor ends get settlement roads or lanes") {
        ClassificationConfig config;
        CHECK(classifyCorridor(makeDestination(4), makeDestination(4), 100, config) == RoadClass::SettlementRoad);
        CHECK(classifyCorridor(makeDestination(4), makeDestination(5, DestinationKind::Farm), 100, config) ==
              RoadClass::Lane);
        CHECK(classifyCorridor(makeDestination(4, DestinationKind::Coastline), makeDestination(4), 100, config) ==
              RoadClass::Lane);
    }

    TEST_CASE("minor destinations never get water crossings") {
        ClassificationConfig config;
        CHECK(allowsWaterCrossing(makeDestination(1), makeDestination(3), config));
        CHECK_FALSE(allowsWaterCrossing(makeDestination(1), makeDestination(4), config));
        CHECK_FALSE(allowsWaterCrossing(makeDestination(5), makeDestination(5), config));
    }
}
