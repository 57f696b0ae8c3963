#include <doctest/doctest.h>
#include "roads/TrafficDemandModel.h"

using namespace RoadNet;

TEST_SUITE("TrafficDemandModel") {
    TEST_CASE("importance combines buildability, terrain and centrality") {
        TrafficDemandModel model(nullptr, TrafficDemandConfig());

        Destination d;
        d.position = glm::vec3(0.0f);
        d.buildability = 1.0f;
        d.terrain = TerrainClass::Plateau;

        // 1 * 4 + 4 + 1 * 3
        CHECK(model.importance(d) == doctest::Approx(11.0f));

        d.terrain = TerrainClass::Mountain;
        CHECK(model.importance(d) == doctest::Approx(7.0f));
    }

    TEST_CASE("terrain bonus ranks plateau above coast, valley and mountain") {
        CHECK(TrafficDemandModel::terrainBonus(TerrainClass::Plateau) >
              TrafficDemandModel::terrainBonus(TerrainClass::Coast));
        CHECK(TrafficDemandModel::terrainBonus(TerrainClass::Coast) >
              TrafficDemandModel::terrainBonus(TerrainClass::Valley));
        CHECK(TrafficDemandModel::terrainBonus(TerrainClass::Valley) >
              TrafficDemandModel::terrainBonus(TerrainClass::Mountain));
    }

    TEST_CASE("importance is floored at one") {
        TrafficDemandModel model(nullptr, TrafficDemandConfig());

        Destination remote;
        remote.position = glm::vec3(8192.0f, 0.0f, 8192.0f);
        remote.buildability = 0.0f;
        remote.terrain = TerrainClass::Mountain;

        CHECK(model.importance(remote) == doctest::Approx(1.0f));
    }

    TEST_CASE("demand follows the gravity law") {
        TrafficDemandModel model(nullptr, TrafficDemandConfig());

        glm::vec3 origin(0.0f);
        CHECK(model.demand(10.0f, 10.0f, origin, glm::vec3(1000.0f, 0.0f, 0.0f)) == doctest::Approx(100.0f));
        CHECK(model.demand(10.0f, 10.0f, origin, glm::vec3(2000.0f, 0.0f, 0.0f)) == doctest::Approx(35.3553f));

        // Symmetric
        glm::vec3 a(120.0f, 0.0f, -40.0f);
        glm::vec3 b(-800.0f, 0.0f, 310.0f);
        CHECK(model.demand(4.0f, 9.0f, a, b) == doctest::Approx(model.demand(9.0f, 4.0f, b, a)));
    }

    TEST_CASE("steep terrain reduces demand") {
        FunctionTerrain steep([](float, float) { return 0.0f; }, [](float, float) { return 45.0f; });
        TrafficDemandModel model(&steep, TrafficDemandConfig());

        glm::vec3 a(0.0f);
        glm::vec3 b(1000.0f, 0.0f, 0.0f);
        CHECK(model.terrainPenalty(a, b) == doctest::Approx(1.0f));
        CHECK(model.demand(10.0f, 10.0f, a, b) == doctest::Approx(100.0f / 1.3f));
    }

    TEST_CASE("no terrain means no penalty") {
        TrafficDemandModel model(nullptr, TrafficDemandConfig());
        CHECK(model.terrainPenalty(glm::vec3(0.0f), glm::vec3(500.0f, 0.0f, 0.0f)) == 0.0f);
    }

    TEST_CASE("ranking sorts by demand and caps per destination") {
        TrafficDemandModel model(nullptr, TrafficDemandConfig());

        std::vector<Corridor> corridors;
        for (size_t i = 0; i < 10; i++) {
            Corridor c;
            c.fromIdx = i;
            c.toIdx = i + 1;
            c.trafficDemand = static_cast<float>((i * 37) % 10);
            corridors.push_back(c);
        }

        auto ranked = model.rankCorridors(corridors, 2);
        REQUIRE(ranked.size() == 6);
        for (size_t i = 1; i < ranked.size(); i++) {
            CHECK(ranked[i - 1].trafficDemand >= ranked[i].trafficDemand);
        }
        CHECK(ranked.front().trafficDemand == doctest::Approx(9.0f));

        // Fewer corridors than the cap are all kept
        CHECK(model.rankCorridors(corridors, 100).size() == 10);
    }
}
